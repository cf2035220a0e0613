#include "Digest.hpp"

#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <openssl/evp.h>

#include "errors/errors.hpp"

namespace jigsaw::digest
{
    namespace
    {
        using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

        MdCtxPtr newContext()
        {
            MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
            if (!ctx)
            {
                throw std::runtime_error("Failed to create EVP_MD_CTX");
            }
            return ctx;
        }

        void appendFinal(EVP_MD_CTX *ctx, Bytes &out)
        {
            unsigned char md[EVP_MAX_MD_SIZE];
            unsigned int md_len = 0;
            if (EVP_DigestFinal_ex(ctx, md, &md_len) != 1)
            {
                throw std::runtime_error("Failed to finalize digest");
            }
            out.insert(out.end(), md, md + md_len);
        }

        std::string hexDigestOf(const EVP_MD *md, const Bytes &data)
        {
            MdCtxPtr ctx = newContext();
            if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
                EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1)
            {
                throw std::runtime_error("Failed to compute digest");
            }
            Bytes out;
            appendFinal(ctx.get(), out);
            return toHex(out.data(), out.size());
        }
    }

    Bytes expand(const std::uint8_t *data, std::size_t size, std::size_t nbytes)
    {
        Bytes out;
        out.reserve(nbytes + EVP_MAX_MD_SIZE);

        // `base` holds SHA-256 state after absorbing `data`; every block is a copy of it.
        MdCtxPtr base = newContext();
        if (EVP_DigestInit_ex(base.get(), EVP_sha256(), nullptr) != 1 ||
            EVP_DigestUpdate(base.get(), data, size) != 1)
        {
            throw std::runtime_error("Failed to compute SHA-256 hash");
        }

        MdCtxPtr block = newContext();
        for (std::uint32_t counter = 0; out.size() < nbytes; ++counter)
        {
            if (EVP_MD_CTX_copy_ex(block.get(), base.get()) != 1)
            {
                throw std::runtime_error("Failed to copy SHA-256 context");
            }
            if (counter > 0)
            {
                const unsigned char be[4] = {
                    static_cast<unsigned char>(counter >> 24),
                    static_cast<unsigned char>(counter >> 16),
                    static_cast<unsigned char>(counter >> 8),
                    static_cast<unsigned char>(counter)};
                if (EVP_DigestUpdate(block.get(), be, sizeof(be)) != 1)
                {
                    throw std::runtime_error("Failed to update SHA-256 hash");
                }
            }
            appendFinal(block.get(), out);
        }

        out.resize(nbytes);
        return out;
    }

    std::string digest(const std::uint8_t *data, std::size_t size, std::size_t length)
    {
        if (length == 0)
        {
            throw InvalidParameter("hashlength", "must be at least 1");
        }
        Bytes stream = expand(data, size, (length + 1) / 2);
        std::string hex = toHex(stream.data(), stream.size());
        hex.resize(length);
        return hex;
    }

    std::string digest(const Bytes &data, std::size_t length)
    {
        return digest(data.data(), data.size(), length);
    }

    std::string toHex(const std::uint8_t *data, std::size_t size)
    {
        std::stringstream ss;
        for (std::size_t i = 0; i < size; i++)
        {
            ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
        }
        return ss.str();
    }

    std::map<std::string, std::string> checksums(const Bytes &data)
    {
        static const std::vector<std::pair<std::string, const EVP_MD *(*)()>> algorithms = {
            {"md5", &EVP_md5},
            {"sha1", &EVP_sha1},
            {"sha224", &EVP_sha224},
            {"sha256", &EVP_sha256},
            {"sha384", &EVP_sha384},
            {"sha512", &EVP_sha512},
        };

        std::map<std::string, std::string> result;
        for (const auto &[name, md] : algorithms)
        {
            result[name] = hexDigestOf(md(), data);
        }
        return result;
    }
}
