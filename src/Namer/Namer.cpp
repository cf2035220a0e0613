#include "Namer.hpp"

#include <cctype>
#include <cmath>
#include <utility>

#include "Digest/Digest.hpp"
#include "errors/errors.hpp"

namespace jigsaw
{
    std::string NameRegistry::foldCase(const std::string &name)
    {
        std::string folded = name;
        for (auto &c : folded)
        {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return folded;
    }

    bool NameRegistry::claim(const std::string &name)
    {
        std::string key = foldCase(name);
        std::lock_guard<std::mutex> lock(mutex_);
        return names_.insert(std::move(key)).second;
    }

    bool NameRegistry::contains(const std::string &name) const
    {
        std::string key = foldCase(name);
        std::lock_guard<std::mutex> lock(mutex_);
        return names_.count(key) > 0;
    }

    std::size_t NameRegistry::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return names_.size();
    }

    namespace
    {
        void validateLength(std::size_t filename_length)
        {
            if (filename_length == 0)
            {
                throw InvalidParameter("filenamelength", "must be at least 1");
            }
            if (filename_length > kMaxFilenameLength)
            {
                throw InvalidParameter("filenamelength", "must not exceed " + std::to_string(kMaxFilenameLength));
            }
        }

        void appendBigEndian(Bytes &out, std::uint64_t value, int width)
        {
            for (int shift = (width - 1) * 8; shift >= 0; shift -= 8)
            {
                out.push_back(static_cast<std::uint8_t>(value >> shift));
            }
        }

        std::string candidate(const Bytes &content_hash, std::size_t index, std::uint32_t attempt, std::size_t filename_length)
        {
            Bytes seed = content_hash;
            appendBigEndian(seed, index, 8);
            appendBigEndian(seed, attempt, 4);

            Bytes stream = digest::expand(seed.data(), seed.size(), filename_length);
            std::string name;
            name.reserve(filename_length);
            for (std::uint8_t b : stream)
            {
                name.push_back(kNameAlphabet[b % kNameAlphabet.size()]);
            }
            return name;
        }
    }

    void checkNameSpace(std::size_t fragments, std::size_t reserved, std::size_t filename_length)
    {
        validateLength(filename_length);

        // log2(alphabet^length); past 2^63 names the count never fits in memory anyway.
        double capacity_log2 = static_cast<double>(filename_length) * std::log2(static_cast<double>(kNameAlphabet.size()));
        if (capacity_log2 >= 63.0)
            return;

        std::size_t capacity = 1;
        for (std::size_t i = 0; i < filename_length; ++i)
        {
            capacity *= kNameAlphabet.size();
        }
        if (capacity < fragments + reserved)
        {
            throw NameSpaceExhausted(filename_length, fragments,
                                     "only " + std::to_string(capacity) + " names available, " +
                                         std::to_string(reserved) + " already taken");
        }
    }

    std::string generateName(const Fragment &fragment, NameRegistry &used_names, std::size_t filename_length)
    {
        validateLength(filename_length);

        Bytes content_hash = digest::expand(fragment.bytes.data(), fragment.bytes.size(), 32);
        for (std::uint32_t attempt = 0; attempt < kMaxNameAttempts; ++attempt)
        {
            std::string name = candidate(content_hash, fragment.logical_index, attempt, filename_length);
            if (used_names.claim(name))
            {
                return name;
            }
        }

        throw NameSpaceExhausted(filename_length, fragment.logical_index + 1,
                                 "no free name for fragment #" + std::to_string(fragment.logical_index) +
                                     " after " + std::to_string(kMaxNameAttempts) + " attempts");
    }
}
