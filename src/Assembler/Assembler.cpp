#include "Assembler.hpp"

#include <exception>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "Digest/Digest.hpp"
#include "errors/errors.hpp"
#include "logger/Mylogger.hpp"

namespace jigsaw
{
    void verifyFragment(const ManifestEntry &entry, const Bytes &bytes, std::size_t hashlength)
    {
        if (bytes.size() != entry.size)
        {
            throw SizeMismatch(entry.logical_index, entry.name, entry.size, bytes.size());
        }
        std::string actual = digest::digest(bytes, hashlength);
        if (actual != entry.digest)
        {
            throw IntegrityMismatch(entry.logical_index, entry.name, entry.digest, actual);
        }
    }

    Assembler::Assembler(std::size_t threads)
        : threads_(threads == 0 ? 1 : threads)
    {
    }

    Bytes Assembler::fetch(const ManifestEntry &entry, std::size_t hashlength, const FragmentLookup &lookup) const
    {
        std::optional<Bytes> bytes = lookup(entry.name);
        if (!bytes)
        {
            throw MissingFragment(entry.logical_index, entry.name);
        }
        verifyFragment(entry, *bytes, hashlength);
        MyLogger::debug("Verified fragment #" + std::to_string(entry.logical_index) + " " + entry.name +
                        " (" + std::to_string(bytes->size()) + " bytes, " + entry.digest + ")");
        return std::move(*bytes);
    }

    Bytes Assembler::assemble(const Manifest &manifest, const FragmentLookup &lookup) const
    {
        const auto &entries = manifest.entries;
        std::vector<Bytes> pieces(entries.size());

        if (threads_ == 1 || entries.size() < 2)
        {
            for (std::size_t i = 0; i < entries.size(); ++i)
            {
                pieces[i] = fetch(entries[i], manifest.hashlength, lookup);
            }
        }
        else
        {
            std::vector<std::exception_ptr> failures(entries.size());
            boost::asio::thread_pool pool(threads_);
            for (std::size_t i = 0; i < entries.size(); ++i)
            {
                boost::asio::post(pool, [&, i]()
                                  {
                    try
                    {
                        pieces[i] = fetch(entries[i], manifest.hashlength, lookup);
                    }
                    catch (...)
                    {
                        failures[i] = std::current_exception();
                    } });
            }
            pool.join();

            // Report the first broken fragment in logical order, as the sequential path would.
            for (const auto &failure : failures)
            {
                if (failure)
                    std::rethrow_exception(failure);
            }
        }

        std::size_t total = 0;
        for (const auto &piece : pieces)
        {
            total += piece.size();
        }

        Bytes output;
        output.reserve(total);
        for (std::size_t i = 0; i < pieces.size(); ++i)
        {
            output.insert(output.end(), pieces[i].begin(), pieces[i].end());
            if ((i + 1) % 1000 == 0)
            {
                MyLogger::info(std::to_string(i + 1) + " fragments assembled");
            }
        }

        if (output.size() != manifest.original_size)
        {
            throw LengthMismatch(manifest.original_size, output.size());
        }
        return output;
    }
}
