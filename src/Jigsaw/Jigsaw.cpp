#include "Jigsaw.hpp"

#include <exception>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include "Digest/Digest.hpp"
#include "Namer/Namer.hpp"
#include "Shuffler/Shuffler.hpp"
#include "errors/errors.hpp"
#include "logger/Mylogger.hpp"

namespace jigsaw
{
    namespace
    {
        struct Labelled
        {
            std::string name;
            std::string digest;
        };

        Labelled label(const Fragment &fragment, const EncodeOptions &options, NameRegistry &registry)
        {
            Labelled out;
            out.digest = digest::digest(fragment.bytes, options.hashlength);
            out.name = generateName(fragment, registry, options.filenamelength);
            return out;
        }

        void logFragment(const Fragment &fragment, const Labelled &labelled)
        {
            MyLogger::debug("Fragment #" + std::to_string(fragment.logical_index) + " offset " +
                            std::to_string(fragment.offset) + " size " + std::to_string(fragment.length) +
                            " -> " + labelled.name + " " + labelled.digest);
            if ((fragment.logical_index + 1) % 1000 == 0)
            {
                MyLogger::info(std::to_string(fragment.logical_index + 1) + " fragments processed");
            }
        }

        std::vector<Labelled> labelAll(const std::vector<Fragment> &fragments, const EncodeOptions &options, NameRegistry &registry)
        {
            std::vector<Labelled> labels(fragments.size());
            if (options.threads <= 1 || fragments.size() < 2)
            {
                for (std::size_t i = 0; i < fragments.size(); ++i)
                {
                    labels[i] = label(fragments[i], options, registry);
                    logFragment(fragments[i], labels[i]);
                }
                return labels;
            }

            std::vector<std::exception_ptr> failures(fragments.size());
            boost::asio::thread_pool pool(options.threads);
            for (std::size_t i = 0; i < fragments.size(); ++i)
            {
                boost::asio::post(pool, [&, i]()
                                  {
                    try
                    {
                        labels[i] = label(fragments[i], options, registry);
                    }
                    catch (...)
                    {
                        failures[i] = std::current_exception();
                    } });
            }
            pool.join();

            for (std::size_t i = 0; i < fragments.size(); ++i)
            {
                if (failures[i])
                    std::rethrow_exception(failures[i]);
                logFragment(fragments[i], labels[i]);
            }
            return labels;
        }
    }

    bool DecodeReport::ok() const
    {
        if (expected_bytes != actual_bytes)
            return false;
        for (const auto &c : checksums)
        {
            if (!c.matches())
                return false;
        }
        return true;
    }

    void validate(const EncodeOptions &options)
    {
        if (!ManifestCodec::isSupportedVersion(options.version))
        {
            throw UnsupportedVersion(options.version);
        }
        if (options.blocksize == 0)
        {
            throw InvalidParameter("blocksize", "must be at least 1");
        }
        if (options.hashlength == 0)
        {
            throw InvalidParameter("hashlength", "must be at least 1");
        }
        if (options.filenamelength == 0 || options.filenamelength > kMaxFilenameLength)
        {
            throw InvalidParameter("filenamelength", "must be between 1 and " + std::to_string(kMaxFilenameLength));
        }
    }

    EncodeResult encode(const Bytes &source, const EncodeOptions &options, Rng &rng)
    {
        validate(options);

        MyLogger::info("Encoding " + std::to_string(source.size()) + " bytes using " + toString(options.slicer) +
                       " slicer, block size " + std::to_string(options.blocksize));

        std::vector<Fragment> fragments = slice(source, options.slicer, options.blocksize, rng);
        checkNameSpace(fragments.size(), options.reserved_names.size(), options.filenamelength);

        NameRegistry registry(options.reserved_names);
        std::vector<Labelled> labels = labelAll(fragments, options, registry);

        EncodeResult result;
        Manifest &manifest = result.manifest;
        manifest.version = options.version;
        manifest.slicer_kind = options.slicer;
        manifest.blocksize = options.blocksize;
        manifest.filenamelength = options.filenamelength;
        manifest.hashlength = options.hashlength;
        manifest.original_filename = options.original_filename;
        manifest.original_size = source.size();
        manifest.checksums = digest::checksums(source);

        manifest.entries.reserve(fragments.size());
        for (std::size_t i = 0; i < fragments.size(); ++i)
        {
            ManifestEntry entry;
            entry.logical_index = fragments[i].logical_index;
            entry.name = labels[i].name;
            entry.digest = labels[i].digest;
            entry.size = fragments[i].length;
            manifest.entries.push_back(std::move(entry));
        }

        std::vector<std::size_t> order = shuffle(fragments.size(), rng);
        result.fragments.reserve(fragments.size());
        for (std::size_t i : order)
        {
            result.fragments.push_back(StoredFragment{labels[i].name, std::move(fragments[i].bytes)});
        }

        MyLogger::info(std::to_string(fragments.size()) + " fragments produced");
        return result;
    }

    Bytes decode(const Manifest &manifest, const FragmentLookup &lookup, std::size_t threads)
    {
        MyLogger::info("Assembling " + std::to_string(manifest.entries.size()) + " fragments of " +
                       manifest.original_filename + " (" + std::to_string(manifest.original_size) + " bytes)");
        return Assembler(threads).assemble(manifest, lookup);
    }

    Bytes decode(const std::string &manifest_text, const FragmentLookup &lookup, std::size_t threads)
    {
        return decode(ManifestCodec::decode(manifest_text), lookup, threads);
    }

    DecodeReport compareChecksums(const Manifest &manifest, const Bytes &output)
    {
        DecodeReport report;
        report.fragments = manifest.entries.size();
        report.expected_bytes = manifest.original_size;
        report.actual_bytes = output.size();

        if (manifest.checksums.empty())
            return report;

        std::map<std::string, std::string> actual = digest::checksums(output);
        for (const auto &[algorithm, expected] : manifest.checksums)
        {
            auto it = actual.find(algorithm);
            // Algorithms this build does not know are reported with an empty actual value.
            report.checksums.push_back({algorithm, expected, it == actual.end() ? std::string() : it->second});
        }
        return report;
    }
}
