#include "Manifest.hpp"

#include <algorithm>

#include "errors/errors.hpp"

using json = nlohmann::json;

namespace jigsaw::ManifestCodec
{
    namespace
    {
        const json &requireField(const json &j, const std::string &key, const std::string &where)
        {
            auto it = j.find(key);
            if (it == j.end())
            {
                throw MalformedManifest("missing field '" + key + "'" + where);
            }
            return *it;
        }

        std::uint64_t getUnsigned(const json &j, const std::string &key, const std::string &where = "")
        {
            const json &value = requireField(j, key, where);
            if (!value.is_number_unsigned())
            {
                throw MalformedManifest("field '" + key + "'" + where + " must be a non-negative integer");
            }
            return value.get<std::uint64_t>();
        }

        std::string getString(const json &j, const std::string &key, const std::string &where = "")
        {
            const json &value = requireField(j, key, where);
            if (!value.is_string())
            {
                throw MalformedManifest("field '" + key + "'" + where + " must be a string");
            }
            return value.get<std::string>();
        }

        std::uint64_t getPositive(const json &j, const std::string &key)
        {
            std::uint64_t value = getUnsigned(j, key);
            if (value == 0)
            {
                throw MalformedManifest("field '" + key + "' must be at least 1");
            }
            return value;
        }

        ManifestEntry decodeEntry(const json &j, std::size_t position, const Manifest &manifest)
        {
            const std::string where = " in entry " + std::to_string(position);
            if (!j.is_object())
            {
                throw MalformedManifest("entry " + std::to_string(position) + " is not an object");
            }

            ManifestEntry entry;
            entry.logical_index = getUnsigned(j, "index", where);
            entry.name = getString(j, "name", where);
            entry.digest = getString(j, "digest", where);
            entry.size = getUnsigned(j, "size", where);

            if (entry.name.size() != manifest.filenamelength)
            {
                throw MalformedManifest("name '" + entry.name + "'" + where + " is not " +
                                        std::to_string(manifest.filenamelength) + " characters long");
            }
            if (entry.digest.size() != manifest.hashlength)
            {
                throw MalformedManifest("digest '" + entry.digest + "'" + where + " is not " +
                                        std::to_string(manifest.hashlength) + " characters long");
            }
            return entry;
        }

        // Entries may be listed in any order but must cover 0..N-1 exactly once.
        void sortAndCheckIndices(std::vector<ManifestEntry> &entries)
        {
            std::sort(entries.begin(), entries.end(),
                      [](const ManifestEntry &a, const ManifestEntry &b)
                      { return a.logical_index < b.logical_index; });

            for (std::size_t i = 0; i < entries.size(); ++i)
            {
                if (entries[i].logical_index == i)
                    continue;
                if (i > 0 && entries[i].logical_index == entries[i - 1].logical_index)
                {
                    throw MalformedManifest("duplicate entry index " + std::to_string(entries[i].logical_index));
                }
                throw MalformedManifest("entry indices are not contiguous: missing index " + std::to_string(i));
            }
        }

        Manifest decodeV1(const json &j)
        {
            Manifest manifest;
            manifest.version = 1;

            std::string slicer = getString(j, "slicer");
            auto kind = parseSlicerKind(slicer);
            if (!kind)
            {
                throw MalformedManifest("unknown slicer '" + slicer + "'");
            }
            manifest.slicer_kind = *kind;
            manifest.blocksize = getPositive(j, "blocksize");
            manifest.filenamelength = getPositive(j, "filenamelength");
            manifest.hashlength = getPositive(j, "hashlength");
            manifest.original_filename = getString(j, "original_filename");
            manifest.original_size = getUnsigned(j, "original_size");

            if (auto it = j.find("checksums"); it != j.end())
            {
                if (!it->is_object())
                {
                    throw MalformedManifest("field 'checksums' must be an object");
                }
                for (const auto &[algorithm, value] : it->items())
                {
                    if (!value.is_string())
                    {
                        throw MalformedManifest("checksum '" + algorithm + "' must be a string");
                    }
                    manifest.checksums[algorithm] = value.get<std::string>();
                }
            }

            const json &entries = requireField(j, "entries", "");
            if (!entries.is_array())
            {
                throw MalformedManifest("field 'entries' must be an array");
            }
            manifest.entries.reserve(entries.size());
            for (std::size_t i = 0; i < entries.size(); ++i)
            {
                manifest.entries.push_back(decodeEntry(entries[i], i, manifest));
            }
            sortAndCheckIndices(manifest.entries);
            return manifest;
        }
    }

    const std::vector<int> &supportedVersions()
    {
        static const std::vector<int> versions = {1};
        return versions;
    }

    bool isSupportedVersion(std::int64_t version)
    {
        const auto &versions = supportedVersions();
        return std::find(versions.begin(), versions.end(), version) != versions.end();
    }

    std::string encode(const Manifest &manifest)
    {
        if (!isSupportedVersion(manifest.version))
        {
            throw UnsupportedVersion(manifest.version);
        }
        json j = manifest;
        // File names are arbitrary bytes; invalid UTF-8 is written as U+FFFD.
        return j.dump(4, ' ', false, json::error_handler_t::replace) + "\n";
    }

    Manifest decode(const std::string &text)
    {
        json j;
        try
        {
            j = json::parse(text);
        }
        catch (const json::parse_error &e)
        {
            throw MalformedManifest(std::string("key file is not valid JSON: ") + e.what());
        }

        if (!j.is_object())
        {
            throw MalformedManifest("key file is not a JSON object");
        }
        if (auto it = j.find("format"); it != j.end() && (!it->is_string() || it->get<std::string>() != kKeyFileFormat))
        {
            throw MalformedManifest("not a jigsaw key file");
        }

        const json &version = requireField(j, "version", "");
        if (!version.is_number_integer())
        {
            throw MalformedManifest("field 'version' must be an integer");
        }

        std::int64_t v = version.get<std::int64_t>();
        switch (v)
        {
        case 1:
            return decodeV1(j);
        default:
            throw UnsupportedVersion(v);
        }
    }
}
