#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "Slicer/Slicer.hpp"

namespace jigsaw
{
    inline constexpr const char *kKeyFileFormat = "jigsaw-keyfile";
    inline constexpr int kKeyFileVersion = 1;

    // One record per fragment
    struct ManifestEntry
    {
        std::size_t logical_index = 0;
        std::string name;   // exactly filenamelength characters
        std::string digest; // exactly hashlength hex characters
        std::uint64_t size = 0;

        bool operator==(const ManifestEntry &) const = default;
    };

    // Key file contents; everything needed to put the fragments back together.
    struct Manifest
    {
        int version = kKeyFileVersion;
        SlicerKind slicer_kind = SlicerKind::Even;
        std::uint64_t blocksize = 0;
        std::size_t filenamelength = 0;
        std::size_t hashlength = 0;
        std::string original_filename;
        std::uint64_t original_size = 0;
        std::map<std::string, std::string> checksums; // whole-file, by algorithm
        std::vector<ManifestEntry> entries;           // ascending logical_index

        bool operator==(const Manifest &) const = default;
    };

    inline void to_json(nlohmann::json &j, const ManifestEntry &entry)
    {
        j = nlohmann::json{
            {"index", entry.logical_index},
            {"name", entry.name},
            {"digest", entry.digest},
            {"size", entry.size}};
    }

    inline void to_json(nlohmann::json &j, const Manifest &manifest)
    {
        j = nlohmann::json{
            {"format", kKeyFileFormat},
            {"version", manifest.version},
            {"slicer", toString(manifest.slicer_kind)},
            {"blocksize", manifest.blocksize},
            {"filenamelength", manifest.filenamelength},
            {"hashlength", manifest.hashlength},
            {"original_filename", manifest.original_filename},
            {"original_size", manifest.original_size},
            {"checksums", manifest.checksums},
            {"entries", manifest.entries}};
    }

    // Key file (de)serialization.
    // Policy: versions outside supportedVersions() are refused with
    // UnsupportedVersion; unknown keys inside a known version are ignored.
    namespace ManifestCodec
    {
        const std::vector<int> &supportedVersions();
        bool isSupportedVersion(std::int64_t version);

        std::string encode(const Manifest &manifest);
        Manifest decode(const std::string &text);
    }
}
