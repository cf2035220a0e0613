#pragma once

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "Assembler/Assembler.hpp"
#include "Manifest/Manifest.hpp"
#include "Random/Random.hpp"
#include "Slicer/Slicer.hpp"
#include "common/types.hpp"

namespace jigsaw
{
    struct EncodeOptions
    {
        SlicerKind slicer = SlicerKind::Even;
        std::size_t blocksize = 32768;
        std::size_t filenamelength = 30;
        std::size_t hashlength = 16;
        int version = kKeyFileVersion;
        std::string original_filename;
        std::size_t threads = 1;
        std::set<std::string> reserved_names; // never handed out as fragment names
    };

    // A fragment ready to be stored under `name`.
    struct StoredFragment
    {
        std::string name;
        Bytes bytes;
    };

    struct EncodeResult
    {
        Manifest manifest;
        std::vector<StoredFragment> fragments; // storage order, not logical order
    };

    struct ChecksumComparison
    {
        std::string algorithm;
        std::string expected;
        std::string actual;

        bool matches() const { return expected == actual; }
    };

    struct DecodeReport
    {
        std::size_t fragments = 0;
        std::uint64_t expected_bytes = 0;
        std::uint64_t actual_bytes = 0;
        std::vector<ChecksumComparison> checksums;

        bool ok() const;
    };

    // Throws InvalidParameter / UnsupportedVersion for options encode() cannot honour.
    void validate(const EncodeOptions &options);

    // Slice, digest, name and shuffle `source`. Randomness is drawn from `rng`
    // on the calling thread only (slicing first, then shuffling).
    EncodeResult encode(const Bytes &source, const EncodeOptions &options, Rng &rng);

    // Parse the key file and rebuild the original stream from fragments provided by `lookup`.
    Bytes decode(const std::string &manifest_text, const FragmentLookup &lookup, std::size_t threads = 1);
    Bytes decode(const Manifest &manifest, const FragmentLookup &lookup, std::size_t threads = 1);

    // Recompute the whole-file checksums recorded in the key file against `output`.
    DecodeReport compareChecksums(const Manifest &manifest, const Bytes &output);
}
