#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>

#include "Assembler/Assembler.hpp"
#include "common/types.hpp"

namespace jigsaw::fsUtils
{
    // Whole-file binary I/O. Throw std::runtime_error on failure.
    Bytes readBinaryFile(const std::filesystem::path &path);
    void writeBinaryFile(const std::filesystem::path &path, const Bytes &content);
    std::string readTextFile(const std::filesystem::path &path);
    void writeTextFile(const std::filesystem::path &path, const std::string &content);

    std::optional<Bytes> tryReadBinaryFile(const std::filesystem::path &path);

    bool ensureDirectoryExists(const std::filesystem::path &dir);

    // Names of the regular files directly inside `dir` (empty if it does not exist).
    std::set<std::string> listFileNames(const std::filesystem::path &dir);

    // Lookup that reads fragments out of `dir`. Safe to call from several threads.
    FragmentLookup directoryLookup(const std::filesystem::path &dir);
}
