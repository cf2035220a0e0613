#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <random>
#include <string>

#include "Assembler/Assembler.hpp"
#include "common/types.hpp"

namespace jigsaw::test
{
    inline Bytes makeBytes(std::size_t size, std::uint32_t seed = 7)
    {
        std::mt19937 gen(seed);
        Bytes out(size);
        for (auto &b : out)
        {
            b = static_cast<std::uint8_t>(gen() & 0xff);
        }
        return out;
    }

    inline Bytes toBytes(const std::string &s)
    {
        return Bytes(s.begin(), s.end());
    }

    // Fragment store kept in memory, standing in for a directory.
    inline FragmentLookup mapLookup(const std::map<std::string, Bytes> &store)
    {
        return [&store](const std::string &name) -> std::optional<Bytes>
        {
            auto it = store.find(name);
            if (it == store.end())
                return std::nullopt;
            return it->second;
        };
    }

    class TempDir
    {
    public:
        TempDir()
        {
            std::random_device rd;
            path_ = std::filesystem::temp_directory_path() /
                    ("jigsaw-test-" + std::to_string(rd()) + "-" + std::to_string(rd()));
            std::filesystem::create_directories(path_);
        }

        ~TempDir()
        {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }

        TempDir(const TempDir &) = delete;
        TempDir &operator=(const TempDir &) = delete;

        const std::filesystem::path &path() const { return path_; }

    private:
        std::filesystem::path path_;
    };
}
