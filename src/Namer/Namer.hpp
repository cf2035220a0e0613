#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "Slicer/Slicer.hpp"

namespace jigsaw
{
    // Filesystem-safe characters fragment names are drawn from.
    inline constexpr std::string_view kNameAlphabet = "123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabdeghqrt";

    inline constexpr std::size_t kMaxNameAttempts = 64;
    inline constexpr std::size_t kMaxFilenameLength = 255;

    // Names already handed out during one encode run. Shared between workers.
    // Names are compared case-insensitively so that fragments never clash on
    // case-insensitive filesystems.
    class NameRegistry
    {
    public:
        NameRegistry() = default;

        // Reserved names are treated as taken (e.g. files already in the output directory).
        template <typename Range>
        explicit NameRegistry(const Range &reserved)
        {
            for (const auto &name : reserved)
            {
                names_.insert(foldCase(name));
            }
        }

        NameRegistry(const NameRegistry &) = delete;
        NameRegistry &operator=(const NameRegistry &) = delete;

        // Atomically check-and-insert. Returns false if the name is already taken.
        bool claim(const std::string &name);

        bool contains(const std::string &name) const;
        std::size_t size() const;

    private:
        static std::string foldCase(const std::string &name);

        mutable std::mutex mutex_;
        std::unordered_set<std::string> names_;
    };

    // Throws NameSpaceExhausted when `filename_length` characters cannot name
    // `fragments` more files next to `reserved` existing ones.
    void checkNameSpace(std::size_t fragments, std::size_t reserved, std::size_t filename_length);

    // Derive and claim a name for `fragment`. Deterministic in (content, index)
    // unless a collision forces a retry.
    std::string generateName(const Fragment &fragment, NameRegistry &used_names, std::size_t filename_length);
}
