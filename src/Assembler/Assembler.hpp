#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

#include "Manifest/Manifest.hpp"
#include "common/types.hpp"

namespace jigsaw
{
    // Resolves a fragment name to its content; std::nullopt when it does not exist.
    // Called concurrently when the Assembler runs with more than one thread.
    using FragmentLookup = std::function<std::optional<Bytes>(const std::string &name)>;

    // Throws SizeMismatch or IntegrityMismatch if `bytes` is not the fragment `entry` describes.
    void verifyFragment(const ManifestEntry &entry, const Bytes &bytes, std::size_t hashlength);

    // Verifies every fragment named by a manifest and concatenates them in logical order.
    class Assembler
    {
    public:
        explicit Assembler(std::size_t threads = 1);

        Bytes assemble(const Manifest &manifest, const FragmentLookup &lookup) const;

    private:
        Bytes fetch(const ManifestEntry &entry, std::size_t hashlength, const FragmentLookup &lookup) const;

        std::size_t threads_;
    };
}
