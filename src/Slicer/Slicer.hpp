// File: Slicer.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "common/types.hpp"
#include "Random/Random.hpp"

namespace jigsaw
{
    enum class SlicerKind
    {
        Even,
        Uneven
    };

    std::string toString(SlicerKind kind);
    std::optional<SlicerKind> parseSlicerKind(const std::string &name);

    // One contiguous slice of the source stream.
    struct Fragment
    {
        std::size_t logical_index = 0;
        std::size_t offset = 0;
        std::size_t length = 0;
        Bytes bytes;
    };

    // Splits a byte stream into ordered, contiguous, non-overlapping fragments
    class Slicer
    {
    public:
        Slicer(SlicerKind kind, std::size_t blocksize);

        // `rng` is only drawn from by the uneven slicer.
        std::vector<Fragment> slice(const Bytes &stream, Rng &rng) const;

        SlicerKind kind() const { return kind_; }
        std::size_t blocksize() const { return blocksize_; }

    private:
        std::size_t nextLength(std::size_t remaining, Rng &rng) const;

        SlicerKind kind_;
        std::size_t blocksize_;
    };

    std::vector<Fragment> slice(const Bytes &stream, SlicerKind kind, std::size_t blocksize, Rng &rng);
}
