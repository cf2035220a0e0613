// File: Slicer.cpp
#include "Slicer.hpp"

#include <algorithm>
#include <limits>
#include <random>

#include "errors/errors.hpp"

namespace jigsaw
{
    std::string toString(SlicerKind kind)
    {
        return kind == SlicerKind::Uneven ? "uneven" : "even";
    }

    std::optional<SlicerKind> parseSlicerKind(const std::string &name)
    {
        if (name == "even")
            return SlicerKind::Even;
        if (name == "uneven")
            return SlicerKind::Uneven;
        return std::nullopt;
    }

    Slicer::Slicer(SlicerKind kind, std::size_t blocksize)
        : kind_(kind), blocksize_(blocksize)
    {
        if (blocksize_ == 0)
        {
            throw InvalidParameter("blocksize", "must be at least 1");
        }
        if (kind_ == SlicerKind::Uneven && blocksize_ > std::numeric_limits<std::size_t>::max() / 2)
        {
            throw InvalidParameter("blocksize", "is too large for the uneven slicer");
        }
    }

    std::vector<Fragment> Slicer::slice(const Bytes &stream, Rng &rng) const
    {
        std::vector<Fragment> fragments;
        if (kind_ == SlicerKind::Even)
        {
            fragments.reserve((stream.size() + blocksize_ - 1) / blocksize_);
        }

        std::size_t offset = 0;
        while (offset < stream.size())
        {
            std::size_t remaining = stream.size() - offset;
            std::size_t length = nextLength(remaining, rng);

            Fragment fragment;
            fragment.logical_index = fragments.size();
            fragment.offset = offset;
            fragment.length = length;
            fragment.bytes.assign(stream.begin() + offset, stream.begin() + offset + length);
            fragments.push_back(std::move(fragment));

            offset += length;
        }
        return fragments;
    }

    std::size_t Slicer::nextLength(std::size_t remaining, Rng &rng) const
    {
        if (kind_ == SlicerKind::Even)
        {
            return std::min(blocksize_, remaining);
        }

        // Lengths are drawn from [1, 2 * blocksize); the last draw is cut to what is left.
        std::uniform_int_distribution<std::size_t> dist(1, std::max<std::size_t>(1, 2 * blocksize_ - 1));
        return std::min(dist(rng), remaining);
    }

    std::vector<Fragment> slice(const Bytes &stream, SlicerKind kind, std::size_t blocksize, Rng &rng)
    {
        return Slicer(kind, blocksize).slice(stream, rng);
    }
}
