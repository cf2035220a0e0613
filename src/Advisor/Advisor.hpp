#pragma once

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace jigsaw::advisor
{
    // log10 of the AES-256 printable key space, 94^32.
    inline const double kAes256Log10 = 32.0 * std::log10(94.0);

    struct Advice
    {
        std::uint64_t file_size = 0;
        std::size_t fragments = 0;        // fewest fragments whose orderings reach the target
        std::uint64_t blocksize = 0;      // 0 when the file is smaller than `fragments` bytes
        double permutations_log10 = 0.0;  // log10(fragments!)
    };

    // log10(n!)
    double permutationsLog10(std::size_t n);

    // Smallest n with log10(n!) >= target_log10.
    std::size_t minimumFragments(double target_log10);

    Advice sufficientBlockSize(std::uint64_t file_size, double target_log10 = kAes256Log10);
}
