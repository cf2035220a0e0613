#include "Advisor.hpp"

#include "errors/errors.hpp"

namespace jigsaw::advisor
{
    double permutationsLog10(std::size_t n)
    {
        return std::lgamma(static_cast<double>(n) + 1.0) / std::log(10.0);
    }

    std::size_t minimumFragments(double target_log10)
    {
        if (!(target_log10 >= 0.0) || target_log10 > 1e7)
        {
            throw InvalidParameter("target", "must be a permutation count between 1 and 10^(10^7)");
        }

        std::size_t n = 1;
        while (permutationsLog10(n) < target_log10)
        {
            ++n;
        }
        return n;
    }

    Advice sufficientBlockSize(std::uint64_t file_size, double target_log10)
    {
        Advice advice;
        advice.file_size = file_size;
        advice.fragments = minimumFragments(target_log10);
        advice.blocksize = file_size / advice.fragments;
        advice.permutations_log10 = permutationsLog10(advice.fragments);
        return advice;
    }
}
