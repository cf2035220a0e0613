#pragma once

#include <cstdint>
#include <random>

namespace jigsaw
{
    // Seedable random source handed explicitly to the Slicer and the Shuffler.
    // Models UniformRandomBitGenerator so it plugs into <random> distributions.
    class Rng
    {
    public:
        using result_type = std::mt19937_64::result_type;

        explicit Rng(std::uint64_t seed);

        // Seeded from OpenSSL's CSPRNG.
        static Rng fromEntropy();

        static constexpr result_type min() { return std::mt19937_64::min(); }
        static constexpr result_type max() { return std::mt19937_64::max(); }

        result_type operator()() { return engine_(); }

        std::uint64_t seed() const { return seed_; }

    private:
        std::uint64_t seed_;
        std::mt19937_64 engine_;
    };
}
