#include "Random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

namespace jigsaw
{
    Rng::Rng(std::uint64_t seed)
        : seed_(seed), engine_(seed)
    {
    }

    Rng Rng::fromEntropy()
    {
        unsigned char buf[sizeof(std::uint64_t)];
        if (RAND_bytes(buf, sizeof(buf)) != 1)
            throw std::runtime_error("Failed to generate random seed");

        std::uint64_t seed = 0;
        for (unsigned char b : buf)
        {
            seed = (seed << 8) | b;
        }
        return Rng(seed);
    }
}
