#pragma once

#include <cstddef>
#include <vector>

#include "Random/Random.hpp"

namespace jigsaw
{
    // Uniformly random permutation of [0, count - 1]. Decides the order
    // fragment files are handed out and written; never the logical order.
    std::vector<std::size_t> shuffle(std::size_t count, Rng &rng);
}
