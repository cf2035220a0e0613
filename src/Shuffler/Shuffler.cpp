#include "Shuffler.hpp"

#include <algorithm>
#include <numeric>

namespace jigsaw
{
    std::vector<std::size_t> shuffle(std::size_t count, Rng &rng)
    {
        std::vector<std::size_t> order(count);
        std::iota(order.begin(), order.end(), std::size_t{0});
        std::shuffle(order.begin(), order.end(), rng);
        return order;
    }
}
