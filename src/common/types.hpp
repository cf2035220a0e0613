#pragma once

#include <cstdint>
#include <vector>

namespace jigsaw
{
    using Bytes = std::vector<std::uint8_t>;
}
