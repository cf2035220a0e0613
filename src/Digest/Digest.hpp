#pragma once

#include <cstddef>
#include <map>
#include <string>

#include "common/types.hpp"

namespace jigsaw::digest
{
    // Width of one SHA-256 block in hex characters.
    inline constexpr std::size_t kNativeHexLength = 64;

    // Raw expanded SHA-256 stream of `nbytes` bytes:
    //   block 0 = SHA256(data), block k = SHA256(data || BE32(k)) for k >= 1.
    Bytes expand(const std::uint8_t *data, std::size_t size, std::size_t nbytes);

    // Fidelity digest: the first `length` lowercase hex characters of the
    // expanded stream. For length <= 64 this is truncated SHA-256.
    std::string digest(const std::uint8_t *data, std::size_t size, std::size_t length);
    std::string digest(const Bytes &data, std::size_t length);

    std::string toHex(const std::uint8_t *data, std::size_t size);

    // Whole-file checksums keyed by algorithm name (md5, sha1, sha224, sha256, sha384, sha512).
    std::map<std::string, std::string> checksums(const Bytes &data);
}
