#pragma once

#include <cstdint>
#include <iterator>
#include <span>

namespace BitPacked {

// Iterator you can:
//    - write as *it = std::uint8_t
//    - advance as it++ / ++it
template <class It>
concept ByteOutputIterator =
    std::output_iterator<It, std::uint8_t>;

// Encoded input is always a contiguous, fully available buffer:
// decoding is positional and needs random access to it.
using ByteSpan = std::span<const std::uint8_t>;

} // namespace BitPacked
