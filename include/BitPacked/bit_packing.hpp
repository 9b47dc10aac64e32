#pragma once

#include <bit>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <ranges>
#include <vector>

#include "errors.hpp"
#include "io.hpp"

namespace BitPacked {

namespace bit_packing {

// Outcome of every read primitive: the decoded value and how many bytes it
// occupied, or the reason decoding stopped.
template<class T>
struct ReadResult {
    BitPackError error = BitPackError::NO_ERROR;
    T value{};
    std::size_t bytesConsumed = 0;

    constexpr operator bool() const {
        return error == BitPackError::NO_ERROR;
    }
};

constexpr std::size_t MAX_VARINT_BYTES  = 5;
constexpr std::size_t MAX_VARLONG_BYTES = 10;
constexpr std::size_t MAX_FLAG_BITS     = 32;

// ============================================================================
// Boolean flags
// ============================================================================

// Bit i of the result is bits[i]; bits past MAX_FLAG_BITS are not representable.
template<std::ranges::input_range R>
constexpr std::uint32_t pack_flags(const R & bits) {
    std::uint32_t result = 0;
    std::size_t i = 0;
    for (auto && bit : bits) {
        if (i >= MAX_FLAG_BITS) break;
        if (static_cast<bool>(bit)) {
            result |= std::uint32_t{1} << i;
        }
        ++i;
    }
    return result;
}

constexpr bool flag_at(std::uint32_t flags, std::size_t i) {
    if (i >= MAX_FLAG_BITS) return false;
    return (flags & (std::uint32_t{1} << i)) != 0;
}

constexpr std::vector<bool> unpack_flags(std::uint32_t flags, std::size_t count) {
    std::vector<bool> result(count, false);
    for (std::size_t i = 0; i < count; ++i) {
        result[i] = flag_at(flags, i);
    }
    return result;
}

// ============================================================================
// ZigZag
// ============================================================================

constexpr std::uint32_t zigzag_encode32(std::int32_t value) {
    // >> on a negative signed value is arithmetic
    return (static_cast<std::uint32_t>(value) << 1) ^ static_cast<std::uint32_t>(value >> 31);
}

constexpr std::int32_t zigzag_decode32(std::uint32_t value) {
    return static_cast<std::int32_t>((value >> 1) ^ (std::uint32_t{0} - (value & 1u)));
}

constexpr std::uint64_t zigzag_encode64(std::int64_t value) {
    return (static_cast<std::uint64_t>(value) << 1) ^ static_cast<std::uint64_t>(value >> 63);
}

constexpr std::int64_t zigzag_decode64(std::uint64_t value) {
    return static_cast<std::int64_t>((value >> 1) ^ (std::uint64_t{0} - (value & 1u)));
}

// ============================================================================
// Fixed-width big-endian
// ============================================================================

template<std::unsigned_integral U, ByteOutputIterator It>
constexpr void write_fixed(U value, It & out) {
    for (std::size_t i = sizeof(U); i-- > 0; ) {
        *out++ = static_cast<std::uint8_t>((value >> (8 * i)) & 0xFFu);
    }
}

template<ByteOutputIterator It>
constexpr void write_fixed16(std::uint16_t value, It & out) {
    write_fixed(value, out);
}

template<ByteOutputIterator It>
constexpr void write_fixed32(std::uint32_t value, It & out) {
    write_fixed(value, out);
}

template<ByteOutputIterator It>
constexpr void write_fixed64(std::uint64_t value, It & out) {
    write_fixed(value, out);
}

template<std::unsigned_integral U>
constexpr ReadResult<U> read_fixed(ByteSpan in, std::size_t offset) {
    if (offset > in.size() || in.size() - offset < sizeof(U)) {
        return {BitPackError::UNEXPECTED_END_OF_DATA, U{}, 0};
    }
    U v = 0;
    for (std::size_t i = 0; i < sizeof(U); ++i) {
        v = static_cast<U>((v << 8) | static_cast<U>(in[offset + i]));
    }
    return {BitPackError::NO_ERROR, v, sizeof(U)};
}

constexpr ReadResult<std::uint16_t> read_fixed16(ByteSpan in, std::size_t offset) {
    return read_fixed<std::uint16_t>(in, offset);
}

constexpr ReadResult<std::uint32_t> read_fixed32(ByteSpan in, std::size_t offset) {
    return read_fixed<std::uint32_t>(in, offset);
}

constexpr ReadResult<std::uint64_t> read_fixed64(ByteSpan in, std::size_t offset) {
    return read_fixed<std::uint64_t>(in, offset);
}

// Floating point values travel as their raw IEEE-754 bits; NaN payloads are kept.
constexpr std::uint32_t float_to_bits(float f) {
    static_assert(sizeof(float) == 4 && std::numeric_limits<float>::is_iec559);
    return std::bit_cast<std::uint32_t>(f);
}

constexpr float bits_to_float(std::uint32_t bits) {
    return std::bit_cast<float>(bits);
}

constexpr std::uint64_t double_to_bits(double d) {
    static_assert(sizeof(double) == 8 && std::numeric_limits<double>::is_iec559);
    return std::bit_cast<std::uint64_t>(d);
}

constexpr double bits_to_double(std::uint64_t bits) {
    return std::bit_cast<double>(bits);
}

// ============================================================================
// Varint
// ============================================================================

template<std::unsigned_integral U, ByteOutputIterator It>
constexpr void write_unsigned_varint(U value, It & out) {
    while ((value & ~U{0x7F}) != 0) {
        *out++ = static_cast<std::uint8_t>((value & 0x7Fu) | 0x80u);
        value >>= 7;
    }
    *out++ = static_cast<std::uint8_t>(value);
}

// Negative values are grouped as their two's-complement bit pattern:
// -1 takes all 5 bytes.
template<ByteOutputIterator It>
constexpr void write_varint(std::int32_t value, It & out) {
    write_unsigned_varint(static_cast<std::uint32_t>(value), out);
}

template<ByteOutputIterator It>
constexpr void write_varlong(std::int64_t value, It & out) {
    write_unsigned_varint(static_cast<std::uint64_t>(value), out);
}

template<std::unsigned_integral U>
constexpr std::size_t unsigned_varint_size(U value) {
    std::size_t n = 1;
    while ((value & ~U{0x7F}) != 0) {
        value >>= 7;
        ++n;
    }
    return n;
}

constexpr std::size_t varint_size(std::int32_t value) {
    return unsigned_varint_size(static_cast<std::uint32_t>(value));
}

constexpr std::size_t varlong_size(std::int64_t value) {
    return unsigned_varint_size(static_cast<std::uint64_t>(value));
}

template<std::unsigned_integral U, std::size_t MaxBytes>
constexpr ReadResult<U> decode_unsigned_varint(ByteSpan in, std::size_t offset) {
    if (offset > in.size()) {
        return {BitPackError::UNEXPECTED_END_OF_DATA, U{}, 0};
    }
    U result = 0;
    unsigned shift = 0;
    for (std::size_t i = 0; i < MaxBytes; ++i) {
        if (offset + i >= in.size()) {
            return {BitPackError::UNEXPECTED_END_OF_DATA, U{}, i};
        }
        const std::uint8_t b = in[offset + i];
        // payload bits above the type width are dropped
        result |= static_cast<U>(static_cast<U>(b & 0x7Fu) << shift);
        if ((b & 0x80u) == 0) {
            return {BitPackError::NO_ERROR, result, i + 1};
        }
        shift += 7;
    }
    return {BitPackError::VARINT_TOO_LONG, U{}, MaxBytes};
}

constexpr ReadResult<std::int32_t> decode_varint(ByteSpan in, std::size_t offset = 0) {
    auto r = decode_unsigned_varint<std::uint32_t, MAX_VARINT_BYTES>(in, offset);
    return {r.error, static_cast<std::int32_t>(r.value), r.bytesConsumed};
}

constexpr ReadResult<std::int64_t> decode_varlong(ByteSpan in, std::size_t offset = 0) {
    auto r = decode_unsigned_varint<std::uint64_t, MAX_VARLONG_BYTES>(in, offset);
    return {r.error, static_cast<std::int64_t>(r.value), r.bytesConsumed};
}

} // namespace bit_packing

} // namespace BitPacked
