#pragma once

#include <cstddef>
#include <limits>

#include "errors.hpp"

namespace BitPacked {

constexpr std::size_t NO_FIELD_POSITION = std::numeric_limits<std::size_t>::max();

class EncodeResult {
    BitPackError m_error = BitPackError::NO_ERROR;
    std::size_t m_fieldPosition = NO_FIELD_POSITION;
    std::size_t m_bytesWritten = 0;
public:
    constexpr EncodeResult(BitPackError err, std::size_t fieldPosition, std::size_t bytesWritten):
        m_error(err), m_fieldPosition(fieldPosition), m_bytesWritten(bytesWritten)
    {}
    constexpr operator bool() const {
        return m_error == BitPackError::NO_ERROR;
    }
    constexpr BitPackError error() const {
        return m_error;
    }
    constexpr ErrorCategory category() const {
        return error_category(m_error);
    }
    // NO_FIELD_POSITION when the error does not concern a particular field
    constexpr std::size_t fieldPosition() const {
        return m_fieldPosition;
    }
    constexpr std::size_t bytesWritten() const {
        return m_bytesWritten;
    }
};

class DecodeResult {
    BitPackError m_error = BitPackError::NO_ERROR;
    std::size_t m_fieldPosition = NO_FIELD_POSITION;
    std::size_t m_pos = 0;
public:
    constexpr DecodeResult(BitPackError err, std::size_t fieldPosition, std::size_t pos):
        m_error(err), m_fieldPosition(fieldPosition), m_pos(pos)
    {}
    constexpr operator bool() const {
        return m_error == BitPackError::NO_ERROR;
    }
    constexpr BitPackError error() const {
        return m_error;
    }
    constexpr ErrorCategory category() const {
        return error_category(m_error);
    }
    constexpr std::size_t fieldPosition() const {
        return m_fieldPosition;
    }
    // Input offset reached on success, or where decoding failed.
    constexpr std::size_t pos() const {
        return m_pos;
    }
};

} // namespace BitPacked
