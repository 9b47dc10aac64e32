#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "bit_packing.hpp"
#include "errors.hpp"
#include "field_value.hpp"
#include "io.hpp"
#include "schema.hpp"

namespace BitPacked {

// Runtime knobs of the decoder. Both checks are off by default: a decode
// that stops early or leaves bytes behind is accepted.
struct DecodeOptions {
    // end_structure() fails with UNREAD_FIELDS unless every non-boolean field was read.
    bool require_all_fields = false;
    // finish() fails with EXCESS_DATA when unread bytes remain.
    bool reject_trailing_bytes = false;
};

// State of one structure being decoded. The flags varint is unpacked eagerly
// at structure entry; boolean reads are lookups into booleanValues.
struct DecodeSession {
    const StructureSchema * schema = nullptr;
    std::vector<bool> booleanValues;
    std::vector<bool> consumed;
    bool failed = false;
};


// Reads encoded values from a byte buffer through a forward-only cursor.
// Fields must be requested in the order they were encoded; there is no
// random access.
class StructureDecoder {
public:
    using error_type = BitPackError;

    static constexpr std::size_t NOT_A_FIELD = std::numeric_limits<std::size_t>::max();
    // decode_element_index() result: fields are consumed sequentially.
    static constexpr std::size_t DECODE_DONE = std::numeric_limits<std::size_t>::max();

    explicit StructureDecoder(ByteSpan data, DecodeOptions options = {}) noexcept
        : m_data(data), m_options(options)
    {}

    // ========== Introspection ==========

    error_type getError() const noexcept {
        return err_;
    }

    std::size_t errorField() const noexcept {
        return m_errorField;
    }

    // Cursor position when the first error happened.
    std::size_t errorPos() const noexcept {
        return m_errorPos;
    }

    std::size_t pos() const noexcept {
        return m_cursor;
    }

    std::size_t remaining() const noexcept {
        return m_data.size() - m_cursor;
    }

    bool inStructure() const noexcept {
        return m_session.has_value();
    }

    // ========== Structures ==========

    bool begin_structure(const StructureSchema & schema) {
        if (m_session) {
            return setError(BitPackError::NESTED_STRUCTURE);
        }
        if (BitPackError e = schema.check(); e != BitPackError::NO_ERROR) {
            return setError(e);
        }
        auto flags = bit_packing::decode_varint(m_data, m_cursor);
        if (!flags) {
            return setError(flags.error);
        }
        m_cursor += flags.bytesConsumed;

        m_session.emplace();
        m_session->schema = &schema;
        m_session->booleanValues = bit_packing::unpack_flags(
            static_cast<std::uint32_t>(flags.value), schema.booleanCount());
        m_session->consumed.assign(schema.size(), false);
        return true;
    }

    // Always leaves the structure. Fails when a field of it failed or when
    // the strict check finds an unread field.
    bool end_structure() {
        if (!m_session) {
            return setError(BitPackError::NO_ACTIVE_STRUCTURE);
        }
        if (m_session->failed) {
            m_session.reset();
            return false;
        }
        std::size_t unread = NOT_A_FIELD;
        if (m_options.require_all_fields) {
            for (std::size_t i = 0; i < m_session->consumed.size(); ++i) {
                if (!m_session->consumed[i] && !m_session->schema->fields()[i].isBoolean()) {
                    unread = i;
                    break;
                }
            }
        }
        m_session.reset();
        if (unread != NOT_A_FIELD) {
            return setError(BitPackError::UNREAD_FIELDS, unread);
        }
        return true;
    }

    std::size_t decode_element_index() const noexcept {
        return DECODE_DONE;
    }

    bool decode_sequentially() const noexcept {
        return true;
    }

    // ========== Structure fields ==========

    bool decode_bool_element(std::size_t position, bool & out) {
        if (!element(position, FieldKind::Bool)) return false;
        out = m_session->booleanValues[m_session->schema->booleanOrdinal(position)];
        return consume(position);
    }

    bool decode_byte_element(std::size_t position, std::int8_t & out) {
        if (!element(position, FieldKind::Byte)) return false;
        return read_byte(out, position) && consume(position);
    }

    bool decode_short_element(std::size_t position, std::int16_t & out) {
        if (!element(position, FieldKind::Short)) return false;
        return read_short(out, position) && consume(position);
    }

    bool decode_int_element(std::size_t position, std::int32_t & out) {
        const FieldDescriptor * f = element(position, FieldKind::Int32);
        if (!f) return false;
        switch (f->varIntMode) {
        case VarIntMode::None:
            if (!read_int(out, position)) return false;
            break;
        case VarIntMode::Signed: {
            auto r = bit_packing::decode_varint(m_data, m_cursor);
            if (!r) return setError(r.error, position);
            m_cursor += r.bytesConsumed;
            out = r.value;
            break;
        }
        case VarIntMode::ZigZagUnsigned: {
            auto r = bit_packing::decode_unsigned_varint<std::uint32_t, bit_packing::MAX_VARINT_BYTES>(m_data, m_cursor);
            if (!r) return setError(r.error, position);
            m_cursor += r.bytesConsumed;
            out = bit_packing::zigzag_decode32(r.value);
            break;
        }
        }
        return consume(position);
    }

    bool decode_long_element(std::size_t position, std::int64_t & out) {
        const FieldDescriptor * f = element(position, FieldKind::Int64);
        if (!f) return false;
        switch (f->varIntMode) {
        case VarIntMode::None:
            if (!read_long(out, position)) return false;
            break;
        case VarIntMode::Signed: {
            auto r = bit_packing::decode_varlong(m_data, m_cursor);
            if (!r) return setError(r.error, position);
            m_cursor += r.bytesConsumed;
            out = r.value;
            break;
        }
        case VarIntMode::ZigZagUnsigned: {
            auto r = bit_packing::decode_unsigned_varint<std::uint64_t, bit_packing::MAX_VARLONG_BYTES>(m_data, m_cursor);
            if (!r) return setError(r.error, position);
            m_cursor += r.bytesConsumed;
            out = bit_packing::zigzag_decode64(r.value);
            break;
        }
        }
        return consume(position);
    }

    bool decode_float_element(std::size_t position, float & out) {
        if (!element(position, FieldKind::Float32)) return false;
        return read_float(out, position) && consume(position);
    }

    bool decode_double_element(std::size_t position, double & out) {
        if (!element(position, FieldKind::Float64)) return false;
        return read_double(out, position) && consume(position);
    }

    bool decode_char_element(std::size_t position, char16_t & out) {
        if (!element(position, FieldKind::Char16)) return false;
        return read_char(out, position) && consume(position);
    }

    bool decode_string_element(std::size_t position, std::string & out) {
        if (!element(position, FieldKind::Utf8String)) return false;
        return read_string(out, position) && consume(position);
    }

    // Decodes the field at `position` as whatever kind the schema declares.
    bool decode_element(std::size_t position, FieldValue & out) {
        if (!m_session) {
            return setError(BitPackError::NO_ACTIVE_STRUCTURE, position);
        }
        const FieldDescriptor * f = m_session->schema->field(position);
        if (!f) {
            return setError(BitPackError::UNKNOWN_FIELD, position);
        }
        switch (f->kind) {
        case FieldKind::Bool:       return decode_into<bool>(out, [&](bool & v) { return decode_bool_element(position, v); });
        case FieldKind::Byte:       return decode_into<std::int8_t>(out, [&](std::int8_t & v) { return decode_byte_element(position, v); });
        case FieldKind::Short:      return decode_into<std::int16_t>(out, [&](std::int16_t & v) { return decode_short_element(position, v); });
        case FieldKind::Int32:      return decode_into<std::int32_t>(out, [&](std::int32_t & v) { return decode_int_element(position, v); });
        case FieldKind::Int64:      return decode_into<std::int64_t>(out, [&](std::int64_t & v) { return decode_long_element(position, v); });
        case FieldKind::Float32:    return decode_into<float>(out, [&](float & v) { return decode_float_element(position, v); });
        case FieldKind::Float64:    return decode_into<double>(out, [&](double & v) { return decode_double_element(position, v); });
        case FieldKind::Char16:     return decode_into<char16_t>(out, [&](char16_t & v) { return decode_char_element(position, v); });
        case FieldKind::Utf8String: return decode_into<std::string>(out, [&](std::string & v) { return decode_string_element(position, v); });
        default:
            return setError(BitPackError::UNSUPPORTED_FIELD_KIND, position);
        }
    }

    bool decode_unsupported_element(std::size_t position) {
        if (!m_session) {
            return setError(BitPackError::NO_ACTIVE_STRUCTURE, position);
        }
        return setError(BitPackError::UNSUPPORTED_FIELD_KIND, position);
    }

    // ========== Top-level scalars ==========

    bool decode_bool(bool & out) {
        if (!topLevel()) return false;
        std::int8_t b = 0;
        if (!read_byte(b, NOT_A_FIELD)) return false;
        out = b != 0;
        return true;
    }

    bool decode_byte(std::int8_t & out) {
        return topLevel() && read_byte(out, NOT_A_FIELD);
    }

    bool decode_short(std::int16_t & out) {
        return topLevel() && read_short(out, NOT_A_FIELD);
    }

    bool decode_int(std::int32_t & out) {
        return topLevel() && read_int(out, NOT_A_FIELD);
    }

    bool decode_long(std::int64_t & out) {
        return topLevel() && read_long(out, NOT_A_FIELD);
    }

    bool decode_float(float & out) {
        return topLevel() && read_float(out, NOT_A_FIELD);
    }

    bool decode_double(double & out) {
        return topLevel() && read_double(out, NOT_A_FIELD);
    }

    bool decode_char(char16_t & out) {
        return topLevel() && read_char(out, NOT_A_FIELD);
    }

    bool decode_string(std::string & out) {
        return topLevel() && read_string(out, NOT_A_FIELD);
    }

    bool decode_value(FieldKind kind, FieldValue & out) {
        switch (kind) {
        case FieldKind::Bool:       return decode_into<bool>(out, [&](bool & v) { return decode_bool(v); });
        case FieldKind::Byte:       return decode_into<std::int8_t>(out, [&](std::int8_t & v) { return decode_byte(v); });
        case FieldKind::Short:      return decode_into<std::int16_t>(out, [&](std::int16_t & v) { return decode_short(v); });
        case FieldKind::Int32:      return decode_into<std::int32_t>(out, [&](std::int32_t & v) { return decode_int(v); });
        case FieldKind::Int64:      return decode_into<std::int64_t>(out, [&](std::int64_t & v) { return decode_long(v); });
        case FieldKind::Float32:    return decode_into<float>(out, [&](float & v) { return decode_float(v); });
        case FieldKind::Float64:    return decode_into<double>(out, [&](double & v) { return decode_double(v); });
        case FieldKind::Char16:     return decode_into<char16_t>(out, [&](char16_t & v) { return decode_char(v); });
        case FieldKind::Utf8String: return decode_into<std::string>(out, [&](std::string & v) { return decode_string(v); });
        default:
            return setError(BitPackError::UNSUPPORTED_FIELD_KIND);
        }
    }

    // Call after the last value; honours reject_trailing_bytes.
    bool finish() {
        if (m_session) {
            return setError(BitPackError::TOP_LEVEL_VALUE_IN_STRUCTURE);
        }
        if (m_options.reject_trailing_bytes && remaining() != 0) {
            return setError(BitPackError::EXCESS_DATA);
        }
        return err_ == BitPackError::NO_ERROR;
    }

private:
    ByteSpan m_data;
    DecodeOptions m_options;
    std::size_t m_cursor = 0;
    std::optional<DecodeSession> m_session;

    error_type  err_ = BitPackError::NO_ERROR;
    std::size_t m_errorField = NOT_A_FIELD;
    std::size_t m_errorPos = 0;

    bool setError(error_type e, std::size_t field = NOT_A_FIELD) noexcept {
        if (field != NOT_A_FIELD && m_session) {
            m_session->failed = true;
        }
        if (err_ == BitPackError::NO_ERROR) {
            err_ = e;
            m_errorField = field;
            m_errorPos = m_cursor;
        }
        return false;
    }

    const FieldDescriptor * element(std::size_t position, FieldKind expected) {
        if (!m_session) {
            setError(BitPackError::NO_ACTIVE_STRUCTURE, position);
            return nullptr;
        }
        const FieldDescriptor * f = m_session->schema->field(position);
        if (!f) {
            setError(BitPackError::UNKNOWN_FIELD, position);
            return nullptr;
        }
        if (!is_supported_kind(f->kind)) {
            setError(BitPackError::UNSUPPORTED_FIELD_KIND, position);
            return nullptr;
        }
        if (f->kind != expected) {
            setError(BitPackError::FIELD_KIND_MISMATCH, position);
            return nullptr;
        }
        return f;
    }

    bool consume(std::size_t position) {
        m_session->consumed[position] = true;
        return true;
    }

    bool topLevel() {
        if (m_session) {
            return setError(BitPackError::TOP_LEVEL_VALUE_IN_STRUCTURE);
        }
        return true;
    }

    template<class T, class F>
    bool decode_into(FieldValue & out, F && read) {
        T v{};
        if (!read(v)) return false;
        out = std::move(v);
        return true;
    }

    template<std::unsigned_integral U>
    bool read_bits(U & out, std::size_t field) {
        auto r = bit_packing::read_fixed<U>(m_data, m_cursor);
        if (!r) return setError(r.error, field);
        m_cursor += r.bytesConsumed;
        out = r.value;
        return true;
    }

    bool read_byte(std::int8_t & out, std::size_t field) {
        std::uint8_t b = 0;
        if (!read_bits(b, field)) return false;
        out = static_cast<std::int8_t>(b);
        return true;
    }

    bool read_short(std::int16_t & out, std::size_t field) {
        std::uint16_t b = 0;
        if (!read_bits(b, field)) return false;
        out = static_cast<std::int16_t>(b);
        return true;
    }

    bool read_int(std::int32_t & out, std::size_t field) {
        std::uint32_t b = 0;
        if (!read_bits(b, field)) return false;
        out = static_cast<std::int32_t>(b);
        return true;
    }

    bool read_long(std::int64_t & out, std::size_t field) {
        std::uint64_t b = 0;
        if (!read_bits(b, field)) return false;
        out = static_cast<std::int64_t>(b);
        return true;
    }

    bool read_float(float & out, std::size_t field) {
        std::uint32_t b = 0;
        if (!read_bits(b, field)) return false;
        out = bit_packing::bits_to_float(b);
        return true;
    }

    bool read_double(double & out, std::size_t field) {
        std::uint64_t b = 0;
        if (!read_bits(b, field)) return false;
        out = bit_packing::bits_to_double(b);
        return true;
    }

    bool read_char(char16_t & out, std::size_t field) {
        std::uint16_t b = 0;
        if (!read_bits(b, field)) return false;
        out = static_cast<char16_t>(b);
        return true;
    }

    // The bytes are taken as they are, without UTF-8 validation.
    // The cursor is left on the length prefix when the length is rejected.
    bool read_string(std::string & out, std::size_t field) {
        auto len = bit_packing::decode_varint(m_data, m_cursor);
        if (!len) return setError(len.error, field);
        if (len.value < 0 ||
            static_cast<std::size_t>(len.value) > m_data.size() - m_cursor - len.bytesConsumed) {
            return setError(BitPackError::STRING_LENGTH_OUT_OF_RANGE, field);
        }
        m_cursor += len.bytesConsumed;
        const auto * first = m_data.data() + m_cursor;
        out.assign(reinterpret_cast<const char *>(first), static_cast<std::size_t>(len.value));
        m_cursor += static_cast<std::size_t>(len.value);
        return true;
    }
};

} // namespace BitPacked
