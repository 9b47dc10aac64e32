#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

#include "bit_packing.hpp"
#include "errors.hpp"
#include "field_value.hpp"
#include "schema.hpp"

namespace BitPacked {

// State of one structure being encoded. Booleans are only collected here;
// they reach the output as the flags varint when the structure ends.
struct EncodeSession {
    const StructureSchema * schema = nullptr;
    std::vector<bool> booleanValues;
    std::vector<std::uint8_t> data;
    // Set by any field failure; the structure can then only be abandoned.
    bool failed = false;
};


// Appends encoded values to `out`.
//
// Idle: encode_<kind>() writes one bare top-level scalar.
// In structure: encode_<kind>_element() feeds the fields of the schema passed
// to begin_structure(); end_structure() emits flags + field bytes.
// The schema must outlive the structure.
//
// Every operation returns false on failure. The first error is kept and can
// be queried with getError(). A failed field poisons the active structure:
// end_structure() then discards it and emits nothing. A rejected nested
// begin_structure() leaves the active structure usable.
class StructureEncoder {
public:
    using error_type = BitPackError;

    static constexpr std::size_t NOT_A_FIELD = std::numeric_limits<std::size_t>::max();

    explicit StructureEncoder(std::vector<std::uint8_t> & out) noexcept
        : m_out(out), m_start(out.size())
    {}

    // ========== Introspection ==========

    error_type getError() const noexcept {
        return err_;
    }

    // Position of the field the first error concerns, or NOT_A_FIELD.
    std::size_t errorField() const noexcept {
        return m_errorField;
    }

    std::size_t bytesWritten() const noexcept {
        return m_out.size() - m_start;
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
        m_session.emplace();
        m_session->schema = &schema;
        m_session->booleanValues.assign(schema.booleanCount(), false);
        m_session->data.clear();
        return true;
    }

    bool end_structure() {
        if (!m_session) {
            return setError(BitPackError::NO_ACTIVE_STRUCTURE);
        }
        if (m_session->failed) {
            m_session.reset();
            return false;
        }
        const std::uint32_t flags = bit_packing::pack_flags(m_session->booleanValues);
        auto it = std::back_inserter(m_out);
        bit_packing::write_unsigned_varint(flags, it);
        m_out.insert(m_out.end(), m_session->data.begin(), m_session->data.end());
        m_session.reset();
        return true;
    }

    // ========== Structure fields ==========

    bool encode_bool_element(std::size_t position, bool value) {
        if (!element(position, FieldKind::Bool)) return false;
        m_session->booleanValues[m_session->schema->booleanOrdinal(position)] = value;
        return true;
    }

    bool encode_byte_element(std::size_t position, std::int8_t value) {
        if (!element(position, FieldKind::Byte)) return false;
        m_session->data.push_back(static_cast<std::uint8_t>(value));
        return true;
    }

    bool encode_short_element(std::size_t position, std::int16_t value) {
        if (!element(position, FieldKind::Short)) return false;
        auto it = std::back_inserter(m_session->data);
        bit_packing::write_fixed16(static_cast<std::uint16_t>(value), it);
        return true;
    }

    bool encode_int_element(std::size_t position, std::int32_t value) {
        const FieldDescriptor * f = element(position, FieldKind::Int32);
        if (!f) return false;
        auto it = std::back_inserter(m_session->data);
        switch (f->varIntMode) {
        case VarIntMode::None:
            bit_packing::write_fixed32(static_cast<std::uint32_t>(value), it);
            break;
        case VarIntMode::Signed:
            bit_packing::write_varint(value, it);
            break;
        case VarIntMode::ZigZagUnsigned:
            bit_packing::write_unsigned_varint(bit_packing::zigzag_encode32(value), it);
            break;
        }
        return true;
    }

    bool encode_long_element(std::size_t position, std::int64_t value) {
        const FieldDescriptor * f = element(position, FieldKind::Int64);
        if (!f) return false;
        auto it = std::back_inserter(m_session->data);
        switch (f->varIntMode) {
        case VarIntMode::None:
            bit_packing::write_fixed64(static_cast<std::uint64_t>(value), it);
            break;
        case VarIntMode::Signed:
            bit_packing::write_varlong(value, it);
            break;
        case VarIntMode::ZigZagUnsigned:
            bit_packing::write_unsigned_varint(bit_packing::zigzag_encode64(value), it);
            break;
        }
        return true;
    }

    bool encode_float_element(std::size_t position, float value) {
        if (!element(position, FieldKind::Float32)) return false;
        auto it = std::back_inserter(m_session->data);
        bit_packing::write_fixed32(bit_packing::float_to_bits(value), it);
        return true;
    }

    bool encode_double_element(std::size_t position, double value) {
        if (!element(position, FieldKind::Float64)) return false;
        auto it = std::back_inserter(m_session->data);
        bit_packing::write_fixed64(bit_packing::double_to_bits(value), it);
        return true;
    }

    bool encode_char_element(std::size_t position, char16_t value) {
        if (!element(position, FieldKind::Char16)) return false;
        auto it = std::back_inserter(m_session->data);
        bit_packing::write_fixed16(static_cast<std::uint16_t>(value), it);
        return true;
    }

    bool encode_string_element(std::size_t position, std::string_view value) {
        if (!element(position, FieldKind::Utf8String)) return false;
        return write_string(value, m_session->data, position);
    }

    bool encode_element(std::size_t position, const FieldValue & value) {
        return std::visit([&](const auto & v) -> bool {
            using V = std::remove_cvref_t<decltype(v)>;
            if constexpr (std::is_same_v<V, bool>) {
                return encode_bool_element(position, v);
            } else if constexpr (std::is_same_v<V, std::int8_t>) {
                return encode_byte_element(position, v);
            } else if constexpr (std::is_same_v<V, std::int16_t>) {
                return encode_short_element(position, v);
            } else if constexpr (std::is_same_v<V, std::int32_t>) {
                return encode_int_element(position, v);
            } else if constexpr (std::is_same_v<V, std::int64_t>) {
                return encode_long_element(position, v);
            } else if constexpr (std::is_same_v<V, float>) {
                return encode_float_element(position, v);
            } else if constexpr (std::is_same_v<V, double>) {
                return encode_double_element(position, v);
            } else if constexpr (std::is_same_v<V, char16_t>) {
                return encode_char_element(position, v);
            } else {
                return encode_string_element(position, v);
            }
        }, value);
    }

    // Nested records, collections, enums, nullables and polymorphic values
    // have no encoding: this always fails, without writing anything.
    bool encode_unsupported_element(std::size_t position) {
        if (!m_session) {
            return setError(BitPackError::NO_ACTIVE_STRUCTURE, position);
        }
        return setError(BitPackError::UNSUPPORTED_FIELD_KIND, position);
    }

    // ========== Top-level scalars ==========

    bool encode_bool(bool value) {
        if (!topLevel()) return false;
        m_out.push_back(value ? 1 : 0);
        return true;
    }

    bool encode_byte(std::int8_t value) {
        if (!topLevel()) return false;
        m_out.push_back(static_cast<std::uint8_t>(value));
        return true;
    }

    bool encode_short(std::int16_t value) {
        if (!topLevel()) return false;
        auto it = std::back_inserter(m_out);
        bit_packing::write_fixed16(static_cast<std::uint16_t>(value), it);
        return true;
    }

    bool encode_int(std::int32_t value) {
        if (!topLevel()) return false;
        auto it = std::back_inserter(m_out);
        bit_packing::write_fixed32(static_cast<std::uint32_t>(value), it);
        return true;
    }

    bool encode_long(std::int64_t value) {
        if (!topLevel()) return false;
        auto it = std::back_inserter(m_out);
        bit_packing::write_fixed64(static_cast<std::uint64_t>(value), it);
        return true;
    }

    bool encode_float(float value) {
        if (!topLevel()) return false;
        auto it = std::back_inserter(m_out);
        bit_packing::write_fixed32(bit_packing::float_to_bits(value), it);
        return true;
    }

    bool encode_double(double value) {
        if (!topLevel()) return false;
        auto it = std::back_inserter(m_out);
        bit_packing::write_fixed64(bit_packing::double_to_bits(value), it);
        return true;
    }

    bool encode_char(char16_t value) {
        if (!topLevel()) return false;
        auto it = std::back_inserter(m_out);
        bit_packing::write_fixed16(static_cast<std::uint16_t>(value), it);
        return true;
    }

    bool encode_string(std::string_view value) {
        if (!topLevel()) return false;
        return write_string(value, m_out, NOT_A_FIELD);
    }

    bool encode_value(const FieldValue & value) {
        return std::visit([&](const auto & v) -> bool {
            using V = std::remove_cvref_t<decltype(v)>;
            if constexpr (std::is_same_v<V, bool>) {
                return encode_bool(v);
            } else if constexpr (std::is_same_v<V, std::int8_t>) {
                return encode_byte(v);
            } else if constexpr (std::is_same_v<V, std::int16_t>) {
                return encode_short(v);
            } else if constexpr (std::is_same_v<V, std::int32_t>) {
                return encode_int(v);
            } else if constexpr (std::is_same_v<V, std::int64_t>) {
                return encode_long(v);
            } else if constexpr (std::is_same_v<V, float>) {
                return encode_float(v);
            } else if constexpr (std::is_same_v<V, double>) {
                return encode_double(v);
            } else if constexpr (std::is_same_v<V, char16_t>) {
                return encode_char(v);
            } else {
                return encode_string(v);
            }
        }, value);
    }

private:
    std::vector<std::uint8_t> & m_out;
    std::size_t m_start;
    std::optional<EncodeSession> m_session;

    error_type  err_ = BitPackError::NO_ERROR;
    std::size_t m_errorField = NOT_A_FIELD;

    bool setError(error_type e, std::size_t field = NOT_A_FIELD) noexcept {
        if (field != NOT_A_FIELD && m_session) {
            m_session->failed = true;
        }
        if (err_ == BitPackError::NO_ERROR) {
            err_ = e;
            m_errorField = field;
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

    bool topLevel() {
        if (m_session) {
            return setError(BitPackError::TOP_LEVEL_VALUE_IN_STRUCTURE);
        }
        return true;
    }

    // varint(byte length) followed by the UTF-8 bytes
    bool write_string(std::string_view value, std::vector<std::uint8_t> & sink, std::size_t field) {
        if (value.size() > static_cast<std::size_t>(std::numeric_limits<std::int32_t>::max())) {
            return setError(BitPackError::STRING_TOO_LONG, field);
        }
        auto it = std::back_inserter(sink);
        bit_packing::write_varint(static_cast<std::int32_t>(value.size()), it);
        for (char c : value) {
            sink.push_back(static_cast<std::uint8_t>(c));
        }
        return true;
    }
};

} // namespace BitPacked
