#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "bit_packing.hpp"

namespace BitPacked {


enum class FieldKind : std::uint8_t {
    Bool,
    Byte,
    Short,
    Int32,
    Int64,
    Float32,
    Float64,
    Char16,
    Utf8String,

    // Describable, but rejected by the engines.
    Structure,
    Sequence,
    Map,
    Enum,
    Nullable,
    Polymorphic
};

constexpr std::string_view kind_to_string(FieldKind k) {
    switch(k) {
    case FieldKind::Bool:        return "Bool"; break;
    case FieldKind::Byte:        return "Byte"; break;
    case FieldKind::Short:       return "Short"; break;
    case FieldKind::Int32:       return "Int32"; break;
    case FieldKind::Int64:       return "Int64"; break;
    case FieldKind::Float32:     return "Float32"; break;
    case FieldKind::Float64:     return "Float64"; break;
    case FieldKind::Char16:      return "Char16"; break;
    case FieldKind::Utf8String:  return "Utf8String"; break;
    case FieldKind::Structure:   return "Structure"; break;
    case FieldKind::Sequence:    return "Sequence"; break;
    case FieldKind::Map:         return "Map"; break;
    case FieldKind::Enum:        return "Enum"; break;
    case FieldKind::Nullable:    return "Nullable"; break;
    case FieldKind::Polymorphic: return "Polymorphic"; break;
    }
    return "N/A";
}

constexpr bool is_supported_kind(FieldKind k) {
    switch(k) {
    case FieldKind::Bool:
    case FieldKind::Byte:
    case FieldKind::Short:
    case FieldKind::Int32:
    case FieldKind::Int64:
    case FieldKind::Float32:
    case FieldKind::Float64:
    case FieldKind::Char16:
    case FieldKind::Utf8String:
        return true;
    default:
        return false;
    }
}

constexpr bool is_varint_eligible(FieldKind k) {
    return k == FieldKind::Int32 || k == FieldKind::Int64;
}


enum class VarIntMode : std::uint8_t {
    None,
    Signed,
    ZigZagUnsigned
};

// Field-level annotations as supplied by the type description.
enum class FieldAnnotation : std::uint8_t {
    VarInt,
    VarUInt
};

// VarUInt wins over VarInt; annotations on non-integer fields have no effect.
constexpr VarIntMode resolve_varint_mode(FieldKind kind, std::span<const FieldAnnotation> annotations) {
    if (!is_varint_eligible(kind)) {
        return VarIntMode::None;
    }
    bool varInt = false;
    bool varUInt = false;
    for (FieldAnnotation a : annotations) {
        if (a == FieldAnnotation::VarInt) varInt = true;
        if (a == FieldAnnotation::VarUInt) varUInt = true;
    }
    if (varUInt) return VarIntMode::ZigZagUnsigned;
    if (varInt)  return VarIntMode::Signed;
    return VarIntMode::None;
}


// One entry of the externally supplied type description.
struct FieldSpec {
    FieldKind kind = FieldKind::Bool;
    std::vector<FieldAnnotation> annotations{};
    std::string name{};
};

struct FieldDescriptor {
    std::size_t position = 0;
    FieldKind kind = FieldKind::Bool;
    VarIntMode varIntMode = VarIntMode::None;
    std::string name{};

    constexpr bool isBoolean() const {
        return kind == FieldKind::Bool;
    }
};


class StructureSchema {
public:
    static constexpr std::size_t NOT_A_BOOLEAN = std::numeric_limits<std::size_t>::max();

    constexpr StructureSchema() = default;

    constexpr explicit StructureSchema(std::vector<FieldDescriptor> fields, std::string name = {})
        : m_name(std::move(name)), m_fields(std::move(fields))
    {
        m_booleanOrdinals.assign(m_fields.size(), NOT_A_BOOLEAN);
        for (std::size_t i = 0; i < m_fields.size(); ++i) {
            if (m_fields[i].isBoolean()) {
                m_booleanOrdinals[i] = m_booleanPositions.size();
                m_booleanPositions.push_back(m_fields[i].position);
            }
        }
    }

    constexpr const std::string & name() const {
        return m_name;
    }

    constexpr const std::vector<FieldDescriptor> & fields() const {
        return m_fields;
    }

    constexpr std::size_t size() const {
        return m_fields.size();
    }

    // nullptr for positions the schema does not declare
    constexpr const FieldDescriptor * field(std::size_t position) const {
        if (position >= m_fields.size()) return nullptr;
        return &m_fields[position];
    }

    // Positions of the boolean fields, in declaration order.
    constexpr const std::vector<std::size_t> & booleanPositions() const {
        return m_booleanPositions;
    }

    constexpr std::size_t booleanCount() const {
        return m_booleanPositions.size();
    }

    // Flag bit of the boolean field at `position`, or NOT_A_BOOLEAN.
    constexpr std::size_t booleanOrdinal(std::size_t position) const {
        if (position >= m_booleanOrdinals.size()) return NOT_A_BOOLEAN;
        return m_booleanOrdinals[position];
    }

    constexpr BitPackError check() const {
        for (std::size_t i = 0; i < m_fields.size(); ++i) {
            if (m_fields[i].position != i) {
                return BitPackError::INVALID_SCHEMA;
            }
        }
        if (m_booleanPositions.size() > bit_packing::MAX_FLAG_BITS) {
            return BitPackError::TOO_MANY_BOOLEAN_FIELDS;
        }
        return BitPackError::NO_ERROR;
    }

private:
    std::string m_name;
    std::vector<FieldDescriptor> m_fields;
    std::vector<std::size_t> m_booleanPositions;
    std::vector<std::size_t> m_booleanOrdinals;
};


// Turns an ordered type description into a schema: positions follow the
// declaration order and each integer field gets its varint mode.
constexpr StructureSchema ResolveSchema(std::span<const FieldSpec> specs, std::string name = {}) {
    std::vector<FieldDescriptor> fields;
    fields.reserve(specs.size());
    for (std::size_t i = 0; i < specs.size(); ++i) {
        fields.push_back(FieldDescriptor{
            i,
            specs[i].kind,
            resolve_varint_mode(specs[i].kind, specs[i].annotations),
            specs[i].name
        });
    }
    return StructureSchema(std::move(fields), std::move(name));
}

} // namespace BitPacked
