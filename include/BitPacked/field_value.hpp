#pragma once

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "schema.hpp"

namespace BitPacked {

// One field value. Alternative order follows FieldKind's scalar kinds.
using FieldValue = std::variant<
    bool,
    std::int8_t,
    std::int16_t,
    std::int32_t,
    std::int64_t,
    float,
    double,
    char16_t,
    std::string
>;

// Values of one record, in declaration order.
using Record = std::vector<FieldValue>;

inline FieldKind kind_of(const FieldValue & v) {
    switch(v.index()) {
    case 0: return FieldKind::Bool;
    case 1: return FieldKind::Byte;
    case 2: return FieldKind::Short;
    case 3: return FieldKind::Int32;
    case 4: return FieldKind::Int64;
    case 5: return FieldKind::Float32;
    case 6: return FieldKind::Float64;
    case 7: return FieldKind::Char16;
    default: return FieldKind::Utf8String;
    }
}

// Zero value of a supported kind; unsupported kinds yield false.
inline FieldValue default_value_for(FieldKind kind) {
    switch(kind) {
    case FieldKind::Byte:       return std::int8_t{0};
    case FieldKind::Short:      return std::int16_t{0};
    case FieldKind::Int32:      return std::int32_t{0};
    case FieldKind::Int64:      return std::int64_t{0};
    case FieldKind::Float32:    return 0.0f;
    case FieldKind::Float64:    return 0.0;
    case FieldKind::Char16:     return char16_t{0};
    case FieldKind::Utf8String: return std::string{};
    default:                    return false;
    }
}

} // namespace BitPacked
