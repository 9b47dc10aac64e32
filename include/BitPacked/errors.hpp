#pragma once

#include <string_view>
namespace BitPacked {


enum class BitPackError {
    NO_ERROR,

    // Usage errors: the caller drove the codec incorrectly.
    NESTED_STRUCTURE,
    NO_ACTIVE_STRUCTURE,
    TOP_LEVEL_VALUE_IN_STRUCTURE,
    UNKNOWN_FIELD,
    FIELD_KIND_MISMATCH,
    UNSUPPORTED_FIELD_KIND,
    INVALID_SCHEMA,
    TOO_MANY_BOOLEAN_FIELDS,
    FIELD_COUNT_MISMATCH,
    STRING_TOO_LONG,
    UNREAD_FIELDS,

    // Malformed input: the bytes do not match the schema.
    VARINT_TOO_LONG,
    UNEXPECTED_END_OF_DATA,
    STRING_LENGTH_OUT_OF_RANGE,
    EXCESS_DATA
};

constexpr std::string_view error_to_string(BitPackError e) {
    switch(e) {
    case BitPackError::NO_ERROR: return "NO_ERROR"; break;
    case BitPackError::NESTED_STRUCTURE: return "NESTED_STRUCTURE"; break;
    case BitPackError::NO_ACTIVE_STRUCTURE: return "NO_ACTIVE_STRUCTURE"; break;
    case BitPackError::TOP_LEVEL_VALUE_IN_STRUCTURE: return "TOP_LEVEL_VALUE_IN_STRUCTURE"; break;
    case BitPackError::UNKNOWN_FIELD: return "UNKNOWN_FIELD"; break;
    case BitPackError::FIELD_KIND_MISMATCH: return "FIELD_KIND_MISMATCH"; break;
    case BitPackError::UNSUPPORTED_FIELD_KIND: return "UNSUPPORTED_FIELD_KIND"; break;
    case BitPackError::INVALID_SCHEMA: return "INVALID_SCHEMA"; break;
    case BitPackError::TOO_MANY_BOOLEAN_FIELDS: return "TOO_MANY_BOOLEAN_FIELDS"; break;
    case BitPackError::FIELD_COUNT_MISMATCH: return "FIELD_COUNT_MISMATCH"; break;
    case BitPackError::STRING_TOO_LONG: return "STRING_TOO_LONG"; break;
    case BitPackError::UNREAD_FIELDS: return "UNREAD_FIELDS"; break;
    case BitPackError::VARINT_TOO_LONG: return "VARINT_TOO_LONG"; break;
    case BitPackError::UNEXPECTED_END_OF_DATA: return "UNEXPECTED_END_OF_DATA"; break;
    case BitPackError::STRING_LENGTH_OUT_OF_RANGE: return "STRING_LENGTH_OUT_OF_RANGE"; break;
    case BitPackError::EXCESS_DATA: return "EXCESS_DATA"; break;
    }
    return "N/A";
}


// ============================================================================
// Error categories
// ============================================================================

enum class ErrorCategory {
    none,
    usage,
    malformed_input
};

constexpr ErrorCategory error_category(BitPackError e) {
    switch(e) {
    case BitPackError::NO_ERROR:
        return ErrorCategory::none;
    case BitPackError::NESTED_STRUCTURE:
    case BitPackError::NO_ACTIVE_STRUCTURE:
    case BitPackError::TOP_LEVEL_VALUE_IN_STRUCTURE:
    case BitPackError::UNKNOWN_FIELD:
    case BitPackError::FIELD_KIND_MISMATCH:
    case BitPackError::UNSUPPORTED_FIELD_KIND:
    case BitPackError::INVALID_SCHEMA:
    case BitPackError::TOO_MANY_BOOLEAN_FIELDS:
    case BitPackError::FIELD_COUNT_MISMATCH:
    case BitPackError::STRING_TOO_LONG:
    case BitPackError::UNREAD_FIELDS:
        return ErrorCategory::usage;
    case BitPackError::VARINT_TOO_LONG:
    case BitPackError::UNEXPECTED_END_OF_DATA:
    case BitPackError::STRING_LENGTH_OUT_OF_RANGE:
    case BitPackError::EXCESS_DATA:
        return ErrorCategory::malformed_input;
    }
    return ErrorCategory::usage;
}

constexpr std::string_view category_to_string(ErrorCategory c) {
    switch(c) {
    case ErrorCategory::none            : return "none"; break;
    case ErrorCategory::usage           : return "usage error"; break;
    case ErrorCategory::malformed_input : return "malformed input"; break;
    }
    return "N/A";
}

constexpr bool is_usage_error(BitPackError e) {
    return error_category(e) == ErrorCategory::usage;
}

constexpr bool is_malformed_input(BitPackError e) {
    return error_category(e) == ErrorCategory::malformed_input;
}

} // namespace BitPacked
