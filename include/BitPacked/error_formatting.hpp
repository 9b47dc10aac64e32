#pragma once

#include <cstddef>
#include <format>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "result.hpp"
#include "schema.hpp"
#include "static_schema.hpp"

namespace BitPacked {

namespace error_formatting_detail {

// "$" for the whole value, "$.name" for named fields, "$[pos]" otherwise.
inline std::string fieldPath(std::size_t position, const StructureSchema * schema) {
    if (position == NO_FIELD_POSITION) {
        return "$";
    }
    const FieldDescriptor * f = schema ? schema->field(position) : nullptr;
    if (f && !f->name.empty()) {
        return std::format("$.{}", f->name);
    }
    return std::format("$[{}]", position);
}

inline std::string describe(std::string_view action, BitPackError e, std::size_t position,
                            const StructureSchema * schema, std::string_view offsetLabel, std::size_t offset) {
    const std::string path = fieldPath(position, schema);
    if (e == BitPackError::NO_ERROR) {
        return std::format("When {} {}, no error ({} {})", action, path, offsetLabel, offset);
    }
    return std::format("When {} {}, {} '{}' at {} {}", action, path,
                       category_to_string(error_category(e)), error_to_string(e), offsetLabel, offset);
}

} // namespace error_formatting_detail


inline std::string EncodeResultToString(const EncodeResult & res, const StructureSchema * schema = nullptr) {
    return error_formatting_detail::describe("encoding", res.error(), res.fieldPosition(),
                                             schema, "output byte", res.bytesWritten());
}

inline std::string DecodeResultToString(const DecodeResult & res, const StructureSchema * schema = nullptr) {
    return error_formatting_detail::describe("decoding", res.error(), res.fieldPosition(),
                                             schema, "input byte", res.pos());
}

// Field names come from the model type.
template<class C>
std::string EncodeResultToString(const EncodeResult & res) {
    if constexpr (static_schema::WireRecord<C>) {
        return EncodeResultToString(res, &SchemaOf<C>());
    } else {
        return EncodeResultToString(res, nullptr);
    }
}

template<class C>
std::string DecodeResultToString(const DecodeResult & res) {
    if constexpr (static_schema::WireRecord<C>) {
        return DecodeResultToString(res, &SchemaOf<C>());
    } else {
        return DecodeResultToString(res, nullptr);
    }
}

} // namespace BitPacked
