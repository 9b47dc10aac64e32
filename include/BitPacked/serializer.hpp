#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "encoder.hpp"
#include "options.hpp"
#include "record.hpp"
#include "result.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"

namespace BitPacked {

namespace serializer_details {

using static_schema::annotation_meta_getter;

// Top-level scalars carry no annotations: always the fixed-width form.
template<class Field>
bool EncodeScalar(const Field & field, StructureEncoder & enc) {
    const auto & v = annotation_meta_getter<Field>::getRef(field);
    if constexpr (static_schema::WireBool<Field>) {
        return enc.encode_bool(v);
    } else if constexpr (static_schema::WireInteger<Field>) {
        using W = static_schema::wire_integer_t<Field>;
        const W w = static_cast<W>(v);
        if constexpr (sizeof(W) == 1)      return enc.encode_byte(w);
        else if constexpr (sizeof(W) == 2) return enc.encode_short(w);
        else if constexpr (sizeof(W) == 4) return enc.encode_int(w);
        else                               return enc.encode_long(w);
    } else if constexpr (static_schema::WireChar<Field>) {
        return enc.encode_char(v);
    } else if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, float>) {
        return enc.encode_float(v);
    } else if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, double>) {
        return enc.encode_double(v);
    } else {
        return enc.encode_string(v);
    }
}

template<std::size_t I, class ObjT>
bool EncodeOneStructField(const ObjT & obj, StructureEncoder & enc) {
    using Field = introspection::structureElementTypeByIndex<I, ObjT>;
    [[maybe_unused]] const auto & field = introspection::getStructElementByIndex<I>(obj);

    if constexpr (!static_schema::WireScalar<Field>) {
        return enc.encode_unsupported_element(I);
    } else {
        const auto & v = annotation_meta_getter<Field>::getRef(field);
        if constexpr (static_schema::WireBool<Field>) {
            return enc.encode_bool_element(I, v);
        } else if constexpr (static_schema::WireInteger<Field>) {
            using W = static_schema::wire_integer_t<Field>;
            const W w = static_cast<W>(v);
            if constexpr (sizeof(W) == 1)      return enc.encode_byte_element(I, w);
            else if constexpr (sizeof(W) == 2) return enc.encode_short_element(I, w);
            else if constexpr (sizeof(W) == 4) return enc.encode_int_element(I, w);
            else                               return enc.encode_long_element(I, w);
        } else if constexpr (static_schema::WireChar<Field>) {
            return enc.encode_char_element(I, v);
        } else if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, float>) {
            return enc.encode_float_element(I, v);
        } else if constexpr (std::is_same_v<std::remove_cvref_t<decltype(v)>, double>) {
            return enc.encode_double_element(I, v);
        } else {
            return enc.encode_string_element(I, v);
        }
    }
}

template<class ObjT, std::size_t... I>
bool EncodeStructFields(const ObjT & obj, StructureEncoder & enc, std::index_sequence<I...>) {
    return (EncodeOneStructField<I>(obj, enc) && ...);
}

} // namespace serializer_details


// Appends the encoding of `obj` to `out`: a bare scalar for scalar models,
// one structure for aggregates. Nothing is appended on failure.
template<class InputObjectT>
EncodeResult Encode(const InputObjectT & obj, std::vector<std::uint8_t> & out) {
    static_assert(static_schema::WireModel<InputObjectT>,
                  "[[[ BitPacked ]]] Type is neither a wire scalar nor an aggregate record");

    const std::size_t start = out.size();
    StructureEncoder enc(out);
    bool ok;
    if constexpr (static_schema::WireScalar<InputObjectT>) {
        ok = serializer_details::EncodeScalar(obj, enc);
    } else {
        constexpr std::size_t N = introspection::structureElementsCount<InputObjectT>;
        ok = enc.begin_structure(SchemaOf<InputObjectT>())
             && serializer_details::EncodeStructFields(obj, enc, std::make_index_sequence<N>{})
             && enc.end_structure();
    }
    EncodeResult res = record_details::encodeResult(enc);
    if (!ok) {
        out.resize(start);
    }
    return res;
}

template<class InputObjectT>
std::vector<std::uint8_t> Encode(const InputObjectT & obj) {
    std::vector<std::uint8_t> out;
    if (!Encode(obj, out)) {
        out.clear();
    }
    return out;
}

} // namespace BitPacked
