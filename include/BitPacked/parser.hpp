#pragma once

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>

#include "decoder.hpp"
#include "io.hpp"
#include "options.hpp"
#include "record.hpp"
#include "result.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"

namespace BitPacked {

namespace parser_details {

using static_schema::annotation_meta_getter;

template<class Field>
bool DecodeScalar(Field & field, StructureDecoder & dec) {
    auto & v = annotation_meta_getter<Field>::getRef(field);
    using V = std::remove_cvref_t<decltype(v)>;
    if constexpr (static_schema::WireBool<Field>) {
        return dec.decode_bool(v);
    } else if constexpr (static_schema::WireInteger<Field>) {
        static_schema::wire_integer_t<Field> w{};
        bool ok;
        if constexpr (sizeof(w) == 1)      ok = dec.decode_byte(w);
        else if constexpr (sizeof(w) == 2) ok = dec.decode_short(w);
        else if constexpr (sizeof(w) == 4) ok = dec.decode_int(w);
        else                               ok = dec.decode_long(w);
        if (ok) v = static_cast<V>(w);
        return ok;
    } else if constexpr (static_schema::WireChar<Field>) {
        return dec.decode_char(v);
    } else if constexpr (std::is_same_v<V, float>) {
        return dec.decode_float(v);
    } else if constexpr (std::is_same_v<V, double>) {
        return dec.decode_double(v);
    } else {
        return dec.decode_string(v);
    }
}

template<std::size_t I, class ObjT>
bool DecodeOneStructField(ObjT & obj, StructureDecoder & dec) {
    using Field = introspection::structureElementTypeByIndex<I, ObjT>;
    [[maybe_unused]] auto & field = introspection::getStructElementByIndex<I>(obj);

    if constexpr (!static_schema::WireScalar<Field>) {
        return dec.decode_unsupported_element(I);
    } else {
        auto & v = annotation_meta_getter<Field>::getRef(field);
        using V = std::remove_cvref_t<decltype(v)>;
        if constexpr (static_schema::WireBool<Field>) {
            return dec.decode_bool_element(I, v);
        } else if constexpr (static_schema::WireInteger<Field>) {
            static_schema::wire_integer_t<Field> w{};
            bool ok;
            if constexpr (sizeof(w) == 1)      ok = dec.decode_byte_element(I, w);
            else if constexpr (sizeof(w) == 2) ok = dec.decode_short_element(I, w);
            else if constexpr (sizeof(w) == 4) ok = dec.decode_int_element(I, w);
            else                               ok = dec.decode_long_element(I, w);
            if (ok) v = static_cast<V>(w);
            return ok;
        } else if constexpr (static_schema::WireChar<Field>) {
            return dec.decode_char_element(I, v);
        } else if constexpr (std::is_same_v<V, float>) {
            return dec.decode_float_element(I, v);
        } else if constexpr (std::is_same_v<V, double>) {
            return dec.decode_double_element(I, v);
        } else {
            return dec.decode_string_element(I, v);
        }
    }
}

template<class ObjT, std::size_t... I>
bool DecodeStructFields(ObjT & obj, StructureDecoder & dec, std::index_sequence<I...>) {
    return (DecodeOneStructField<I>(obj, dec) && ...);
}

} // namespace parser_details


// Reads one model from `in`. On failure `obj` may be partially assigned and
// must be discarded.
template<class InputObjectT>
DecodeResult Decode(InputObjectT & obj, ByteSpan in, DecodeOptions options = {}) {
    static_assert(static_schema::WireModel<InputObjectT>,
                  "[[[ BitPacked ]]] Type is neither a wire scalar nor an aggregate record");

    StructureDecoder dec(in, options);
    bool ok;
    if constexpr (static_schema::WireScalar<InputObjectT>) {
        ok = parser_details::DecodeScalar(obj, dec);
    } else {
        constexpr std::size_t N = introspection::structureElementsCount<InputObjectT>;
        ok = dec.begin_structure(SchemaOf<InputObjectT>())
             && parser_details::DecodeStructFields(obj, dec, std::make_index_sequence<N>{})
             && dec.end_structure();
    }
    if (ok) {
        dec.finish();
    }
    return record_details::decodeResult(dec);
}

} // namespace BitPacked
