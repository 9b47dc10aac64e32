#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "options.hpp"
#include "schema.hpp"
#include "struct_introspection.hpp"

namespace BitPacked {

namespace static_schema {

namespace input_checks {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;

template<class T>
constexpr bool is_character_v =
    std::is_same_v<T, char8_t>  ||
    std::is_same_v<T, char16_t> ||
    std::is_same_v<T, char32_t> ||
    std::is_same_v<T, wchar_t>;

} // namespace input_checks


using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;

template<class Field>
using AnnotatedOptions = typename annotation_meta_getter<Field>::options;


/* ######## Scalar type detection ######## */

template<class C>
concept WireBool = std::same_as<AnnotatedValue<C>, bool>;

// 1, 2, 4 and 8 byte integers, signed or not; unsigned values travel as
// their same-width bit pattern.
template<class C>
concept WireInteger =
    !WireBool<C> &&
    std::is_integral_v<AnnotatedValue<C>> &&
    !input_checks::is_character_v<AnnotatedValue<C>> &&
    (sizeof(AnnotatedValue<C>) == 1 || sizeof(AnnotatedValue<C>) == 2 ||
     sizeof(AnnotatedValue<C>) == 4 || sizeof(AnnotatedValue<C>) == 8);

template<class C>
concept WireChar = std::same_as<AnnotatedValue<C>, char16_t>;

template<class C>
concept WireFloat =
    std::same_as<AnnotatedValue<C>, float> ||
    std::same_as<AnnotatedValue<C>, double>;

template<class C>
concept WireString = std::same_as<AnnotatedValue<C>, std::string>;

template<class C>
concept WireScalar = WireBool<C> || WireInteger<C> || WireChar<C> || WireFloat<C> || WireString<C>;


/* ######## Shapes that can be described but not encoded ######## */

template<class C>
concept MapLike = requires {
    typename C::key_type;
    typename C::mapped_type;
};

template<class C>
concept NullableLike =
    std::is_pointer_v<C> ||
    input_checks::is_specialization_of_v<C, std::optional> ||
    input_checks::is_specialization_of_v<C, std::unique_ptr> ||
    input_checks::is_specialization_of_v<C, std::shared_ptr>;

template<class C>
concept PolymorphicLike = input_checks::is_specialization_of_v<C, std::variant>;


/* ######## Record type detection ######## */

template<typename T>
struct is_wire_record {
    static constexpr bool value = [] {
        using U = AnnotatedValue<T>;
        if constexpr (WireScalar<T>) {
            return false;
        } else if constexpr (std::ranges::range<U>) {
            return false;
        } else if constexpr (NullableLike<U> || PolymorphicLike<U>) {
            return false;
        } else if constexpr (!std::is_class_v<U>) {
            return false;
        } else if constexpr (!std::is_aggregate_v<U>) {
            return false;
        } else {
            return true;
        }
    }();
};

template<class C>
concept WireRecord = is_wire_record<C>::value;

// Anything the typed front-ends accept at top level.
template<class C>
concept WireModel = WireScalar<C> || WireRecord<C>;


template<class Field>
constexpr FieldKind kind_of_type() {
    using U = std::remove_cv_t<AnnotatedValue<Field>>;
    if constexpr (WireBool<Field>) {
        return FieldKind::Bool;
    } else if constexpr (WireInteger<Field>) {
        if constexpr (sizeof(U) == 1)      return FieldKind::Byte;
        else if constexpr (sizeof(U) == 2) return FieldKind::Short;
        else if constexpr (sizeof(U) == 4) return FieldKind::Int32;
        else                               return FieldKind::Int64;
    } else if constexpr (WireChar<Field>) {
        return FieldKind::Char16;
    } else if constexpr (std::same_as<U, float>) {
        return FieldKind::Float32;
    } else if constexpr (std::same_as<U, double>) {
        return FieldKind::Float64;
    } else if constexpr (WireString<Field>) {
        return FieldKind::Utf8String;
    } else if constexpr (std::is_enum_v<U>) {
        return FieldKind::Enum;
    } else if constexpr (NullableLike<U>) {
        return FieldKind::Nullable;
    } else if constexpr (PolymorphicLike<U>) {
        return FieldKind::Polymorphic;
    } else if constexpr (MapLike<U>) {
        return FieldKind::Map;
    } else if constexpr (std::ranges::range<U>) {
        return FieldKind::Sequence;
    } else if constexpr (WireRecord<Field>) {
        return FieldKind::Structure;
    } else {
        static_assert(!sizeof(U), "[[[ BitPacked ]]] Field type has no wire representation");
    }
}


// Same-width signed representation handed to the engines.
template<class Field>
using wire_integer_t =
    std::conditional_t<sizeof(AnnotatedValue<Field>) == 1, std::int8_t,
    std::conditional_t<sizeof(AnnotatedValue<Field>) == 2, std::int16_t,
    std::conditional_t<sizeof(AnnotatedValue<Field>) == 4, std::int32_t,
                                                           std::int64_t>>>;


namespace detail {

template<class T, std::size_t I>
FieldSpec fieldSpecAt() {
    using Field = introspection::structureElementTypeByIndex<I, T>;
    using Opts  = typename annotation_meta_getter<Field>::OptionsP;
    return FieldSpec{
        kind_of_type<Field>(),
        options::detail::annotations_of<Opts>::get(),
        std::string(introspection::structureElementNameByIndex<I, T>)
    };
}

template<class T, std::size_t... I>
StructureSchema buildSchema(std::index_sequence<I...>) {
    std::vector<FieldSpec> specs{ fieldSpecAt<T, I>()... };
    return ResolveSchema(specs);
}

} // namespace detail

} // namespace static_schema


// Schema of an aggregate record type, resolved once per type.
template<class T>
    requires static_schema::WireRecord<T>
const StructureSchema & SchemaOf() {
    static const StructureSchema schema = static_schema::detail::buildSchema<T>(
        std::make_index_sequence<introspection::structureElementsCount<T>>{});
    return schema;
}

} // namespace BitPacked
