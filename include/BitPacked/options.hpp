#pragma once

#include <string_view>
#include <type_traits>
#include <vector>

#include "annotated.hpp"
#include "schema.hpp"

namespace BitPacked {


namespace options {


namespace detail {

struct varint_tag{};
struct varuint_tag{};
}

// Integer field travels as a varint of its two's-complement bits.
struct varint {
    using tag = detail::varint_tag;
    static constexpr FieldAnnotation annotation = FieldAnnotation::VarInt;
    static constexpr std::string_view to_string() {
        return "varint";
    }
};

// Integer field is zigzag-mapped before the varint; small negatives stay short.
struct varuint {
    using tag = detail::varuint_tag;
    static constexpr FieldAnnotation annotation = FieldAnnotation::VarUInt;
    static constexpr std::string_view to_string() {
        return "varuint";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};


template<class Tag, class... Opts>
struct find_option_by_tag;

template<class Tag>
struct find_option_by_tag<Tag> {
    using type = void;
};

template<class Tag, class First, class... Rest>
struct find_option_by_tag<Tag, First, Rest...> {
private:
    using next = typename find_option_by_tag<Tag, Rest...>::type;

public:
    using type = std::conditional_t<
        option_matches_tag<First, Tag>::value,
        First,
        next
        >;
};

template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    using option_type = typename detail::find_option_by_tag<Tag, Opts...>::type;

    template<class Tag>
    static constexpr bool has_option = !std::is_void_v<option_type<Tag>>;

    static constexpr bool is_varint  = has_option<varint_tag>;
    static constexpr bool is_varuint = has_option<varuint_tag>;
};


template<class Field>
struct annotation_meta {
    using value_t  = Field;
    using OptionsP = OptionsPack<>;
    using options  = field_options<OptionsP>;

    static constexpr decltype(auto) getRef(Field & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const Field & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    static_assert((requires { typename Opts::tag; } && ...),
                  "[[[ BitPacked ]]] Annotated<> takes option types only");

    using value_t  = T;
    using OptionsP = OptionsPack<Opts...>;
    using options  = field_options<OptionsP>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};


// Runtime annotation list of a field, fed to the schema resolver.
template<class OptPack> struct annotations_of;
template<class... Opts>
struct annotations_of<OptionsPack<Opts...>> {
    static constexpr std::vector<FieldAnnotation> get() {
        std::vector<FieldAnnotation> result;
        ([&] {
            if constexpr (requires { Opts::annotation; }) {
                result.push_back(Opts::annotation);
            }
        }(), ...);
        return result;
    }
};

} // namespace detail

} // namespace options

} // namespace BitPacked
