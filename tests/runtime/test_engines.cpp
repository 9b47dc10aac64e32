#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <BitPacked/decoder.hpp>
#include <BitPacked/encoder.hpp>
#include <BitPacked/schema.hpp>

using namespace BitPacked;
using Bytes = std::vector<std::uint8_t>;

namespace {

StructureSchema MakeSchema(std::vector<FieldSpec> specs) {
    return ResolveSchema(specs);
}

} // namespace

void boolean_bit_order_tests() {
    using K = FieldKind;
    // booleans at 2, 5 and 7
    auto schema = MakeSchema({
        {K::Byte}, {K::Short}, {K::Bool}, {K::Int32}, {K::Int64}, {K::Bool}, {K::Float64}, {K::Bool}
    });
    assert((schema.booleanPositions() == std::vector<std::size_t>{2, 5, 7}));

    Bytes out;
    StructureEncoder enc(out);
    assert(enc.begin_structure(schema));
    assert(enc.encode_byte_element(0, 1));
    assert(enc.encode_short_element(1, 2));
    assert(enc.encode_bool_element(2, false));
    assert(enc.encode_int_element(3, 3));
    assert(enc.encode_long_element(4, 4));
    assert(enc.encode_bool_element(5, true));
    assert(enc.encode_double_element(6, 0.5));
    assert(enc.encode_bool_element(7, false));
    assert(enc.end_structure());

    // flags first: only the second boolean is set
    assert(out[0] == 0x02);
    assert(out.size() == 1 + 1 + 2 + 4 + 8 + 8);
    assert(out[1] == 0x01);
    assert(out[2] == 0x00 && out[3] == 0x02);

    StructureDecoder dec(out);
    assert(dec.begin_structure(schema));
    assert(dec.pos() == 1);
    std::int8_t b = 0; std::int16_t s = 0; std::int32_t i = 0; std::int64_t l = 0; double d = 0;
    bool f2 = true, f5 = false, f7 = true;
    assert(dec.decode_byte_element(0, b) && b == 1);
    assert(dec.decode_short_element(1, s) && s == 2);
    assert(dec.decode_bool_element(2, f2) && !f2);
    assert(dec.decode_int_element(3, i) && i == 3);
    assert(dec.decode_long_element(4, l) && l == 4);
    const std::size_t before = dec.pos();
    assert(dec.decode_bool_element(5, f5) && f5);
    assert(dec.pos() == before);
    assert(dec.decode_double_element(6, d) && d == 0.5);
    assert(dec.decode_bool_element(7, f7) && !f7);
    assert(dec.end_structure());
    assert(dec.pos() == out.size());
    assert(dec.decode_element_index() == StructureDecoder::DECODE_DONE);
    assert(dec.decode_sequentially());
}

void varint_mode_tests() {
    using K = FieldKind;
    using A = FieldAnnotation;
    auto schema = MakeSchema({
        {K::Int32, {A::VarInt}},
        {K::Int32, {A::VarUInt}},
        {K::Int32, {}},
        {K::Int64, {A::VarInt}},
        {K::Int64, {A::VarUInt, A::VarInt}},
    });

    Bytes out;
    StructureEncoder enc(out);
    assert(enc.begin_structure(schema));
    assert(enc.encode_int_element(0, -1));
    assert(enc.encode_int_element(1, -1));
    assert(enc.encode_int_element(2, -1));
    assert(enc.encode_long_element(3, 300));
    assert(enc.encode_long_element(4, -64));
    assert(enc.end_structure());

    const Bytes expected{
        0x00,                               // no booleans
        0xFF, 0xFF, 0xFF, 0xFF, 0x0F,       // plain varint of -1
        0x01,                               // zigzag(-1)
        0xFF, 0xFF, 0xFF, 0xFF,             // fixed -1
        0xAC, 0x02,                         // varlong 300
        0x7F,                               // zigzag(-64)
    };
    assert(out == expected);

    StructureDecoder dec(out);
    std::int32_t a = 0, b = 0, c = 0;
    std::int64_t d = 0, e = 0;
    assert(dec.begin_structure(schema));
    assert(dec.decode_int_element(0, a) && a == -1);
    assert(dec.decode_int_element(1, b) && b == -1);
    assert(dec.decode_int_element(2, c) && c == -1);
    assert(dec.decode_long_element(3, d) && d == 300);
    assert(dec.decode_long_element(4, e) && e == -64);
    assert(dec.end_structure());
    assert(dec.finish());
}

void string_and_char_tests() {
    using K = FieldKind;
    auto schema = MakeSchema({{K::Utf8String}, {K::Char16}});

    Bytes out;
    StructureEncoder enc(out);
    assert(enc.begin_structure(schema));
    assert(enc.encode_string_element(0, "hi"));
    assert(enc.encode_char_element(1, u'€'));
    assert(enc.end_structure());
    assert((out == Bytes{0x00, 0x02, 0x68, 0x69, 0x20, 0xAC}));

    StructureDecoder dec(out);
    std::string s;
    char16_t c = 0;
    assert(dec.begin_structure(schema));
    assert(dec.decode_string_element(0, s) && s == "hi");
    assert(dec.pos() == 1 + 3);
    assert(dec.decode_char_element(1, c) && c == u'€');
    assert(dec.end_structure());

    // ill-formed UTF-8 is carried byte-exact
    Bytes raw{0x00, 0x02, 0xC3, 0x28};
    StructureDecoder rawDec(raw);
    std::string rs;
    auto textOnly = MakeSchema({{K::Utf8String}});
    assert(rawDec.begin_structure(textOnly));
    assert(rawDec.decode_string_element(0, rs));
    assert(rawDec.end_structure());
    assert((rs == std::string{'\xC3', '\x28'}));

    // multi-byte UTF-8 is length-prefixed by bytes, not characters
    Bytes top;
    StructureEncoder topEnc(top);
    assert(topEnc.encode_string("\xC3\xA9t\xC3\xA9"));
    assert(top.size() == 1 + 5 && top[0] == 0x05);
}

void signaling_nan_tests() {
    using K = FieldKind;
    auto schema = MakeSchema({{K::Float32}, {K::Float64}});
    const float  snanF = bit_packing::bits_to_float(0x7FA00001u);
    const double snanD = bit_packing::bits_to_double(0x7FF4000000000001ull);

    Bytes out;
    StructureEncoder enc(out);
    assert(enc.begin_structure(schema));
    assert(enc.encode_float_element(0, snanF));
    assert(enc.encode_double_element(1, snanD));
    assert(enc.end_structure());
    assert(out[1] == 0x7F && out[2] == 0xA0 && out[3] == 0x00 && out[4] == 0x01);

    StructureDecoder dec(out);
    float f = 0;
    double d = 0;
    assert(dec.begin_structure(schema));
    assert(dec.decode_float_element(0, f));
    assert(dec.decode_double_element(1, d));
    assert(dec.end_structure());
    assert(bit_packing::float_to_bits(f) == 0x7FA00001u);
    assert(bit_packing::double_to_bits(d) == 0x7FF4000000000001ull);
}

void nesting_guard_tests() {
    using K = FieldKind;
    auto schema = MakeSchema({{K::Bool}, {K::Int32, {FieldAnnotation::VarInt}}});
    auto other  = MakeSchema({{K::Utf8String}});

    Bytes out;
    StructureEncoder enc(out);
    assert(enc.begin_structure(schema));
    assert(enc.encode_bool_element(0, true));

    assert(!enc.begin_structure(other));
    assert(enc.getError() == BitPackError::NESTED_STRUCTURE);
    assert(is_usage_error(enc.getError()));
    assert(out.empty());
    assert(enc.inStructure());

    // the original session still completes correctly
    assert(enc.encode_int_element(1, 5));
    assert(enc.end_structure());
    assert((out == Bytes{0x01, 0x05}));
    assert(!enc.inStructure());

    // first error is kept
    assert(enc.getError() == BitPackError::NESTED_STRUCTURE);

    StructureDecoder dec(out);
    assert(dec.begin_structure(schema));
    assert(!dec.begin_structure(other));
    assert(dec.getError() == BitPackError::NESTED_STRUCTURE);
    bool flag = false;
    std::int32_t v = 0;
    assert(dec.decode_bool_element(0, flag) && flag);
    assert(dec.decode_int_element(1, v) && v == 5);
    assert(dec.end_structure());
}

void rejection_tests() {
    using K = FieldKind;
    auto schema = MakeSchema({{K::Int32}, {K::Sequence}, {K::Bool}});

    {
        Bytes out;
        StructureEncoder enc(out);
        assert(!enc.encode_int_element(0, 1));
        assert(enc.getError() == BitPackError::NO_ACTIVE_STRUCTURE);
        assert(!enc.end_structure());
        assert(out.empty());
    }
    {
        Bytes out;
        StructureEncoder enc(out);
        assert(enc.begin_structure(schema));
        assert(enc.encode_int_element(0, 7));
        assert(!enc.encode_unsupported_element(1));
        assert(enc.getError() == BitPackError::UNSUPPORTED_FIELD_KIND);
        assert(enc.errorField() == 1);
        // nothing has reached the output for the failed structure
        assert(out.empty());
        // and closing it cannot produce a record without field 1
        assert(enc.encode_bool_element(2, true));
        assert(!enc.end_structure());
        assert(out.empty());
        assert(!enc.inStructure());
        assert(enc.getError() == BitPackError::UNSUPPORTED_FIELD_KIND);
    }
    {
        Bytes out;
        StructureEncoder enc(out);
        assert(enc.begin_structure(schema));
        std::int32_t dummy = 0;
        assert(!enc.encode_int_element(1, dummy));
        assert(enc.getError() == BitPackError::UNSUPPORTED_FIELD_KIND);
    }
    {
        Bytes out;
        StructureEncoder enc(out);
        assert(enc.begin_structure(schema));
        assert(!enc.encode_string_element(0, "x"));
        assert(enc.getError() == BitPackError::FIELD_KIND_MISMATCH);
        assert(enc.errorField() == 0);
        assert(!enc.end_structure());
        assert(out.empty());

        // a later structure on the same encoder is written normally
        auto flagOnly = MakeSchema({{K::Bool}});
        assert(enc.begin_structure(flagOnly));
        assert(enc.encode_bool_element(0, true));
        assert(enc.end_structure());
        assert((out == Bytes{0x01}));
    }
    {
        Bytes out;
        StructureEncoder enc(out);
        assert(enc.begin_structure(schema));
        assert(!enc.encode_bool_element(9, true));
        assert(enc.getError() == BitPackError::UNKNOWN_FIELD);
        assert(!enc.end_structure());
        assert(out.empty());
    }
    {
        Bytes out;
        StructureEncoder enc(out);
        assert(enc.begin_structure(schema));
        assert(!enc.encode_int(3));
        assert(enc.getError() == BitPackError::TOP_LEVEL_VALUE_IN_STRUCTURE);
    }
    {
        std::vector<FieldSpec> specs(33, FieldSpec{K::Bool});
        auto tooMany = ResolveSchema(specs);
        Bytes out;
        StructureEncoder enc(out);
        assert(!enc.begin_structure(tooMany));
        assert(enc.getError() == BitPackError::TOO_MANY_BOOLEAN_FIELDS);
        assert(!enc.inStructure());
    }
    {
        Bytes in{0x00, 0x00, 0x00, 0x00, 0x01};
        StructureDecoder dec(in);
        std::int32_t v = 0;
        assert(dec.begin_structure(schema));
        assert(dec.decode_int_element(0, v) && v == 1);
        assert(!dec.decode_unsupported_element(1));
        assert(dec.getError() == BitPackError::UNSUPPORTED_FIELD_KIND);
        assert(dec.errorField() == 1);
        assert(!dec.end_structure());
        assert(!dec.inStructure());
        assert(!dec.finish());
    }
}

void malformed_input_tests() {
    using K = FieldKind;
    {
        auto schema = MakeSchema({{K::Int32}});
        Bytes in{0x00, 0x00, 0x01};
        StructureDecoder dec(in);
        std::int32_t v = 0;
        assert(dec.begin_structure(schema));
        assert(!dec.decode_int_element(0, v));
        assert(dec.getError() == BitPackError::UNEXPECTED_END_OF_DATA);
        assert(is_malformed_input(dec.getError()));
        assert(dec.errorPos() == 1);
        assert(!dec.end_structure());
        assert(!dec.inStructure());
    }
    {
        auto schema = MakeSchema({{K::Bool}});
        Bytes in{0x80, 0x80, 0x80, 0x80, 0x80, 0x01};
        StructureDecoder dec(in);
        assert(!dec.begin_structure(schema));
        assert(dec.getError() == BitPackError::VARINT_TOO_LONG);
        assert(!dec.inStructure());
    }
    {
        auto schema = MakeSchema({{K::Int64, {FieldAnnotation::VarUInt}}});
        Bytes in{0x00, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0x01};
        StructureDecoder dec(in);
        std::int64_t v = 0;
        assert(dec.begin_structure(schema));
        assert(!dec.decode_long_element(0, v));
        assert(dec.getError() == BitPackError::VARINT_TOO_LONG);
        assert(!dec.end_structure());
    }
    {
        // declares 4 bytes, carries 2
        auto schema = MakeSchema({{K::Utf8String}});
        Bytes in{0x00, 0x04, 0x61, 0x62};
        StructureDecoder dec(in);
        std::string s;
        assert(dec.begin_structure(schema));
        assert(!dec.decode_string_element(0, s));
        assert(dec.getError() == BitPackError::STRING_LENGTH_OUT_OF_RANGE);
    }
    {
        // negative length
        Bytes in{0xFF, 0xFF, 0xFF, 0xFF, 0x0F};
        StructureDecoder dec(in);
        std::string s;
        assert(!dec.decode_string(s));
        assert(dec.getError() == BitPackError::STRING_LENGTH_OUT_OF_RANGE);
    }
}

void top_level_tests() {
    Bytes out;
    StructureEncoder enc(out);
    assert(enc.encode_bool(true));
    assert(enc.encode_byte(-1));
    assert(enc.encode_short(0x0102));
    assert(enc.encode_int(-2));
    assert(enc.encode_long(1));
    assert(enc.encode_char(u'A'));
    assert(enc.encode_string(""));
    assert(enc.bytesWritten() == 1 + 1 + 2 + 4 + 8 + 2 + 1);

    StructureDecoder dec(out, DecodeOptions{false, true});
    bool b = false; std::int8_t y = 0; std::int16_t s = 0; std::int32_t i = 0; std::int64_t l = 0;
    char16_t c = 0; std::string str = "x";
    assert(dec.decode_bool(b) && b);
    assert(dec.decode_byte(y) && y == -1);
    assert(dec.decode_short(s) && s == 0x0102);
    assert(dec.decode_int(i) && i == -2);
    assert(dec.decode_long(l) && l == 1);
    assert(dec.decode_char(c) && c == u'A');
    assert(dec.decode_string(str) && str.empty());
    assert(dec.finish());

    // any non-zero byte reads as true
    Bytes two{0x02};
    StructureDecoder boolDec(two);
    bool t = false;
    assert(boolDec.decode_bool(t) && t);
}

void strict_options_tests() {
    using K = FieldKind;
    auto schema = MakeSchema({{K::Int32}, {K::Bool}, {K::Int32}});
    const Bytes in{0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x02};

    {
        // lenient by default: stopping early is accepted
        StructureDecoder dec(in);
        std::int32_t v = 0;
        assert(dec.begin_structure(schema));
        assert(dec.decode_int_element(0, v));
        assert(dec.end_structure());
        assert(dec.finish());
    }
    {
        StructureDecoder dec(in, DecodeOptions{true, false});
        std::int32_t v = 0;
        assert(dec.begin_structure(schema));
        assert(dec.decode_int_element(0, v));
        assert(!dec.end_structure());
        assert(dec.getError() == BitPackError::UNREAD_FIELDS);
        assert(dec.errorField() == 2);
        assert(!dec.inStructure());
    }
    {
        // booleans need not be read explicitly
        StructureDecoder dec(in, DecodeOptions{true, true});
        std::int32_t a = 0, b = 0;
        assert(dec.begin_structure(schema));
        assert(dec.decode_int_element(0, a));
        assert(dec.decode_int_element(2, b) && b == 2);
        assert(dec.end_structure());
        assert(dec.finish());
    }
    {
        StructureDecoder dec(in, DecodeOptions{false, true});
        std::int32_t v = 0;
        assert(dec.begin_structure(schema));
        assert(dec.decode_int_element(0, v));
        assert(dec.end_structure());
        assert(dec.remaining() == 4);
        assert(!dec.finish());
        assert(dec.getError() == BitPackError::EXCESS_DATA);
    }
}

int main() {
    boolean_bit_order_tests();
    varint_mode_tests();
    string_and_char_tests();
    signaling_nan_tests();
    nesting_guard_tests();
    rejection_tests();
    malformed_input_tests();
    top_level_tests();
    strict_options_tests();
    std::cout << "engine tests passed" << std::endl;
    return 0;
}
