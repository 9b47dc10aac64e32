#undef NDEBUG
#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include <BitPacked/record.hpp>

using namespace BitPacked;
using Bytes = std::vector<std::uint8_t>;

namespace {

StructureSchema AllKindsSchema() {
    using K = FieldKind;
    using A = FieldAnnotation;
    std::vector<FieldSpec> specs{
        {K::Bool,       {},          "enabled"},
        {K::Byte,       {},          "level"},
        {K::Short,      {},          "port"},
        {K::Int32,      {A::VarInt}, "count"},
        {K::Int32,      {A::VarUInt},"offset"},
        {K::Int64,      {},          "timestamp"},
        {K::Float32,    {},          "ratio"},
        {K::Float64,    {},          "precise"},
        {K::Char16,     {},          "grade"},
        {K::Utf8String, {},          "label"},
        {K::Bool,       {},          "archived"},
    };
    return ResolveSchema(specs, "AllKinds");
}

} // namespace

void record_round_trip_tests() {
    const auto schema = AllKindsSchema();
    const std::vector<Record> samples{
        {true, std::int8_t{-5}, std::int16_t{8080}, std::int32_t{123}, std::int32_t{-2},
         std::int64_t{1700000000000}, 0.25f, 1.0 / 3.0, u'Z', std::string("héllo"), false},
        {false, std::int8_t{127}, std::int16_t{-32768}, std::numeric_limits<std::int32_t>::min(),
         std::numeric_limits<std::int32_t>::max(), std::numeric_limits<std::int64_t>::min(),
         -0.0f, 1e300, char16_t{0}, std::string(), true},
    };

    for (const auto & record : samples) {
        Bytes out;
        auto res = EncodeRecord(schema, record, out);
        assert(res);
        assert(res.bytesWritten() == out.size());

        Record back;
        auto dres = DecodeRecord(schema, back, out, DecodeOptions{true, true});
        assert(dres);
        assert(dres.pos() == out.size());
        assert(back == record);
    }
}

void record_layout_tests() {
    using K = FieldKind;
    std::vector<FieldSpec> specs{{K::Bool}, {K::Utf8String}, {K::Bool}};
    auto schema = ResolveSchema(specs);

    Bytes out;
    assert(EncodeRecord(schema, Record{true, std::string("hi"), true}, out));
    assert((out == Bytes{0x03, 0x02, 0x68, 0x69}));

    // appends after existing content
    assert(EncodeRecord(schema, Record{false, std::string(), false}, out));
    assert((out == Bytes{0x03, 0x02, 0x68, 0x69, 0x00, 0x00}));

    Record back;
    auto res = DecodeRecord(schema, back, out);
    assert(res && res.pos() == 4);
    assert(std::get<std::string>(back[1]) == "hi");
}

void record_rejection_tests() {
    using K = FieldKind;
    std::vector<FieldSpec> specs{{K::Int32}, {K::Bool}};
    auto schema = ResolveSchema(specs);

    Bytes out{0xEE};
    auto res = EncodeRecord(schema, Record{std::int32_t{1}}, out);
    assert(!res && res.error() == BitPackError::FIELD_COUNT_MISMATCH);
    assert(res.category() == ErrorCategory::usage);
    assert((out == Bytes{0xEE}));

    res = EncodeRecord(schema, Record{std::int64_t{1}, true}, out);
    assert(!res && res.error() == BitPackError::FIELD_KIND_MISMATCH);
    assert(res.fieldPosition() == 0);
    assert((out == Bytes{0xEE}));

    std::vector<FieldSpec> nested{{K::Int32}, {K::Structure}};
    auto nestedSchema = ResolveSchema(nested);
    res = EncodeRecord(nestedSchema, Record{std::int32_t{1}, false}, out);
    assert(!res && res.error() == BitPackError::UNSUPPORTED_FIELD_KIND);
    assert(res.fieldPosition() == 1);

    Record back;
    Bytes in{0x00, 0x00, 0x00, 0x00, 0x07};
    auto dres = DecodeRecord(nestedSchema, back, in);
    assert(!dres && dres.error() == BitPackError::UNSUPPORTED_FIELD_KIND);
    assert(dres.fieldPosition() == 1);

    Bytes truncated{0x00, 0x00, 0x00};
    dres = DecodeRecord(schema, back, truncated);
    assert(!dres && dres.error() == BitPackError::UNEXPECTED_END_OF_DATA);
    assert(dres.category() == ErrorCategory::malformed_input);
    assert(dres.pos() == 1);
}

void value_tests() {
    Bytes out;
    assert(EncodeValue(FieldValue{std::int32_t{-2}}, out));
    assert(EncodeValue(FieldValue{std::string("hi")}, out));
    assert(EncodeValue(FieldValue{true}, out));
    assert((out == Bytes{0xFF, 0xFF, 0xFF, 0xFE, 0x02, 0x68, 0x69, 0x01}));

    FieldValue v;
    auto res = DecodeValue(FieldKind::Int32, v, out);
    assert(res && res.pos() == 4);
    assert(std::get<std::int32_t>(v) == -2);

    res = DecodeValue(FieldKind::Utf8String, v, std::span(out).subspan(4));
    assert(res && res.pos() == 3);
    assert(std::get<std::string>(v) == "hi");

    res = DecodeValue(FieldKind::Int32, v, out, DecodeOptions{false, true});
    assert(!res && res.error() == BitPackError::EXCESS_DATA);

    res = DecodeValue(FieldKind::Map, v, out);
    assert(!res && res.error() == BitPackError::UNSUPPORTED_FIELD_KIND);

    assert(kind_of(FieldValue{char16_t{1}}) == FieldKind::Char16);
    assert(kind_of(default_value_for(FieldKind::Float64)) == FieldKind::Float64);
}

int main() {
    record_round_trip_tests();
    record_layout_tests();
    record_rejection_tests();
    value_tests();
    std::cout << "record tests passed" << std::endl;
    return 0;
}
