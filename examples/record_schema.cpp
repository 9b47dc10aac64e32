// Encoding records described by a schema built at runtime
// Compile: g++ -std=c++23 -I../include record_schema.cpp -o record_schema

#include <BitPacked/error_formatting.hpp>
#include <BitPacked/record.hpp>
#include <iostream>
#include <string>
#include <vector>

using namespace BitPacked;

int main() {
    std::vector<FieldSpec> specs{
        {FieldKind::Utf8String, {},                           "station"},
        {FieldKind::Bool,       {},                           "online"},
        {FieldKind::Int64,      {FieldAnnotation::VarUInt},   "drift"},
        {FieldKind::Float32,    {},                           "temperature"},
        {FieldKind::Bool,       {},                           "calibrated"},
    };
    const StructureSchema schema = ResolveSchema(specs, "Sample");

    Record sample{std::string("north-7"), true, std::int64_t{-3}, 21.5f, false};

    std::vector<std::uint8_t> bytes;
    auto encoded = EncodeRecord(schema, sample, bytes);
    std::cout << EncodeResultToString(encoded, &schema) << std::endl;
    if (!encoded) {
        return 1;
    }

    Record decoded;
    auto result = DecodeRecord(schema, decoded, bytes, DecodeOptions{true, true});
    std::cout << DecodeResultToString(result, &schema) << std::endl;
    if (!result) {
        return 1;
    }
    for (std::size_t i = 0; i < decoded.size(); ++i) {
        std::cout << schema.field(i)->name << ": " << kind_to_string(kind_of(decoded[i])) << std::endl;
    }

    // Wrong kind for "drift"
    sample[2] = std::int32_t{-3};
    encoded = EncodeRecord(schema, sample, bytes);
    std::cout << EncodeResultToString(encoded, &schema) << std::endl;

    return 0;
}
