// Basic BitPacked usage example
// Compile: g++ -std=c++23 -I../include basic_usage.cpp -o basic_usage

#include <BitPacked/error_formatting.hpp>
#include <BitPacked/parser.hpp>
#include <BitPacked/serializer.hpp>
#include <cstdio>
#include <iostream>
#include <vector>

using namespace BitPacked;

struct Payload {
    Annotated<std::int32_t, options::varint> id;
    Annotated<std::int32_t, options::varuint, options::varint> delta;
    bool flag1;
    bool flag2;
    bool flag3;
};

int main() {
    Payload payload{123, -2, true, false, true};

    std::vector<std::uint8_t> bytes;
    auto encoded = Encode(payload, bytes);
    if (!encoded) {
        std::cout << EncodeResultToString<Payload>(encoded) << std::endl;
        return 1;
    }

    std::cout << "Encoded " << bytes.size() << " bytes:";
    for (std::uint8_t b : bytes) {
        std::printf(" %02X", b);
    }
    std::cout << std::endl;

    Payload decoded{};
    auto result = Decode(decoded, bytes);
    if (!result) {
        std::cout << DecodeResultToString<Payload>(result) << std::endl;
        return 1;
    }

    std::cout << "Payload(id=" << decoded.id.value
              << ", delta=" << decoded.delta.value
              << ", flag1=" << decoded.flag1
              << ", flag2=" << decoded.flag2
              << ", flag3=" << decoded.flag3 << ")" << std::endl;

    // A truncated buffer is reported, not read past
    bytes.pop_back();
    result = Decode(decoded, bytes);
    std::cout << DecodeResultToString<Payload>(result) << std::endl;

    return 0;
}
