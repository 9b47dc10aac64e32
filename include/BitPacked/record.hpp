#pragma once

#include <cstdint>
#include <vector>

#include "decoder.hpp"
#include "encoder.hpp"
#include "field_value.hpp"
#include "io.hpp"
#include "result.hpp"
#include "schema.hpp"

namespace BitPacked {

namespace record_details {

inline EncodeResult encodeResult(const StructureEncoder & enc) {
    if (enc.getError() == BitPackError::NO_ERROR) {
        return EncodeResult(BitPackError::NO_ERROR, NO_FIELD_POSITION, enc.bytesWritten());
    }
    return EncodeResult(enc.getError(), enc.errorField(), enc.bytesWritten());
}

inline DecodeResult decodeResult(const StructureDecoder & dec) {
    if (dec.getError() == BitPackError::NO_ERROR) {
        return DecodeResult(BitPackError::NO_ERROR, NO_FIELD_POSITION, dec.pos());
    }
    return DecodeResult(dec.getError(), dec.errorField(), dec.errorPos());
}

} // namespace record_details


// Appends one structure to `out`. On failure `out` is left as it was.
inline EncodeResult EncodeRecord(const StructureSchema & schema, const Record & record, std::vector<std::uint8_t> & out) {
    const std::size_t start = out.size();
    StructureEncoder enc(out);
    if (record.size() != schema.size()) {
        return EncodeResult(BitPackError::FIELD_COUNT_MISMATCH, NO_FIELD_POSITION, 0);
    }
    bool ok = enc.begin_structure(schema);
    for (std::size_t i = 0; ok && i < record.size(); ++i) {
        ok = enc.encode_element(i, record[i]);
    }
    ok = ok && enc.end_structure();
    auto res = record_details::encodeResult(enc);
    if (!ok) {
        out.resize(start);
    }
    return res;
}

// `record` is resized to the schema and filled in declaration order.
inline DecodeResult DecodeRecord(const StructureSchema & schema, Record & record, ByteSpan in, DecodeOptions options = {}) {
    StructureDecoder dec(in, options);
    record.clear();
    bool ok = dec.begin_structure(schema);
    for (std::size_t i = 0; ok && i < schema.size(); ++i) {
        FieldValue v;
        ok = dec.decode_element(i, v);
        if (ok) {
            record.push_back(std::move(v));
        }
    }
    ok = ok && dec.end_structure();
    ok = ok && dec.finish();
    return record_details::decodeResult(dec);
}

inline EncodeResult EncodeValue(const FieldValue & value, std::vector<std::uint8_t> & out) {
    StructureEncoder enc(out);
    enc.encode_value(value);
    return record_details::encodeResult(enc);
}

inline DecodeResult DecodeValue(FieldKind kind, FieldValue & value, ByteSpan in, DecodeOptions options = {}) {
    StructureDecoder dec(in, options);
    if (dec.decode_value(kind, value)) {
        dec.finish();
    }
    return record_details::decodeResult(dec);
}

} // namespace BitPacked
