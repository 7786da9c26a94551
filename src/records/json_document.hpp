#pragma once

#include "codec/codec_types.hpp"
#include "json_config.hpp"

#include <string>

namespace knxbridge::records::detail {

using RecordDocument = StaticJsonDocument<384>;

// Keys any record reads. Everything else is skipped while parsing and takes
// no room in the record document.
inline const StaticJsonDocument<256> &record_key_filter() {
    static const StaticJsonDocument<256> filter = []() {
        StaticJsonDocument<256> doc;
        doc["address"] = true;
        doc["group_address"] = true;
        doc["is_on"] = true;
        doc["celsius"] = true;
        doc["timestamp"] = true;
        return doc;
    }();
    return filter;
}

// Parses a flat JSON object. Anything else (empty input, arrays, scalars,
// syntax errors, oversize known values) is Malformed.
inline codec::DecodeError parse_object(const codec::Bytes &payload, RecordDocument &doc,
                                       JsonObjectConst &obj) {
    if (payload.empty()) {
        return codec::DecodeError::Malformed;
    }
    DeserializationError err =
        deserializeJson(doc, reinterpret_cast<const char *>(payload.data()), payload.size(),
                        DeserializationOption::Filter(record_key_filter()));
    if (err) {
        return codec::DecodeError::Malformed;
    }
    if (!doc.is<JsonObject>()) {
        return codec::DecodeError::Malformed;
    }
    obj = doc.as<JsonObjectConst>();
    return codec::DecodeError::None;
}

// "group_address" is accepted as an alias of "address".
inline bool read_address(JsonObjectConst obj, std::string &out) {
    JsonVariantConst value = obj["address"];
    if (!value.is<const char *>()) {
        value = obj["group_address"];
    }
    if (!value.is<const char *>()) {
        out.clear();
        return false;
    }
    out = value.as<const char *>();
    return true;
}

inline codec::EncodeError write_payload(const RecordDocument &doc, codec::Bytes &out) {
    if (doc.overflowed()) {
        return codec::EncodeError::NoMemory;
    }
    std::string payload;
    serializeJson(doc, payload);
    out.assign(payload.begin(), payload.end());
    return codec::EncodeError::None;
}

} // namespace knxbridge::records::detail
