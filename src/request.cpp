// SPDX-License-Identifier: MIT

// src/request.cpp
#include "src/request.hpp"

#include <string>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace wme_pipe {

namespace {

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void WriteString(JsonWriter& w, const std::string& s) {
    w.String(s.data(), static_cast<rapidjson::SizeType>(s.size()));
}

// JSON object keys are strings; partitions go out as decimal text.
void WriteIntKey(JsonWriter& w, int key) {
    WriteString(w, std::to_string(key));
}

}  // namespace

std::string Request::ToJson() const {
    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);

    w.StartObject();
    if (since) {
        w.Key("since");
        WriteString(w, *since);
    }
    if (!fields.empty()) {
        w.Key("fields");
        w.StartArray();
        for (const auto& f : fields) WriteString(w, f);
        w.EndArray();
    }
    if (!filters.empty()) {
        w.Key("filters");
        w.StartArray();
        for (const auto& f : filters) {
            w.StartObject();
            w.Key("field");
            WriteString(w, f.field);
            w.Key("value");
            WriteString(w, f.value);
            w.EndObject();
        }
        w.EndArray();
    }
    if (limit) {
        w.Key("limit");
        w.Int64(*limit);
    }
    if (!parts.empty()) {
        w.Key("parts");
        w.StartArray();
        for (int p : parts) w.Int(p);
        w.EndArray();
    }
    if (!offsets.empty()) {
        w.Key("offsets");
        w.StartObject();
        for (const auto& [partition, offset] : offsets) {
            WriteIntKey(w, partition);
            w.Int64(offset);
        }
        w.EndObject();
    }
    if (!since_per_partition.empty()) {
        w.Key("since_per_partition");
        w.StartObject();
        for (const auto& [partition, ts] : since_per_partition) {
            WriteIntKey(w, partition);
            WriteString(w, ts);
        }
        w.EndObject();
    }
    w.EndObject();

    return std::string(buffer.GetString(), buffer.GetSize());
}

}  // namespace wme_pipe
