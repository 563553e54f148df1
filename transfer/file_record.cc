/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/file_record.hh"

#include <memory>

#include <json/json.h>

#include "transfer/errors.hh"
#include "utils/clocks.hh"

namespace transfer {

static const Json::Value& require(const Json::Value& value, const char* key, bool (Json::Value::*is_type)() const) {
    const auto& member = value[key];
    if (!(member.*is_type)()) {
        throw transfer_error(error_kind::remote_rejected, fmt::format("file record: missing or malformed '{}'", key));
    }
    return member;
}

Json::Value to_json(const file_record& record) {
    Json::Value v(Json::objectValue);
    v["id"] = record.id;
    v["originalName"] = record.original_name;
    v["size"] = Json::UInt64(record.size);
    v["originalSize"] = Json::UInt64(record.original_size);
    v["compressed"] = record.compressed;
    v["compressionRatio"] = record.compression_ratio;
    v["uploadedAt"] = utils::timepoint_to_iso8601ts(record.uploaded_at);
    v["blobUrl"] = record.blob_locator;
    return v;
}

file_record file_record_from_json(const Json::Value& value) {
    if (!value.isObject()) {
        throw transfer_error(error_kind::remote_rejected, "file record: expected a JSON object");
    }
    file_record r;
    r.id = require(value, "id", &Json::Value::isString).asString();
    r.original_name = require(value, "originalName", &Json::Value::isString).asString();
    r.size = require(value, "size", &Json::Value::isUInt64).asUInt64();
    r.original_size = require(value, "originalSize", &Json::Value::isUInt64).asUInt64();
    r.compressed = require(value, "compressed", &Json::Value::isBool).asBool();
    r.compression_ratio = require(value, "compressionRatio", &Json::Value::isNumeric).asDouble();
    auto uploaded_at = require(value, "uploadedAt", &Json::Value::isString).asString();
    try {
        r.uploaded_at = utils::iso8601ts_to_timepoint(uploaded_at);
    } catch (const std::runtime_error& e) {
        throw transfer_error(error_kind::remote_rejected, fmt::format("file record: {}", e.what()));
    }
    r.blob_locator = require(value, "blobUrl", &Json::Value::isString).asString();
    return r;
}

std::string dump_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value parse_json(std::string_view body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        throw transfer_error(error_kind::remote_rejected, fmt::format("malformed JSON: {}", errors));
    }
    return root;
}

} // namespace transfer
