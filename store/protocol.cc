/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "store/protocol.hh"

#include <charconv>
#include <memory>

#include <json/json.h>

#include "transfer/errors.hh"

namespace store {

using transfer::error_kind;
using transfer::transfer_error;

template <typename T>
static std::optional<T> parse_number(std::string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || ptr != s.data() + s.size() || s.empty()) {
        return std::nullopt;
    }
    return value;
}

static const seastar::sstring& require_param(const query_parameters& params, const char* name) {
    auto it = params.find(name);
    if (it == params.end() || it->second.empty()) {
        throw transfer_error(error_kind::remote_rejected, fmt::format("missing query parameter {}", name));
    }
    return it->second;
}

template <typename T>
static T require_number(const query_parameters& params, const char* name) {
    const auto& raw = require_param(params, name);
    auto value = parse_number<T>(std::string_view(raw.data(), raw.size()));
    if (!value) {
        throw transfer_error(error_kind::remote_rejected, fmt::format("malformed query parameter {}={}", name, raw));
    }
    return *value;
}

static seastar::sstring to_sstring(std::string_view s) {
    return seastar::sstring(s.data(), s.size());
}

void encode_chunk_request(const chunk_request& req, query_parameters& params) {
    params["chunkIndex"] = to_sstring(fmt::to_string(req.chunk_index));
    params["totalChunks"] = to_sstring(fmt::to_string(req.total_chunks));
    params["fileName"] = to_sstring(req.original_file_name);
    params["originalSize"] = to_sstring(fmt::to_string(req.original_size));
    params["compressed"] = req.compressed ? "true" : "false";
    params["compressionRatio"] = to_sstring(fmt::format("{:.2f}", req.compression_ratio));
}

chunk_request decode_chunk_request(std::string_view session_id, const query_parameters& params) {
    chunk_request req;
    req.session_id = std::string(session_id);
    req.chunk_index = require_number<unsigned>(params, "chunkIndex");
    req.total_chunks = require_number<unsigned>(params, "totalChunks");
    req.original_file_name = std::string(require_param(params, "fileName"));
    req.original_size = require_number<uint64_t>(params, "originalSize");
    auto compressed = params.find("compressed");
    req.compressed = compressed != params.end() && compressed->second == "true";
    auto ratio = params.find("compressionRatio");
    if (ratio != params.end() && !ratio->second.empty()) {
        try {
            req.compression_ratio = std::stod(std::string(ratio->second));
        } catch (const std::logic_error&) {
            throw transfer_error(error_kind::remote_rejected, fmt::format("malformed query parameter compressionRatio={}", ratio->second));
        }
    }
    if (req.total_chunks == 0 || req.chunk_index >= req.total_chunks) {
        throw transfer_error(error_kind::remote_rejected,
                fmt::format("chunk index {} out of range for {} chunks", req.chunk_index, req.total_chunks));
    }
    return req;
}

std::string dump_chunk_ack(const chunk_ack& ack) {
    Json::Value v(Json::objectValue);
    v["success"] = ack.accepted;
    v["chunkIndex"] = ack.chunk_index;
    v["totalChunks"] = ack.total_chunks;
    v["completed"] = ack.completed;
    if (ack.download_locator) {
        v["downloadUrl"] = *ack.download_locator;
    }
    if (ack.record) {
        v["record"] = transfer::to_json(*ack.record);
    }
    if (ack.error) {
        v["error"] = *ack.error;
    }
    return transfer::dump_json(v);
}

chunk_ack parse_chunk_ack(std::string_view body) {
    auto v = transfer::parse_json(body);
    if (!v.isObject() || !v["success"].isBool()) {
        throw transfer_error(error_kind::remote_rejected, "malformed chunk acknowledgement");
    }
    chunk_ack ack;
    ack.accepted = v["success"].asBool();
    ack.chunk_index = v.get("chunkIndex", 0).asUInt();
    ack.total_chunks = v.get("totalChunks", 0).asUInt();
    ack.completed = v.get("completed", false).asBool();
    if (v["downloadUrl"].isString()) {
        ack.download_locator = v["downloadUrl"].asString();
    }
    if (v["record"].isObject()) {
        ack.record = transfer::file_record_from_json(v["record"]);
    }
    if (v["error"].isString()) {
        ack.error = v["error"].asString();
    }
    return ack;
}

std::string dump_error(std::string_view message, std::string_view kind) {
    Json::Value v(Json::objectValue);
    v["error"] = std::string(message);
    v["kind"] = std::string(kind);
    return transfer::dump_json(v);
}

std::optional<std::string> parse_error(std::string_view body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value v;
    if (!reader->parse(body.data(), body.data() + body.size(), &v, nullptr) || !v.isObject() || !v["error"].isString()) {
        return std::nullopt;
    }
    return v["error"].asString();
}

std::string upload_path(std::string_view session_id) {
    return fmt::format("/upload/{}", session_id);
}

std::string object_path(std::string_view file_id) {
    return fmt::format("/files/{}", file_id);
}

std::string metadata_path(std::string_view file_id) {
    return fmt::format("/metadata/{}", file_id);
}

std::optional<byte_range> parse_range_header(std::string_view value) {
    static constexpr std::string_view prefix = "bytes=";
    if (!value.starts_with(prefix)) {
        return std::nullopt;
    }
    value.remove_prefix(prefix.size());
    auto dash = value.find('-');
    if (dash == std::string_view::npos) {
        return std::nullopt;
    }
    auto first = parse_number<uint64_t>(value.substr(0, dash));
    if (!first) {
        return std::nullopt;
    }
    auto tail = value.substr(dash + 1);
    if (tail.empty()) {
        return byte_range{*first, std::nullopt};
    }
    auto last = parse_number<uint64_t>(tail);
    if (!last || *last < *first) {
        return std::nullopt;
    }
    return byte_range{*first, *last};
}

std::optional<content_range> parse_content_range(std::string_view value) {
    static constexpr std::string_view prefix = "bytes ";
    if (!value.starts_with(prefix)) {
        return std::nullopt;
    }
    value.remove_prefix(prefix.size());
    auto dash = value.find('-');
    auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || slash < dash) {
        return std::nullopt;
    }
    auto first = parse_number<uint64_t>(value.substr(0, dash));
    auto last = parse_number<uint64_t>(value.substr(dash + 1, slash - dash - 1));
    auto total = parse_number<uint64_t>(value.substr(slash + 1));
    if (!first || !last || !total || *last < *first) {
        return std::nullopt;
    }
    return content_range{*first, *last, *total};
}

std::string format_content_range(const content_range& range) {
    return fmt::format("bytes {}-{}/{}", range.first, range.last, range.total);
}

} // namespace store
