/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <seastar/core/sstring.hh>

#include "transfer/file_record.hh"

/*
 * Wire format shared by the client and the assembler.
 *
 *   PUT    /upload/<session>?chunkIndex=&totalChunks=&fileName=&originalSize=&compressed=&compressionRatio=
 *          body: raw chunk bytes, reply: chunk_ack as JSON
 *   GET    /files/<id>       object bytes, honours "Range: bytes=N-"
 *   GET    /metadata/<id>    file_record as JSON
 *   DELETE /files/<id>       204, also when already gone
 *
 * Errors come back as {"error": "...", "kind": "..."} with the status
 * mapped from the error kind.
 */
namespace store {

using query_parameters = std::unordered_map<seastar::sstring, seastar::sstring>;

struct chunk_request {
    std::string session_id;
    unsigned chunk_index = 0;
    unsigned total_chunks = 0;
    std::string original_file_name;
    uint64_t original_size = 0;
    bool compressed = false;
    double compression_ratio = 0;
};

struct chunk_ack {
    bool accepted = false;
    unsigned chunk_index = 0;
    unsigned total_chunks = 0;
    bool completed = false;
    std::optional<std::string> download_locator;
    std::optional<transfer::file_record> record;
    std::optional<std::string> error;
};

void encode_chunk_request(const chunk_request& req, query_parameters& params);
// Throws transfer_error(remote_rejected) on missing or malformed parameters.
chunk_request decode_chunk_request(std::string_view session_id, const query_parameters& params);

std::string dump_chunk_ack(const chunk_ack& ack);
chunk_ack parse_chunk_ack(std::string_view body);

std::string dump_error(std::string_view message, std::string_view kind);
// Extracts "error" from an error body, nullopt when it is not one.
std::optional<std::string> parse_error(std::string_view body);

std::string upload_path(std::string_view session_id);
std::string object_path(std::string_view file_id);
std::string metadata_path(std::string_view file_id);

struct byte_range {
    uint64_t first;
    std::optional<uint64_t> last;  // inclusive, open-ended when absent
};

// "bytes=N-" or "bytes=N-M"
std::optional<byte_range> parse_range_header(std::string_view value);

struct content_range {
    uint64_t first;
    uint64_t last;
    uint64_t total;
};

// "bytes N-M/T"
std::optional<content_range> parse_content_range(std::string_view value);
std::string format_content_range(const content_range& range);

} // namespace store
