/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <string>

#include "assembler/blob_store.hh"
#include "store/protocol.hh"
#include "transfer/file_record.hh"
#include "transfer/retry_strategy.hh"

namespace assembler {

struct assembler_config {
    std::chrono::seconds retention{std::chrono::hours(24)};
    // Chunk reads during assembly retry with exponential backoff.
    unsigned fetch_attempts = 5;
    std::chrono::milliseconds fetch_base_delay{500};
};

// Collects the chunks of an upload session and, once the last one arrives,
// joins them into the stored file and its metadata record.
class chunk_assembler {
    blob_store& _blobs;
    assembler_config _cfg;
    transfer::exponential_retry_strategy _fetch_retry;

    future<temporary_buffer<char>> fetch_chunk(const std::string& session_id, unsigned index, unsigned total);
    future<transfer::file_record> assemble(const store::chunk_request& req, std::chrono::system_clock::time_point now);
    future<> drop_chunks(const std::string& session_id);
public:
    chunk_assembler(blob_store& blobs, assembler_config cfg = {});

    static std::string chunk_key(std::string_view session_id, unsigned index);
    static std::string object_key(const transfer::file_record& record);
    static std::string metadata_key(std::string_view file_id);

    const assembler_config& config() const noexcept { return _cfg; }

    // Throws transfer_error: remote_rejected for bad requests, incomplete_assembly
    // when a chunk is missing at assembly time.
    future<store::chunk_ack> accept_chunk(store::chunk_request req, temporary_buffer<char> bytes,
            std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Throws transfer_error(not_found) or transfer_error(expired).
    future<transfer::file_record> metadata(std::string file_id,
            std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // The record together with the stored bytes, same errors as metadata().
    future<std::pair<transfer::file_record, temporary_buffer<char>>> object(std::string file_id,
            std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

    // Removing a missing file is not an error.
    future<> remove(std::string file_id);
};

} // namespace assembler
