/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <seastar/core/units.hh>

#include "store/remote_store.hh"
#include "transfer/errors.hh"

namespace tests {

// In-memory remote_store with scripted failures, for driving the transfer
// engine without a network.
class fake_remote_store : public store::remote_store {
public:
    // Thrown, in order, by the next upload_chunk calls.
    std::deque<transfer::transfer_error> chunk_failures;
    // Answer the last chunk without assembling the file.
    bool skip_completion = false;
    // Answer ranged reads with the whole object, as a server without range support would.
    bool ignore_ranges = false;
    size_t fragment_size = 64 * 1024;
    // The next get_object stops after this many bytes and waits for its abort source.
    std::optional<uint64_t> stall_after;
    // Total bytes get_object reports, when it should differ from the stored object.
    std::optional<uint64_t> truncate_body_at;

    unsigned chunk_calls = 0;
    unsigned metadata_calls = 0;
    unsigned delete_calls = 0;
    std::vector<store::chunk_request> accepted_chunks;
    std::vector<std::optional<uint64_t>> requested_offsets;

    std::map<std::string, seastar::temporary_buffer<char>> objects;   // by locator
    std::map<std::string, transfer::file_record> records;              // by id

    // Stores the bytes and a record for them, returning the record.
    transfer::file_record add_file(std::string id, std::string name, seastar::temporary_buffer<char> data,
            bool compressed = false, uint64_t original_size = 0,
            std::chrono::system_clock::time_point uploaded_at = std::chrono::system_clock::now());

    seastar::future<store::chunk_ack> upload_chunk(const store::chunk_request& req, seastar::temporary_buffer<char> bytes,
            seastar::abort_source* as = nullptr) override;
    seastar::future<> get_object(std::string locator, std::optional<uint64_t> offset, store::object_handler handler,
            seastar::abort_source* as = nullptr) override;
    seastar::future<transfer::file_record> get_metadata(std::string file_id, seastar::abort_source* as = nullptr) override;
    seastar::future<> delete_file(std::string file_id, seastar::abort_source* as = nullptr) override;

private:
    std::map<std::string, std::vector<seastar::temporary_buffer<char>>> _chunks;
};

} // namespace tests
