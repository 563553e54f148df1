/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>
#include <string>

#include <seastar/core/abort_source.hh>
#include <seastar/core/future.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/http/reply.hh>
#include <seastar/util/noncopyable_function.hh>

#include "store/protocol.hh"

namespace store {

// What the object endpoint said about the body that follows.
struct object_reply {
    seastar::http::reply::status_type status = seastar::http::reply::status_type::ok;
    uint64_t content_length = 0;                // bytes in this reply
    std::optional<content_range> range;         // set for 206 replies
};

using object_handler = seastar::noncopyable_function<seastar::future<>(const object_reply&, seastar::input_stream<char>&&)>;

// Remote side of a transfer. Failures surface as transfer::transfer_error,
// or as transport exceptions that transfer::classify() understands.
class remote_store {
public:
    virtual ~remote_store() = default;

    virtual seastar::future<chunk_ack> upload_chunk(const chunk_request& req, seastar::temporary_buffer<char> bytes,
            seastar::abort_source* as = nullptr) = 0;

    // Streams the object, starting at `offset` when given. The handler sees
    // either a 206 reply for the requested suffix or a 200 with the whole object.
    virtual seastar::future<> get_object(std::string locator, std::optional<uint64_t> offset, object_handler handler,
            seastar::abort_source* as = nullptr) = 0;

    virtual seastar::future<transfer::file_record> get_metadata(std::string file_id, seastar::abort_source* as = nullptr) = 0;

    // Succeeds when the file is already gone.
    virtual seastar::future<> delete_file(std::string file_id, seastar::abort_source* as = nullptr) = 0;
};

} // namespace store
