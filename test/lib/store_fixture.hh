/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string>
#include <vector>

#include <seastar/core/shared_ptr.hh>

#include "assembler/blob_store.hh"
#include "assembler/chunk_assembler.hh"
#include "assembler/handlers.hh"
#include "store/client.hh"

namespace tests {

// An assembler served over HTTP on the loopback interface, with knobs to
// make the server misbehave.
class store_fixture {
public:
    // PUT requests left to answer with 503 before passing them on.
    unsigned fail_uploads = 0;
    // Strip the Range header, as a server without range support would.
    bool ignore_ranges = false;

    unsigned upload_requests = 0;
    std::vector<std::string> range_headers;

private:
    assembler::memory_blob_store _blobs;
    assembler::chunk_assembler _assembler;
    assembler::store_server _server;
    uint16_t _port;
    seastar::shared_ptr<store::client> _client;

public:
    explicit store_fixture(assembler::assembler_config cfg = {});

    seastar::future<> start();
    seastar::future<> stop();

    uint16_t port() const noexcept { return _port; }
    std::string url() const;
    store::client& client() { return *_client; }
    assembler::chunk_assembler& assembler() noexcept { return _assembler; }
    assembler::memory_blob_store& blobs() noexcept { return _blobs; }
};

} // namespace tests
