/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <seastar/core/shared_ptr.hh>
#include <seastar/core/temporary_buffer.hh>

#include "store/remote_store.hh"
#include "transfer/chunk_uploader.hh"
#include "transfer/compression.hh"
#include "transfer/config.hh"
#include "transfer/file_record.hh"
#include "transfer/result.hh"
#include "transfer/retry_strategy.hh"
#include "transfer/session_registry.hh"

namespace transfer {

struct upload_source {
    std::string file_name;
    std::string mime_type;  // guessed from the name when empty
    temporary_buffer<char> data;
};

future<upload_source> read_upload_source(std::filesystem::path path);

using compress_func = noncopyable_function<future<compression_outcome>(const temporary_buffer<char>&, int level)>;

// Drives one file through compression, chunking and chunk upload. Chunks of
// a file go out strictly one after another, as do files in upload_all().
// A failed compression is not fatal: the original bytes are sent and the
// session carries a warning.
class uploader {
    store::remote_store& _store;
    session_registry& _sessions;
    transfer_config_ptr _cfg;
    linear_retry_strategy _retry;
    chunk_uploader _chunks;
    compress_func _compress;

    future<file_record> do_upload(transfer_session& session, upload_source src);
public:
    uploader(store::remote_store& store, session_registry& sessions, transfer_config_ptr cfg, compress_func compress = gzip_compress);

    // Registers the session ahead of the upload so callers can watch its
    // events or cancel it from the start.
    lw_shared_ptr<transfer_session> prepare(const upload_source& src);

    future<result<file_record>> upload(upload_source src);
    future<result<file_record>> upload(lw_shared_ptr<transfer_session> session, upload_source src);
    future<std::vector<result<file_record>>> upload_all(std::vector<upload_source> sources);
    future<result<file_record>> upload_file(std::filesystem::path path);
};

} // namespace transfer
