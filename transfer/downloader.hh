/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <seastar/core/shared_ptr.hh>

#include "store/remote_store.hh"
#include "transfer/config.hh"
#include "transfer/download_sink.hh"
#include "transfer/file_record.hh"
#include "transfer/result.hh"
#include "transfer/session_registry.hh"

namespace transfer {

// Looks the record up and rejects it once past retention, even when the
// store still serves it.
future<result<file_record>> fetch_record(store::remote_store& store, std::string file_id, std::chrono::seconds retention,
        std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

struct download_options {
    // Non-zero only when the sink already holds exactly this many bytes,
    // possibly from an earlier process.
    uint64_t resume_offset = 0;
    // Foreground downloads sample throughput more often.
    bool foreground = true;
};

// Streams one stored file into a sink. A cancelled download pauses and can
// be resumed from the bytes already held; restart() drops them.
class downloader {
    store::remote_store& _store;
    session_registry& _sessions;
    transfer_config_ptr _cfg;
    file_record _record;
    download_sink& _sink;
    lw_shared_ptr<transfer_session> _session;
    bool _foreground = true;

    future<> do_download(download_options opts);
public:
    downloader(store::remote_store& store, session_registry& sessions, transfer_config_ptr cfg, file_record record, download_sink& sink);

    lw_shared_ptr<transfer_session> session() const noexcept { return _session; }
    const file_record& record() const noexcept { return _record; }

    future<result<file_record>> download(download_options opts);
    future<result<file_record>> start(bool foreground = true);
    future<result<file_record>> resume();
    future<result<file_record>> restart();
    void cancel() noexcept;
};

} // namespace transfer
