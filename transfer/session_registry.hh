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
#include <unordered_map>

#include <seastar/core/abort_source.hh>
#include <seastar/core/gate.hh>
#include <seastar/core/shared_ptr.hh>

#include "transfer/progress.hh"

namespace transfer {

// Random hex identifier, unique enough to name both sessions and stored files.
std::string make_session_id();

// Live sessions by id. Finished sessions stay visible for a grace period so
// observers can read the final state, then their channel is closed and they
// are dropped.
class session_registry {
    std::unordered_map<std::string, lw_shared_ptr<transfer_session>> _sessions;
    std::chrono::milliseconds _grace_period;
    size_t _channel_capacity;
    gate _gate;
    abort_source _as;

    void drop(const std::string& id);
public:
    session_registry(std::chrono::milliseconds grace_period, size_t channel_capacity);

    lw_shared_ptr<transfer_session> create(session_kind kind, std::string file_name, std::optional<std::string> id = std::nullopt);
    // Re-registers a session that was retired, e.g. a restarted download.
    void track(lw_shared_ptr<transfer_session> session);
    lw_shared_ptr<transfer_session> find(const std::string& id) const;

    // Removes the session right away, cancelling it if still running.
    void remove(const std::string& id);
    // Schedules removal after the grace period, unless the session becomes active again.
    void retire(const std::string& id);

    size_t size() const noexcept { return _sessions.size(); }
    future<> close();
};

} // namespace transfer
