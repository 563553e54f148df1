/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/session_registry.hh"

#include <random>

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>

#include "transfer/log.hh"

namespace transfer {

std::string make_session_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("{:x}{:08x}", ms, uint32_t(rng()));
}

session_registry::session_registry(std::chrono::milliseconds grace_period, size_t channel_capacity)
    : _grace_period(grace_period)
    , _channel_capacity(channel_capacity)
{}

lw_shared_ptr<transfer_session> session_registry::create(session_kind kind, std::string file_name, std::optional<std::string> id) {
    auto session = make_lw_shared<transfer_session>(id ? std::move(*id) : make_session_id(), kind, std::move(file_name), _channel_capacity);
    if (!_sessions.emplace(session->id(), session).second) {
        throw std::invalid_argument(fmt::format("session {} already exists", session->id()));
    }
    xlog.debug("Registered {} session {} for {}", to_string(kind), session->id(), session->file_name());
    return session;
}

void session_registry::track(lw_shared_ptr<transfer_session> session) {
    // A session dropped earlier comes back with a fresh event stream
    session->events().reopen();
    auto id = session->id();
    _sessions[id] = std::move(session);
}

lw_shared_ptr<transfer_session> session_registry::find(const std::string& id) const {
    auto it = _sessions.find(id);
    return it == _sessions.end() ? nullptr : it->second;
}

void session_registry::drop(const std::string& id) {
    auto it = _sessions.find(id);
    if (it == _sessions.end()) {
        return;
    }
    it->second->events().close();
    _sessions.erase(it);
}

void session_registry::remove(const std::string& id) {
    if (auto s = find(id)) {
        s->cancel();
    }
    drop(id);
}

void session_registry::retire(const std::string& id) {
    auto session = find(id);
    if (!session) {
        return;
    }
    if (_gate.is_closed()) {
        drop(id);
        return;
    }
    // Fire and forget: the gate keeps the registry alive until the timer is done.
    std::ignore = seastar::sleep_abortable(_grace_period, _as).then([this, session] {
        auto current = find(session->id());
        if (current == session && session->terminal()) {
            drop(session->id());
        }
    }).handle_exception_type([] (const seastar::sleep_aborted&) {
    }).finally([gh = _gate.hold()] {});
}

future<> session_registry::close() {
    _as.request_abort();
    co_await _gate.close();
    for (auto& [id, session] : _sessions) {
        session->cancel();
        session->events().close();
    }
    _sessions.clear();
}

} // namespace transfer
