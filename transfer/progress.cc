/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/progress.hh"

#include <algorithm>
#include <stdexcept>

namespace transfer {

std::string_view to_string(unit_status s) noexcept {
    switch (s) {
    case unit_status::pending: return "pending";
    case unit_status::in_progress: return "in_progress";
    case unit_status::completed: return "completed";
    case unit_status::failed: return "failed";
    case unit_status::retrying: return "retrying";
    }
    return "unknown";
}

std::string_view to_string(session_status s) noexcept {
    switch (s) {
    case session_status::idle: return "idle";
    case session_status::compressing: return "compressing";
    case session_status::uploading: return "uploading";
    case session_status::downloading: return "downloading";
    case session_status::completed: return "completed";
    case session_status::error: return "error";
    case session_status::paused: return "paused";
    }
    return "unknown";
}

std::string_view to_string(session_kind k) noexcept {
    return k == session_kind::upload ? "upload" : "download";
}

void transfer_unit::start(clock_type::time_point now) {
    status = unit_status::in_progress;
    if (!started_at) {
        started_at = now;
    }
}

void transfer_unit::advance(uint64_t bytes) noexcept {
    transferred_bytes = size_bytes ? std::min(size_bytes, transferred_bytes + bytes) : transferred_bytes + bytes;
}

void transfer_unit::retry(std::string error) {
    ++retry_count;
    status = unit_status::retrying;
    last_error = std::move(error);
}

void transfer_unit::fail(std::string error, clock_type::time_point now) {
    ++retry_count;
    status = unit_status::failed;
    last_error = std::move(error);
    finished_at = now;
}

void transfer_unit::complete(clock_type::time_point now) {
    status = unit_status::completed;
    transferred_bytes = size_bytes;
    finished_at = now;
}

rate_sampler::rate_sampler(std::chrono::milliseconds interval, clock_type::time_point started, uint64_t baseline)
    : _interval(interval)
    , _started(started)
    , _baseline(baseline)
{}

bool rate_sampler::maybe_sample(clock_type::time_point now, uint64_t transferred, uint64_t total, bool force) {
    auto since = _last_sample.value_or(_started);
    if (!force && now - since < _interval) {
        return false;
    }
    auto elapsed = std::chrono::duration<double>(now - _started).count();
    if (elapsed <= 0) {
        return false;
    }
    auto moved = transferred > _baseline ? transferred - _baseline : 0;
    _speed = double(moved) / elapsed;
    auto remaining = total > transferred ? total - transferred : 0;
    _eta = _speed > 0 ? double(remaining) / _speed : 0;
    _last_sample = now;
    return true;
}

double progress_event::fraction() const noexcept {
    if (total_bytes == 0) {
        return status == session_status::completed ? 1.0 : 0.0;
    }
    return std::clamp(double(transferred_bytes) / double(total_bytes), 0.0, 1.0);
}

progress_channel::progress_channel(size_t capacity)
    : _queue(std::max<size_t>(capacity, 1))
{}

void progress_channel::push_dropping_oldest(std::optional<progress_event> ev) {
    if (_queue.full()) {
        _queue.pop();
        ++_dropped;
    }
    _queue.push(std::move(ev));
}

void progress_channel::publish(progress_event ev) {
    if (_closed) {
        return;
    }
    push_dropping_oldest(std::move(ev));
}

void progress_channel::close() {
    if (_closed) {
        return;
    }
    _closed = true;
    push_dropping_oldest(std::nullopt);
}

void progress_channel::reopen() {
    if (!_closed) {
        return;
    }
    while (!_queue.empty()) {
        _queue.pop();
    }
    _closed = false;
}

future<std::optional<progress_event>> progress_channel::next() {
    if (_closed && _queue.empty()) {
        return make_ready_future<std::optional<progress_event>>(std::nullopt);
    }
    return _queue.pop_eventually();
}

transfer_session::transfer_session(std::string id, session_kind kind, std::string file_name, size_t channel_capacity)
    : _id(std::move(id))
    , _kind(kind)
    , _file_name(std::move(file_name))
    , _events(channel_capacity)
{}

double transfer_session::fraction() const noexcept {
    if (_total_bytes == 0) {
        return _status == session_status::completed ? 1.0 : 0.0;
    }
    return std::clamp(double(_transferred_bytes) / double(_total_bytes), 0.0, 1.0);
}

bool transfer_session::terminal() const noexcept {
    return _status == session_status::completed || _status == session_status::error;
}

transfer_unit& transfer_session::unit(unsigned index) {
    if (index >= _units.size()) {
        throw std::out_of_range(fmt::format("session {} has no unit {}", _id, index));
    }
    return _units[index];
}

void transfer_session::set_units(std::vector<transfer_unit> units) {
    _units = std::move(units);
}

void transfer_session::add_transferred(uint64_t delta) noexcept {
    _transferred_bytes += delta;
}

void transfer_session::update_rate(const rate_sampler& sampler) noexcept {
    _speed = sampler.speed();
    _eta = sampler.eta();
}

void transfer_session::set_status(session_status status, std::string message) {
    _status = status;
    _message = std::move(message);
}

void transfer_session::reset() {
    _transferred_bytes = 0;
    _speed = 0;
    _eta = 0;
    for (auto& u : _units) {
        u = transfer_unit{.index = u.index, .size_bytes = u.size_bytes};
    }
    _status = session_status::idle;
    _message.clear();
    _warning.reset();
}

abort_source& transfer_session::arm() {
    _as.emplace();
    return *_as;
}

void transfer_session::cancel() noexcept {
    if (_as && !_as->abort_requested()) {
        _as->request_abort();
    }
}

progress_event transfer_session::snapshot(std::optional<unsigned> unit_index) const {
    progress_event ev{
        .session_id = _id,
        .kind = _kind,
        .status = _status,
        .transferred_bytes = _transferred_bytes,
        .total_bytes = _total_bytes,
        .speed_bytes_per_sec = _speed,
        .eta_seconds = _eta,
        .message = _message,
        .warning = _warning,
    };
    if (unit_index && *unit_index < _units.size()) {
        const auto& u = _units[*unit_index];
        ev.unit_index = u.index;
        ev.unit_state = u.status;
        ev.unit_retry_count = u.retry_count;
    }
    return ev;
}

void transfer_session::notify(std::optional<unsigned> unit_index) {
    _events.publish(snapshot(unit_index));
}

} // namespace transfer
