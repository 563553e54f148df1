/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/format.h>
#include <seastar/core/abort_source.hh>
#include <seastar/core/queue.hh>

#include "transfer/result.hh"

namespace transfer {

using namespace seastar;
using clock_type = std::chrono::steady_clock;

enum class unit_status { pending, in_progress, completed, failed, retrying };
enum class session_status { idle, compressing, uploading, downloading, completed, error, paused };
enum class session_kind { upload, download };

std::string_view to_string(unit_status s) noexcept;
std::string_view to_string(session_status s) noexcept;
std::string_view to_string(session_kind k) noexcept;

// One chunk of an upload, or the single body of a download.
struct transfer_unit {
    unsigned index = 0;
    unit_status status = unit_status::pending;
    uint64_t size_bytes = 0;
    uint64_t transferred_bytes = 0;
    unsigned retry_count = 0;
    std::optional<std::string> last_error;
    std::optional<clock_type::time_point> started_at;
    std::optional<clock_type::time_point> finished_at;

    void start(clock_type::time_point now);
    void advance(uint64_t bytes) noexcept;
    // Counts a failed attempt that will be retried.
    void retry(std::string error);
    // Counts the failed attempt that ends the unit.
    void fail(std::string error, clock_type::time_point now);
    void complete(clock_type::time_point now);
};

// Throughput is bytes moved since the session started divided by elapsed
// wall time, recomputed at most once per interval. Bytes held before the
// session started (a resumed download) are not counted as moved.
class rate_sampler {
    std::chrono::milliseconds _interval;
    clock_type::time_point _started;
    std::optional<clock_type::time_point> _last_sample;
    uint64_t _baseline;
    double _speed = 0;
    double _eta = 0;
public:
    rate_sampler(std::chrono::milliseconds interval, clock_type::time_point started, uint64_t baseline = 0);

    // Returns true when a new sample was taken. `force` ignores the interval.
    bool maybe_sample(clock_type::time_point now, uint64_t transferred, uint64_t total, bool force = false);

    double speed() const noexcept { return _speed; }
    double eta() const noexcept { return _eta; }
};

struct progress_event {
    std::string session_id;
    session_kind kind = session_kind::upload;
    session_status status = session_status::idle;
    std::optional<unsigned> unit_index;
    std::optional<unit_status> unit_state;
    unsigned unit_retry_count = 0;
    uint64_t transferred_bytes = 0;
    uint64_t total_bytes = 0;
    double speed_bytes_per_sec = 0;
    double eta_seconds = 0;
    std::string message;
    // A problem the transfer worked around, e.g. a failed compression.
    std::optional<transfer_failure> warning;

    double fraction() const noexcept;
};

// Bounded single-consumer event stream. Publishing never blocks the transfer:
// when the consumer lags the oldest pending event is dropped. A disengaged
// optional marks the end of the stream.
class progress_channel {
    queue<std::optional<progress_event>> _queue;
    bool _closed = false;
    size_t _dropped = 0;

    void push_dropping_oldest(std::optional<progress_event> ev);
public:
    explicit progress_channel(size_t capacity);

    void publish(progress_event ev);
    void close();
    // Starts a new stream after close(). Events still pending are discarded.
    void reopen();
    future<std::optional<progress_event>> next();

    bool closed() const noexcept { return _closed; }
    size_t dropped() const noexcept { return _dropped; }
};

// Aggregate state of one upload or download. Transferred bytes only move
// forward, except through reset().
class transfer_session {
    std::string _id;
    session_kind _kind;
    std::string _file_name;
    std::vector<transfer_unit> _units;
    uint64_t _total_bytes = 0;
    uint64_t _transferred_bytes = 0;
    double _speed = 0;
    double _eta = 0;
    double _compression_ratio = 0;
    session_status _status = session_status::idle;
    std::string _message;
    std::optional<transfer_failure> _warning;
    progress_channel _events;
    std::optional<abort_source> _as;
public:
    transfer_session(std::string id, session_kind kind, std::string file_name, size_t channel_capacity);
    transfer_session(const transfer_session&) = delete;

    const std::string& id() const noexcept { return _id; }
    session_kind kind() const noexcept { return _kind; }
    const std::string& file_name() const noexcept { return _file_name; }
    session_status status() const noexcept { return _status; }
    const std::string& message() const noexcept { return _message; }
    const std::optional<transfer_failure>& warning() const noexcept { return _warning; }
    uint64_t total_bytes() const noexcept { return _total_bytes; }
    uint64_t transferred_bytes() const noexcept { return _transferred_bytes; }
    double speed() const noexcept { return _speed; }
    double eta() const noexcept { return _eta; }
    double compression_ratio() const noexcept { return _compression_ratio; }
    double fraction() const noexcept;
    bool terminal() const noexcept;

    const std::vector<transfer_unit>& units() const noexcept { return _units; }
    transfer_unit& unit(unsigned index);
    void set_units(std::vector<transfer_unit> units);

    void set_total_bytes(uint64_t total) noexcept { _total_bytes = total; }
    void set_compression_ratio(double ratio) noexcept { _compression_ratio = ratio; }
    void add_transferred(uint64_t delta) noexcept;
    void update_rate(const rate_sampler& sampler) noexcept;
    void set_status(session_status status, std::string message = {});
    void set_warning(transfer_failure warning) { _warning = std::move(warning); }
    void reset();

    // A fresh abort source for the next run. Previous cancellations do not carry over.
    abort_source& arm();
    abort_source* current_abort_source() noexcept { return _as ? &*_as : nullptr; }
    void cancel() noexcept;
    bool cancel_requested() const noexcept { return _as && _as->abort_requested(); }

    progress_event snapshot(std::optional<unsigned> unit_index = std::nullopt) const;
    // Publishes a snapshot to the channel.
    void notify(std::optional<unsigned> unit_index = std::nullopt);
    progress_channel& events() noexcept { return _events; }
};

} // namespace transfer

template <>
struct fmt::formatter<transfer::session_status> : fmt::formatter<std::string_view> {
    auto format(transfer::session_status s, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(transfer::to_string(s), ctx);
    }
};

template <>
struct fmt::formatter<transfer::unit_status> : fmt::formatter<std::string_view> {
    auto format(transfer::unit_status s, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(transfer::to_string(s), ctx);
    }
};
