/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/downloader.hh"

#include <seastar/core/coroutine.hh>

#include "transfer/log.hh"
#include "utils/clocks.hh"

namespace transfer {

future<result<file_record>> fetch_record(store::remote_store& store, std::string file_id, std::chrono::seconds retention,
        std::chrono::system_clock::time_point now) {
    std::exception_ptr ex;
    try {
        auto record = co_await store.get_metadata(file_id);
        if (record.expired(now, retention)) {
            xlog.info("File {} expired at {}", file_id, utils::timepoint_to_iso8601ts(record.expires_at(retention)));
            co_return transfer_failure{error_kind::expired,
                    fmt::format("file {} expired at {}", file_id, utils::timepoint_to_iso8601ts(record.expires_at(retention)))};
        }
        co_return record;
    } catch (...) {
        ex = std::current_exception();
    }
    auto err = classify(ex);
    xlog.debug("Fetching metadata of {} failed: {}", file_id, err.what());
    co_return transfer_failure::from(err);
}

downloader::downloader(store::remote_store& store, session_registry& sessions, transfer_config_ptr cfg, file_record record, download_sink& sink)
    : _store(store)
    , _sessions(sessions)
    , _cfg(std::move(cfg))
    , _record(std::move(record))
    , _sink(sink)
    , _session(_sessions.create(session_kind::download, _record.original_name))
{
    _session->set_total_bytes(_record.size);
    _session->set_units({transfer_unit{.index = 0, .size_bytes = _record.size}});
}

future<> downloader::do_download(download_options opts) {
    auto& session = *_session;
    auto& as = session.arm();
    const uint64_t offset = opts.resume_offset;

    co_await _sink.truncate(offset);
    session.set_status(session_status::downloading);
    session.unit(0).start(clock_type::now());
    session.notify(0);

    auto interval = opts.foreground ? _cfg->foreground_sample_interval : _cfg->background_sample_interval;
    rate_sampler sampler(interval, clock_type::now(), offset);

    // Everything is already here, a ranged request would only get a 416
    if (offset == 0 || offset < _record.size) {
        xlog.debug("Downloading {} ({}) from offset {}", _record.id, _record.original_name, offset);
        co_await _store.get_object(_record.blob_locator, offset > 0 ? std::optional<uint64_t>(offset) : std::nullopt,
                [&] (const store::object_reply& rep, input_stream<char>&& in_) -> future<> {
            auto in = std::move(in_);
            uint64_t skip = 0;
            uint64_t total;
            if (rep.range) {
                if (rep.range->first != offset) {
                    throw transfer_error(error_kind::remote_rejected,
                            fmt::format("asked for bytes from {}, got a range from {}", offset, rep.range->first));
                }
                total = rep.range->total;
            } else {
                // The range was ignored and the whole object follows
                skip = offset;
                total = rep.content_length;
            }
            session.set_total_bytes(total);
            session.unit(0).size_bytes = total;
            session.notify(0);

            while (auto buf = co_await in.read()) {
                if (skip) {
                    auto n = std::min<uint64_t>(skip, buf.size());
                    buf.trim_front(n);
                    skip -= n;
                    if (buf.empty()) {
                        continue;
                    }
                }
                auto n = buf.size();
                co_await _sink.put(std::move(buf));
                session.add_transferred(n);
                session.unit(0).advance(n);
                if (sampler.maybe_sample(clock_type::now(), session.transferred_bytes(), total)) {
                    session.update_rate(sampler);
                    session.notify(0);
                }
            }
            if (session.transferred_bytes() < total) {
                throw transfer_error(error_kind::transient_network,
                        fmt::format("connection closed after {} of {} bytes", session.transferred_bytes(), total));
            }
        }, &as);
    }

    if (sampler.maybe_sample(clock_type::now(), session.transferred_bytes(), session.total_bytes(), true)) {
        session.update_rate(sampler);
    }
    as.check();
    co_await _sink.finalize(_record.compressed);
    session.unit(0).complete(clock_type::now());
}

future<result<file_record>> downloader::download(download_options opts) {
    _foreground = opts.foreground;
    const uint64_t held = _sink.size();
    if (opts.resume_offset != 0 && (opts.resume_offset != held || opts.resume_offset > _record.size)) {
        co_return transfer_failure{error_kind::local_io,
                fmt::format("cannot resume {} from {}, the sink holds {} of {} bytes", _record.id, opts.resume_offset, held, _record.size)};
    }
    if (opts.resume_offset != _session->transferred_bytes()) {
        // Bytes left behind by an earlier run count as already transferred
        _session->reset();
        _session->add_transferred(opts.resume_offset);
        _session->unit(0).advance(opts.resume_offset);
    }
    _sessions.track(_session);

    std::exception_ptr ex;
    try {
        co_await do_download(opts);
        _session->set_status(session_status::completed);
        _session->notify(0);
        xlog.info("Downloaded {} ({} bytes)", _record.original_name, _session->transferred_bytes());
        _sessions.retire(_session->id());
        co_return _record;
    } catch (...) {
        ex = std::current_exception();
    }
    auto err = classify(ex);
    if (_session->cancel_requested() || err.kind() == error_kind::cancelled) {
        xlog.info("Download of {} paused at {} of {} bytes", _record.id, _session->transferred_bytes(), _session->total_bytes());
        _session->set_status(session_status::paused, "paused");
        _session->notify(0);
        co_return transfer_failure{error_kind::cancelled,
                fmt::format("download paused at {} of {} bytes", _session->transferred_bytes(), _session->total_bytes())};
    }
    xlog.error("Download of {} failed: {}: {}", _record.id, err.kind(), err.what());
    _session->unit(0).fail(err.what(), clock_type::now());
    _session->set_status(session_status::error, err.what());
    _session->notify(0);
    _sessions.retire(_session->id());
    co_return transfer_failure::from(err);
}

future<result<file_record>> downloader::start(bool foreground) {
    return download(download_options{.resume_offset = 0, .foreground = foreground});
}

future<result<file_record>> downloader::resume() {
    return download(download_options{.resume_offset = _session->transferred_bytes(), .foreground = _foreground});
}

future<result<file_record>> downloader::restart() {
    _session->reset();
    return download(download_options{.resume_offset = 0, .foreground = _foreground});
}

void downloader::cancel() noexcept {
    _session->cancel();
}

} // namespace transfer
