/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/chunk_uploader.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>

#include "transfer/log.hh"

namespace transfer {

chunk_uploader::chunk_uploader(store::remote_store& store, const retry_strategy& retry)
    : _store(store)
    , _retry(retry)
{}

future<attempt_outcome> chunk_uploader::attempt(const store::chunk_request& req, temporary_buffer<char> bytes, abort_source* as) {
    std::exception_ptr ex;
    try {
        auto ack = co_await _store.upload_chunk(req, std::move(bytes), as);
        if (!ack.accepted) {
            co_return attempt_outcome{attempt_status::fatal, std::nullopt,
                    transfer_error(error_kind::remote_rejected, ack.error.value_or("chunk rejected by the store"))};
        }
        co_return attempt_outcome{attempt_status::ok, std::move(ack), std::nullopt};
    } catch (...) {
        ex = std::current_exception();
    }
    auto err = classify(ex);
    if (as && as->abort_requested()) {
        err = transfer_error(error_kind::cancelled, "upload cancelled");
    }
    auto status = err.is_retryable() ? attempt_status::retryable : attempt_status::fatal;
    co_return attempt_outcome{status, std::nullopt, std::move(err)};
}

future<result<store::chunk_ack>> chunk_uploader::upload(transfer_session& session, const store::chunk_request& req, temporary_buffer<char> bytes) {
    auto index = req.chunk_index;
    auto* as = session.current_abort_source();
    session.unit(index).start(clock_type::now());
    session.notify(index);

    unsigned attempts = 0;
    while (true) {
        ++attempts;
        auto outcome = co_await attempt(req, bytes.share(), as);
        auto& unit = session.unit(index);
        if (outcome.status == attempt_status::ok) {
            unit.complete(clock_type::now());
            co_return std::move(*outcome.ack);
        }

        auto& err = *outcome.error;
        bool again = outcome.status == attempt_status::retryable && _retry.should_retry(err, attempts);
        if (!again) {
            unit.fail(err.what(), clock_type::now());
            session.notify(index);
            xlog.warn("Chunk {}/{} of session {} failed after {} attempt(s): {}", index + 1, req.total_chunks, session.id(), attempts, err.what());
            co_return transfer_failure::from(err);
        }

        unit.retry(err.what());
        session.notify(index);
        auto delay = _retry.delay_before_retry(err, unit.retry_count);
        xlog.info("Chunk {}/{} of session {} failed ({}), retry {} in {}ms",
                index + 1, req.total_chunks, session.id(), err.what(), unit.retry_count, delay.count());

        std::exception_ptr ex;
        try {
            if (as) {
                co_await seastar::sleep_abortable(delay, *as);
            } else {
                co_await seastar::sleep(delay);
            }
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            auto cancelled = transfer_error(error_kind::cancelled, "upload cancelled");
            auto& u = session.unit(index);
            u.status = unit_status::failed;
            u.last_error = cancelled.what();
            u.finished_at = clock_type::now();
            session.notify(index);
            co_return transfer_failure::from(cancelled);
        }
        session.unit(index).start(clock_type::now());
        session.notify(index);
    }
}

} // namespace transfer
