/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "store/retryable_http_client.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/request.hh>
#include <seastar/util/log.hh>
#include <seastar/util/short_streams.hh>

#include "store/protocol.hh"
#include "transfer/errors.hh"

using namespace seastar;

static logger rlog("http_retry");

namespace store {

static http::experimental::client::reply_handler checked(http::experimental::client::reply_handler handler,
                                                         std::optional<http::reply::status_type> expected) {
    return [handler = std::move(handler), expected] (const http::reply& rep, input_stream<char>&& in) mutable -> future<> {
        auto payload = std::move(in);
        auto status_class = http::reply::classify_status(rep._status);
        bool ok = expected ? rep._status == *expected : status_class == http::reply::status_class::success;
        if (!ok) {
            auto body = co_await util::read_entire_stream_contiguous(payload);
            auto message = parse_error(std::string_view(body.data(), body.size()));
            co_await coroutine::return_exception(transfer::make_status_error(rep._status, message.value_or("")));
        }
        co_await handler(rep, std::move(payload));
    };
}

retryable_http_client::retryable_http_client(std::unique_ptr<http::experimental::connection_factory>&& factory,
                                             unsigned max_conn,
                                             const transfer::retry_strategy& retry_strategy)
    : _http(std::move(factory), max_conn, http::experimental::client::retry_requests::yes)
    , _retry_strategy(retry_strategy) {
}

future<> retryable_http_client::do_request(http::request& req, http::experimental::client::reply_handler& handler, abort_source* as) {
    // The http client does not look at the abort source before it starts,
    // so an already aborted request would not be interrupted.
    if (as && as->abort_requested()) {
        co_await coroutine::return_exception_ptr(as->abort_requested_exception_ptr());
    }
    co_await (as ? _http.make_request(req, handler, *as, std::nullopt) : _http.make_request(req, handler, std::nullopt));
}

future<> retryable_http_client::make_request(http::request req,
                                             http::experimental::client::reply_handler handler,
                                             std::optional<http::reply::status_type> expected,
                                             abort_source* as) {
    auto wrapped = checked(std::move(handler), expected);
    co_await do_request(req, wrapped, as);
}

future<> retryable_http_client::make_retryable_request(http::request req,
                                                       http::experimental::client::reply_handler handler,
                                                       std::optional<http::reply::status_type> expected,
                                                       abort_source* as) {
    auto wrapped = checked(std::move(handler), expected);
    unsigned attempts = 0;
    while (true) {
        std::exception_ptr ex;
        try {
            ++attempts;
            co_await do_request(req, wrapped, as);
            co_return;
        } catch (...) {
            ex = std::current_exception();
        }
        auto err = transfer::classify(ex);
        if (!_retry_strategy.should_retry(err, attempts) || (as && as->abort_requested())) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
        auto delay = _retry_strategy.delay_before_retry(err, attempts);
        rlog.debug("{} {} failed ({}), retrying in {}ms", req._method, req._url, err.what(), delay.count());
        if (as) {
            co_await seastar::sleep_abortable(delay, *as);
        } else {
            co_await seastar::sleep(delay);
        }
    }
}

future<> retryable_http_client::close() {
    return _http.close();
}

} // namespace store
