/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>

#include <seastar/core/abort_source.hh>
#include <seastar/http/client.hh>

#include "transfer/retry_strategy.hh"

namespace store {

class retryable_http_client {
    seastar::http::experimental::client _http;
    const transfer::retry_strategy& _retry_strategy;

    seastar::future<> do_request(seastar::http::request& req, seastar::http::experimental::client::reply_handler& handler,
            seastar::abort_source* as);
public:
    retryable_http_client(std::unique_ptr<seastar::http::experimental::connection_factory>&& factory,
                          unsigned max_conn,
                          const transfer::retry_strategy& retry_strategy);

    // Sends once. Non-matching statuses fail with transfer::transfer_error
    // built from the status and the error body. Without `expected` any 2xx is accepted.
    seastar::future<> make_request(seastar::http::request req,
                                   seastar::http::experimental::client::reply_handler handler,
                                   std::optional<seastar::http::reply::status_type> expected = std::nullopt,
                                   seastar::abort_source* as = nullptr);

    // Same, repeating retryable failures as the strategy allows. Only for requests without a body.
    seastar::future<> make_retryable_request(seastar::http::request req,
                                             seastar::http::experimental::client::reply_handler handler,
                                             std::optional<seastar::http::reply::status_type> expected = std::nullopt,
                                             seastar::abort_source* as = nullptr);

    seastar::future<> close();
};

} // namespace store
