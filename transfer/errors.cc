/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/errors.hh"

#include <json/json.h>
#include <seastar/core/abort_source.hh>
#include <seastar/core/sleep.hh>
#include <seastar/core/timed_out_error.hh>
#include <seastar/http/exception.hh>

namespace transfer {

static retryable default_retryable(error_kind kind) noexcept {
    return retryable{kind == error_kind::transient_network};
}

transfer_error::transfer_error(error_kind kind, const std::string& message)
    : transfer_error(kind, message, default_retryable(kind))
{}

transfer_error::transfer_error(error_kind kind, const std::string& message, retryable is_retryable)
    : std::runtime_error(message)
    , _kind(kind)
    , _retryable(is_retryable)
{}

std::string_view to_string(error_kind kind) noexcept {
    switch (kind) {
    case error_kind::transient_network: return "transient_network";
    case error_kind::remote_rejected: return "remote_rejected";
    case error_kind::compression_failure: return "compression_failure";
    case error_kind::decompression_failure: return "decompression_failure";
    case error_kind::expired: return "expired";
    case error_kind::incomplete_assembly: return "incomplete_assembly";
    case error_kind::not_found: return "not_found";
    case error_kind::cancelled: return "cancelled";
    case error_kind::local_io: return "local_io";
    }
    return "unknown";
}

std::string_view describe(error_kind kind) noexcept {
    switch (kind) {
    case error_kind::transient_network: return "Network problem, please try again";
    case error_kind::remote_rejected: return "The server rejected the request";
    case error_kind::compression_failure: return "Compression failed, the file was sent as is";
    case error_kind::decompression_failure: return "The downloaded file could not be decompressed";
    case error_kind::expired: return "This file has expired";
    case error_kind::incomplete_assembly: return "The upload did not complete, some chunks are missing";
    case error_kind::not_found: return "File not found";
    case error_kind::cancelled: return "Transfer cancelled";
    case error_kind::local_io: return "Could not read or write a local file";
    }
    return "Unknown error";
}

error_kind from_http_status(seastar::http::reply::status_type status) noexcept {
    using st = seastar::http::reply::status_type;
    if (status == st::not_found) {
        return error_kind::not_found;
    }
    if (status == st::conflict) {
        return error_kind::incomplete_assembly;
    }
    if (status == http_status::gone) {
        return error_kind::expired;
    }
    if (utils::http::from_http_code(status)) {
        return error_kind::transient_network;
    }
    return error_kind::remote_rejected;
}

seastar::http::reply::status_type to_http_status(error_kind kind) noexcept {
    using st = seastar::http::reply::status_type;
    switch (kind) {
    case error_kind::not_found: return st::not_found;
    case error_kind::incomplete_assembly: return st::conflict;
    case error_kind::expired: return http_status::gone;
    case error_kind::remote_rejected: return st::bad_request;
    case error_kind::transient_network: return st::service_unavailable;
    default: return st::internal_server_error;
    }
}

transfer_error make_status_error(seastar::http::reply::status_type status, std::string_view message) {
    auto kind = from_http_status(status);
    return transfer_error(kind, fmt::format("{} (HTTP {})", message.empty() ? describe(kind) : message, int(status)),
            utils::http::from_http_code(status));
}

transfer_error classify(std::exception_ptr ex) {
    using utils::http::make_handler;
    return utils::http::dispatch_exception<transfer_error>(std::move(ex),
        [] (std::exception_ptr, std::string&& message) {
            return transfer_error(error_kind::remote_rejected, message.empty() ? "unknown error" : message);
        },
        make_handler<transfer_error>([] (const transfer_error& e) {
            return e;
        }),
        make_handler<seastar::abort_requested_exception>([] (const seastar::abort_requested_exception& e) {
            return transfer_error(error_kind::cancelled, e.what());
        }),
        make_handler<seastar::sleep_aborted>([] (const seastar::sleep_aborted& e) {
            return transfer_error(error_kind::cancelled, e.what());
        }),
        make_handler<seastar::httpd::unexpected_status_error>([] (const seastar::httpd::unexpected_status_error& e) {
            return make_status_error(e.status(), e.what());
        }),
        make_handler<seastar::timed_out_error>([] (const seastar::timed_out_error& e) {
            return transfer_error(error_kind::transient_network, e.what());
        }),
        make_handler<std::system_error>([] (const std::system_error& e) {
            if (utils::http::from_system_error(e)) {
                return transfer_error(error_kind::transient_network, e.what());
            }
            return transfer_error(error_kind::local_io, e.what());
        }),
        make_handler<Json::Exception>([] (const Json::Exception& e) {
            return transfer_error(error_kind::remote_rejected, fmt::format("malformed response: {}", e.what()));
        }));
}

} // namespace transfer
