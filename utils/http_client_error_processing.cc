/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/http_client_error_processing.hh"

#include <cerrno>

namespace utils::http {

static constexpr auto too_many_requests = static_cast<seastar::http::reply::status_type>(429);

retryable from_http_code(seastar::http::reply::status_type http_code) {
    if (http_code == seastar::http::reply::status_type::request_timeout || http_code == too_many_requests) {
        return retryable::yes;
    }
    return retryable{seastar::http::reply::classify_status(http_code) == seastar::http::reply::status_class::server_error};
}

retryable from_system_error(const std::system_error& system_error) {
    if (system_error.code().category() != std::system_category() && system_error.code().category() != std::generic_category()) {
        return retryable::no;
    }
    switch (system_error.code().value()) {
    case ECONNREFUSED:
    case ECONNRESET:
    case ECONNABORTED:
    case ETIMEDOUT:
    case EHOSTUNREACH:
    case ENETUNREACH:
    case ENETDOWN:
    case EPIPE:
    case ENOTCONN:
    case EAGAIN:
        return retryable::yes;
    default:
        return retryable::no;
    }
}

} // namespace utils::http
