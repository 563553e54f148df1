/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>
#include <seastar/http/reply.hh>

#include "utils/http_client_error_processing.hh"

namespace transfer {

using retryable = utils::http::retryable;

enum class error_kind {
    transient_network,
    remote_rejected,
    compression_failure,
    decompression_failure,
    expired,
    incomplete_assembly,
    not_found,
    cancelled,
    local_io,
};

class transfer_error : public std::runtime_error {
    error_kind _kind;
    retryable _retryable;
public:
    transfer_error(error_kind kind, const std::string& message);
    transfer_error(error_kind kind, const std::string& message, retryable is_retryable);

    error_kind kind() const noexcept { return _kind; }
    retryable is_retryable() const noexcept { return _retryable; }
};

std::string_view to_string(error_kind kind) noexcept;

// Short text a user sees for each category.
std::string_view describe(error_kind kind) noexcept;

error_kind from_http_status(seastar::http::reply::status_type status) noexcept;
seastar::http::reply::status_type to_http_status(error_kind kind) noexcept;

transfer_error make_status_error(seastar::http::reply::status_type status, std::string_view message);

// Maps whatever escaped a store call, a stream or a timer into the taxonomy.
// Unknown exceptions become non-retryable remote_rejected errors.
transfer_error classify(std::exception_ptr ex);

namespace http_status {
inline constexpr auto gone = static_cast<seastar::http::reply::status_type>(410);
inline constexpr auto range_not_satisfiable = static_cast<seastar::http::reply::status_type>(416);
inline constexpr auto too_many_requests = static_cast<seastar::http::reply::status_type>(429);
}

} // namespace transfer

template <>
struct fmt::formatter<transfer::error_kind> : fmt::formatter<std::string_view> {
    auto format(transfer::error_kind kind, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(transfer::to_string(kind), ctx);
    }
};
