/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <exception>
#include <optional>
#include <string>
#include <system_error>
#include <type_traits>

#include <seastar/http/reply.hh>
#include <seastar/util/bool_class.hh>

namespace utils::http {

using retryable = seastar::bool_class<struct is_retryable>;

// 408, 429 and the 5xx family are worth another attempt, everything else is final.
retryable from_http_code(seastar::http::reply::status_type http_code);

// Transport level failures (refused, reset, timed out, unreachable peer).
retryable from_system_error(const std::system_error& system_error);

template <typename Exc, typename F>
struct typed_handler {
    static_assert(std::is_base_of_v<std::exception, Exc>, "typed_handler can only handle std::exception types");
    using return_type = std::invoke_result_t<F, const Exc&>;

    F func;
    [[nodiscard]] bool matches(const std::exception& e) const noexcept { return dynamic_cast<const Exc*>(&e) != nullptr; }
    return_type handle(const std::exception& e) const { return func(static_cast<const Exc&>(e)); }
};

template <typename Exc, typename F>
auto make_handler(F&& f) {
    return typed_handler<Exc, std::decay_t<F>>{std::forward<F>(f)};
}

// Walks the exception and whatever is nested inside it, outermost first, and
// returns the result of the first handler whose type matches. When nothing
// matches, default_handler gets the innermost exception together with the
// message of the outermost one.
template <typename R, typename DefaultHandler, typename... Handlers>
R dispatch_exception(std::exception_ptr eptr, DefaultHandler default_handler, Handlers&&... handlers) {
    static_assert(std::is_same_v<R, std::invoke_result_t<DefaultHandler, std::exception_ptr, std::string&&>>,
                  "Default handler must return R");
    static_assert((std::is_same_v<R, typename std::decay_t<Handlers>::return_type> && ...), "All handlers must return R");

    std::string outer_message;
    while (eptr) {
        try {
            std::rethrow_exception(eptr);
        } catch (const std::exception& e) {
            if (outer_message.empty()) {
                outer_message = e.what();
            }
            std::optional<R> result;
            (void)((handlers.matches(e) && (result.emplace(handlers.handle(e)), true)) || ...);
            if (result) {
                return std::move(*result);
            }
            try {
                std::rethrow_if_nested(e);
            } catch (...) {
                eptr = std::current_exception();
                continue;
            }
            break;
        } catch (...) {
            break;
        }
    }
    return default_handler(eptr, std::move(outer_message));
}

} // namespace utils::http
