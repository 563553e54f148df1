/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <string>
#include <utility>
#include <variant>

#include "transfer/errors.hh"

namespace transfer {

struct transfer_failure {
    error_kind kind;
    std::string message;

    static transfer_failure from(const transfer_error& e) {
        return transfer_failure{e.kind(), e.what()};
    }
    transfer_error to_error() const {
        return transfer_error(kind, message);
    }
};

// Outcome of a whole transfer: the value, or the category and message of what went wrong.
template <typename T>
class result {
    std::variant<T, transfer_failure> _v;
public:
    result(T value) : _v(std::in_place_index<0>, std::move(value)) {}
    result(transfer_failure failure) : _v(std::in_place_index<1>, std::move(failure)) {}

    explicit operator bool() const noexcept { return _v.index() == 0; }
    bool ok() const noexcept { return _v.index() == 0; }

    T& value() & { return get_value(); }
    const T& value() const& { return std::get<0>(_v); }
    T&& value() && { return std::move(get_value()); }

    const transfer_failure& failure() const { return std::get<1>(_v); }
    error_kind kind() const { return failure().kind; }

private:
    T& get_value() {
        if (_v.index() != 0) {
            throw failure().to_error();
        }
        return std::get<0>(_v);
    }
};

} // namespace transfer
