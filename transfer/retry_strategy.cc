/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/retry_strategy.hh"

#include <algorithm>

#include "transfer/errors.hh"

using namespace std::chrono_literals;

namespace transfer {

linear_retry_strategy::linear_retry_strategy(unsigned max_attempts, std::chrono::milliseconds base_delay)
    : _max_attempts(std::max(max_attempts, 1u))
    , _base_delay(base_delay) {
}

bool linear_retry_strategy::should_retry(const transfer_error& error, unsigned attempts_made) const {
    if (attempts_made >= _max_attempts) {
        return false;
    }
    return error.is_retryable() == retryable::yes;
}

std::chrono::milliseconds linear_retry_strategy::delay_before_retry(const transfer_error&, unsigned retry_count) const {
    return _base_delay * retry_count;
}

exponential_retry_strategy::exponential_retry_strategy(unsigned max_attempts, std::chrono::milliseconds base_delay)
    : _max_attempts(std::max(max_attempts, 1u))
    , _base_delay(base_delay) {
}

bool exponential_retry_strategy::should_retry(const transfer_error& error, unsigned attempts_made) const {
    if (attempts_made >= _max_attempts) {
        return false;
    }
    return error.is_retryable() == retryable::yes;
}

std::chrono::milliseconds exponential_retry_strategy::delay_before_retry(const transfer_error&, unsigned retry_count) const {
    if (retry_count == 0) {
        return 0ms;
    }
    return _base_delay * (1UL << std::min(retry_count - 1, 16u));
}

} // namespace transfer
