/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>

namespace transfer {

class transfer_error;

class retry_strategy {
public:
    virtual ~retry_strategy() = default;
    // Returns true if another attempt should be made given the error and the number of attempts already made.
    [[nodiscard]] virtual bool should_retry(const transfer_error& error, unsigned attempts_made) const = 0;

    // Pause before the next attempt, retry_count being the number of failed attempts so far (>= 1).
    [[nodiscard]] virtual std::chrono::milliseconds delay_before_retry(const transfer_error& error, unsigned retry_count) const = 0;

    [[nodiscard]] virtual unsigned max_attempts() const = 0;
};

// base_delay * retry_count: 1s, 2s, ... with the defaults.
class linear_retry_strategy : public retry_strategy {
    unsigned _max_attempts;
    std::chrono::milliseconds _base_delay;
public:
    explicit linear_retry_strategy(unsigned max_attempts = 3, std::chrono::milliseconds base_delay = std::chrono::seconds(1));

    [[nodiscard]] bool should_retry(const transfer_error& error, unsigned attempts_made) const override;
    [[nodiscard]] std::chrono::milliseconds delay_before_retry(const transfer_error& error, unsigned retry_count) const override;
    [[nodiscard]] unsigned max_attempts() const override { return _max_attempts; }
};

// base_delay * 2^(retry_count - 1): 500ms, 1s, 2s, ... with the defaults.
class exponential_retry_strategy : public retry_strategy {
    unsigned _max_attempts;
    std::chrono::milliseconds _base_delay;
public:
    explicit exponential_retry_strategy(unsigned max_attempts = 5, std::chrono::milliseconds base_delay = std::chrono::milliseconds(500));

    [[nodiscard]] bool should_retry(const transfer_error& error, unsigned attempts_made) const override;
    [[nodiscard]] std::chrono::milliseconds delay_before_retry(const transfer_error& error, unsigned retry_count) const override;
    [[nodiscard]] unsigned max_attempts() const override { return _max_attempts; }
};

} // namespace transfer
