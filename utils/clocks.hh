/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once
#include <chrono>
#include <string>
#include <string_view>

namespace utils {

// Parses YYYY-MM-DDTHH:MM:SS[.fff]Z. Digits past milliseconds are dropped.
std::chrono::system_clock::time_point iso8601ts_to_timepoint(std::string_view iso8601_ts);

// Always renders milliseconds, e.g. 2025-03-01T10:00:00.000Z
std::string timepoint_to_iso8601ts(std::chrono::system_clock::time_point tp);

} // namespace utils
