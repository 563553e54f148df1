/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/clocks.hh"

#include <cctype>
#include <ctime>
#include <stdexcept>

#include <fmt/format.h>

namespace utils {

std::chrono::system_clock::time_point iso8601ts_to_timepoint(std::string_view iso8601_ts) {
    std::string ts(iso8601_ts);
    std::tm tm{};
    const char* rest = strptime(ts.c_str(), "%Y-%m-%dT%H:%M:%S", &tm);
    if (!rest) {
        throw std::runtime_error(fmt::format("Failed to parse ISO 8601 timestamp {} as UTC time", iso8601_ts));
    }

    long millis = 0;
    if (*rest == '.') {
        ++rest;
        int digits = 0;
        while (std::isdigit(static_cast<unsigned char>(*rest))) {
            if (digits < 3) {
                millis = millis * 10 + (*rest - '0');
                ++digits;
            }
            ++rest;
        }
        for (; digits < 3; ++digits) {
            millis *= 10;
        }
    }
    if (rest[0] != 'Z' || rest[1] != '\0') {
        throw std::runtime_error(fmt::format("Failed to parse ISO 8601 timestamp {} as UTC time", iso8601_ts));
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm)) + std::chrono::milliseconds(millis);
}

std::string timepoint_to_iso8601ts(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::floor<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
            tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec, millis);
}

} // namespace utils
