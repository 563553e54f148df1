/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include <json/value.h>

namespace transfer {

// Server-side description of an assembled file.
struct file_record {
    std::string id;
    std::string original_name;
    uint64_t size = 0;              // stored bytes, compressed when `compressed`
    uint64_t original_size = 0;
    bool compressed = false;
    double compression_ratio = 0;   // percent saved
    std::chrono::system_clock::time_point uploaded_at;
    std::string blob_locator;

    bool operator==(const file_record&) const = default;

    std::chrono::system_clock::time_point expires_at(std::chrono::seconds retention) const {
        return uploaded_at + retention;
    }
    bool expired(std::chrono::system_clock::time_point now, std::chrono::seconds retention) const {
        return now > expires_at(retention);
    }
};

Json::Value to_json(const file_record& record);
file_record file_record_from_json(const Json::Value& value);

std::string dump_json(const Json::Value& value);
Json::Value parse_json(std::string_view body);

inline std::string dump_file_record(const file_record& record) {
    return dump_json(to_json(record));
}

inline file_record parse_file_record(std::string_view body) {
    return file_record_from_json(parse_json(body));
}

} // namespace transfer
