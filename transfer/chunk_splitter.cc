/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/chunk_splitter.hh"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <fmt/format.h>

namespace transfer {

unsigned total_chunks(uint64_t payload_size, uint64_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    if (payload_size == 0) {
        return 1;
    }
    auto n = (payload_size + chunk_size - 1) / chunk_size;
    if (n > std::numeric_limits<unsigned>::max()) {
        throw std::invalid_argument(fmt::format("{} bytes in chunks of {} needs too many chunks", payload_size, chunk_size));
    }
    return unsigned(n);
}

std::vector<chunk_range> split_into_chunks(uint64_t payload_size, uint64_t chunk_size) {
    auto n = total_chunks(payload_size, chunk_size);
    std::vector<chunk_range> ranges;
    ranges.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        uint64_t start = uint64_t(i) * chunk_size;
        ranges.push_back(chunk_range{
            .index = i,
            .start = start,
            .end = std::min(start + chunk_size, payload_size),
        });
    }
    return ranges;
}

} // namespace transfer
