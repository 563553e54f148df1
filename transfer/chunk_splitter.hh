/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <vector>

namespace transfer {

// Half-open byte range [start, end) of the payload carried by one chunk.
struct chunk_range {
    unsigned index = 0;
    uint64_t start = 0;
    uint64_t end = 0;

    uint64_t size() const noexcept { return end - start; }
    bool operator==(const chunk_range&) const = default;
};

// An empty payload still needs one (empty) chunk so the store assembles a file.
unsigned total_chunks(uint64_t payload_size, uint64_t chunk_size);

// Contiguous ranges covering the payload in order. Every chunk but the last
// is exactly chunk_size bytes. Throws std::invalid_argument for a zero chunk size.
std::vector<chunk_range> split_into_chunks(uint64_t payload_size, uint64_t chunk_size);

} // namespace transfer
