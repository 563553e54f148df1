/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <cstdint>

#include <boost/program_options.hpp>
#include <seastar/core/shared_ptr.hh>
#include <seastar/core/units.hh>

#include "transfer/compression.hh"

namespace transfer {

struct transfer_config {
    uint64_t chunk_size = 1536_KiB;
    unsigned max_attempts = 3;
    std::chrono::milliseconds retry_base_delay{1000};

    bool compression_enabled = true;
    uint64_t min_compress_size = 100_KiB;
    double min_compression_ratio = 5.0;
    int compression_level = 6;

    std::chrono::milliseconds upload_sample_interval{500};
    std::chrono::milliseconds foreground_sample_interval{100};
    std::chrono::milliseconds background_sample_interval{500};

    std::chrono::seconds retention{std::chrono::hours(24)};
    std::chrono::milliseconds session_grace_period{3000};
    size_t progress_channel_capacity = 128;

    compression_policy compression() const;
    // Throws std::invalid_argument naming the offending setting.
    void validate() const;
};

using transfer_config_ptr = seastar::lw_shared_ptr<const transfer_config>;

void add_options(boost::program_options::options_description_easy_init opts);
transfer_config from_options(const boost::program_options::variables_map& vm);

} // namespace transfer
