/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/config.hh"

#include <stdexcept>

namespace bpo = boost::program_options;

namespace transfer {

compression_policy transfer_config::compression() const {
    return compression_policy{
        .enabled = compression_enabled,
        .min_size = min_compress_size,
        .min_ratio_percent = min_compression_ratio,
        .level = compression_level,
    };
}

void transfer_config::validate() const {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk-size must be positive");
    }
    if (max_attempts == 0) {
        throw std::invalid_argument("max-attempts must be at least 1");
    }
    if (compression_level < 0 || compression_level > 9) {
        throw std::invalid_argument("compression-level must be within [0, 9]");
    }
    if (progress_channel_capacity == 0) {
        throw std::invalid_argument("progress channel capacity must be positive");
    }
    if (upload_sample_interval.count() <= 0 || foreground_sample_interval.count() <= 0 || background_sample_interval.count() <= 0) {
        throw std::invalid_argument("sample intervals must be positive");
    }
}

void add_options(bpo::options_description_easy_init opts) {
    const transfer_config defaults;
    opts
        ("chunk-size", bpo::value<uint64_t>()->default_value(defaults.chunk_size), "upload chunk size in bytes")
        ("max-attempts", bpo::value<unsigned>()->default_value(defaults.max_attempts), "attempts per chunk, first one included")
        ("retry-delay-ms", bpo::value<unsigned>()->default_value(defaults.retry_base_delay.count()), "base delay between chunk attempts")
        ("no-compression", "never gzip files before upload")
        ("compression-level", bpo::value<int>()->default_value(defaults.compression_level), "gzip level, 0-9")
        ("min-compress-size", bpo::value<uint64_t>()->default_value(defaults.min_compress_size), "only files larger than this are compressed")
        ("retention-hours", bpo::value<unsigned>()->default_value(24), "how long uploaded files stay downloadable")
    ;
}

transfer_config from_options(const bpo::variables_map& vm) {
    transfer_config cfg;
    cfg.chunk_size = vm["chunk-size"].as<uint64_t>();
    cfg.max_attempts = vm["max-attempts"].as<unsigned>();
    cfg.retry_base_delay = std::chrono::milliseconds(vm["retry-delay-ms"].as<unsigned>());
    cfg.compression_enabled = !vm.contains("no-compression");
    cfg.compression_level = vm["compression-level"].as<int>();
    cfg.min_compress_size = vm["min-compress-size"].as<uint64_t>();
    cfg.retention = std::chrono::hours(vm["retention-hours"].as<unsigned>());
    cfg.validate();
    return cfg;
}

} // namespace transfer
