/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE transfer_config

#include <boost/program_options.hpp>
#include <boost/test/unit_test.hpp>

#include "transfer/config.hh"

namespace bpo = boost::program_options;
using namespace std::chrono_literals;

static bpo::variables_map parse(std::vector<const char*> args) {
    bpo::options_description desc;
    transfer::add_options(desc.add_options());
    args.insert(args.begin(), "blobshare");
    bpo::variables_map vm;
    bpo::store(bpo::parse_command_line(int(args.size()), args.data(), desc), vm);
    bpo::notify(vm);
    return vm;
}

BOOST_AUTO_TEST_CASE(test_defaults) {
    auto cfg = transfer::from_options(parse({}));
    BOOST_REQUIRE_EQUAL(cfg.chunk_size, 1536 * 1024);
    BOOST_REQUIRE_EQUAL(cfg.max_attempts, 3);
    BOOST_REQUIRE(cfg.retry_base_delay == 1s);
    BOOST_REQUIRE(cfg.compression_enabled);
    BOOST_REQUIRE(cfg.retention == 24h);

    auto policy = cfg.compression();
    BOOST_REQUIRE_EQUAL(policy.min_size, 100 * 1024);
    BOOST_REQUIRE_EQUAL(policy.min_ratio_percent, 5.0);
    BOOST_REQUIRE_EQUAL(policy.level, 6);
}

BOOST_AUTO_TEST_CASE(test_overrides) {
    auto cfg = transfer::from_options(parse({"--chunk-size", "4096", "--max-attempts", "5", "--retry-delay-ms", "250",
            "--no-compression", "--compression-level", "9", "--retention-hours", "1"}));
    BOOST_REQUIRE_EQUAL(cfg.chunk_size, 4096);
    BOOST_REQUIRE_EQUAL(cfg.max_attempts, 5);
    BOOST_REQUIRE(cfg.retry_base_delay == 250ms);
    BOOST_REQUIRE(!cfg.compression().enabled);
    BOOST_REQUIRE_EQUAL(cfg.compression().level, 9);
    BOOST_REQUIRE(cfg.retention == 1h);
}

BOOST_AUTO_TEST_CASE(test_invalid_settings) {
    BOOST_REQUIRE_THROW(transfer::from_options(parse({"--chunk-size", "0"})), std::invalid_argument);
    BOOST_REQUIRE_THROW(transfer::from_options(parse({"--max-attempts", "0"})), std::invalid_argument);
    BOOST_REQUIRE_THROW(transfer::from_options(parse({"--compression-level", "11"})), std::invalid_argument);

    transfer::transfer_config cfg;
    cfg.progress_channel_capacity = 0;
    BOOST_REQUIRE_THROW(cfg.validate(), std::invalid_argument);
}
