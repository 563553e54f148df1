/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE chunk_splitter

#include <boost/test/unit_test.hpp>
#include <seastar/core/units.hh>

#include "transfer/chunk_splitter.hh"

using namespace transfer;

BOOST_AUTO_TEST_CASE(test_four_mib_in_one_and_a_half_mib_chunks) {
    auto chunks = split_into_chunks(4_MiB, 1536_KiB);
    BOOST_REQUIRE_EQUAL(chunks.size(), 3);
    BOOST_REQUIRE_EQUAL(total_chunks(4_MiB, 1536_KiB), 3);
    BOOST_REQUIRE_EQUAL(chunks[0].size(), 1536_KiB);
    BOOST_REQUIRE_EQUAL(chunks[1].size(), 1536_KiB);
    BOOST_REQUIRE_EQUAL(chunks[2].size(), 1_MiB);
    BOOST_REQUIRE_EQUAL(chunks[2].end, 4_MiB);
}

BOOST_AUTO_TEST_CASE(test_chunks_are_contiguous_and_ordered) {
    for (uint64_t size : {1ul, 999ul, 1000ul, 1001ul, 123457ul}) {
        auto chunks = split_into_chunks(size, 1000);
        BOOST_TEST_CONTEXT("payload of " << size << " bytes") {
            BOOST_REQUIRE_EQUAL(chunks.size(), (size + 999) / 1000);
            uint64_t pos = 0;
            for (unsigned i = 0; i < chunks.size(); ++i) {
                BOOST_REQUIRE_EQUAL(chunks[i].index, i);
                BOOST_REQUIRE_EQUAL(chunks[i].start, pos);
                BOOST_REQUIRE_GT(chunks[i].size(), 0);
                if (i + 1 < chunks.size()) {
                    BOOST_REQUIRE_EQUAL(chunks[i].size(), 1000);
                }
                pos = chunks[i].end;
            }
            BOOST_REQUIRE_EQUAL(pos, size);
        }
    }
}

BOOST_AUTO_TEST_CASE(test_exact_multiple_has_no_empty_tail) {
    auto chunks = split_into_chunks(3_MiB, 1536_KiB);
    BOOST_REQUIRE_EQUAL(chunks.size(), 2);
    BOOST_REQUIRE_EQUAL(chunks.back().size(), 1536_KiB);
}

BOOST_AUTO_TEST_CASE(test_empty_payload_is_one_empty_chunk) {
    BOOST_REQUIRE_EQUAL(total_chunks(0, 1536_KiB), 1);
    auto chunks = split_into_chunks(0, 1536_KiB);
    BOOST_REQUIRE_EQUAL(chunks.size(), 1);
    BOOST_REQUIRE(chunks[0] == (chunk_range{0, 0, 0}));
}

BOOST_AUTO_TEST_CASE(test_payload_smaller_than_chunk) {
    auto chunks = split_into_chunks(10, 1536_KiB);
    BOOST_REQUIRE_EQUAL(chunks.size(), 1);
    BOOST_REQUIRE(chunks[0] == (chunk_range{0, 0, 10}));
}

BOOST_AUTO_TEST_CASE(test_zero_chunk_size_is_rejected) {
    BOOST_REQUIRE_THROW(total_chunks(10, 0), std::invalid_argument);
    BOOST_REQUIRE_THROW(split_into_chunks(10, 0), std::invalid_argument);
}
