/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE file_record

#include <boost/test/unit_test.hpp>

#include "transfer/errors.hh"
#include "transfer/file_record.hh"
#include "utils/clocks.hh"

using namespace transfer;
using namespace std::chrono_literals;

static bool is_rejected(const transfer_error& e) {
    return e.kind() == error_kind::remote_rejected;
}

static file_record sample_record() {
    return file_record{
        .id = "19a3c0ffee01234567",
        .original_name = "report.json",
        .size = 400000,
        .original_size = 1000000,
        .compressed = true,
        .compression_ratio = 60,
        .uploaded_at = utils::iso8601ts_to_timepoint("2025-03-01T10:00:00.250Z"),
        .blob_locator = "/files/19a3c0ffee01234567",
    };
}

BOOST_AUTO_TEST_CASE(test_iso8601_parsing) {
    auto tp = utils::iso8601ts_to_timepoint("1970-01-02T00:00:01Z");
    BOOST_REQUIRE_EQUAL(std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count(), 86401);

    auto with_millis = utils::iso8601ts_to_timepoint("1970-01-01T00:00:00.5Z");
    BOOST_REQUIRE_EQUAL(std::chrono::duration_cast<std::chrono::milliseconds>(with_millis.time_since_epoch()).count(), 500);

    // Digits past milliseconds are dropped
    auto with_micros = utils::iso8601ts_to_timepoint("1970-01-01T00:00:00.123456Z");
    BOOST_REQUIRE_EQUAL(std::chrono::duration_cast<std::chrono::milliseconds>(with_micros.time_since_epoch()).count(), 123);

    BOOST_REQUIRE_THROW(utils::iso8601ts_to_timepoint("2025-03-01T10:00:00"), std::runtime_error);
    BOOST_REQUIRE_THROW(utils::iso8601ts_to_timepoint("2025-03-01T10:00:00+02:00"), std::runtime_error);
    BOOST_REQUIRE_THROW(utils::iso8601ts_to_timepoint("yesterday"), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_iso8601_formatting) {
    auto tp = std::chrono::system_clock::time_point(86401s + 7ms);
    BOOST_REQUIRE_EQUAL(utils::timepoint_to_iso8601ts(tp), "1970-01-02T00:00:01.007Z");
    BOOST_REQUIRE_EQUAL(utils::timepoint_to_iso8601ts(utils::iso8601ts_to_timepoint("2025-03-01T10:00:00Z")), "2025-03-01T10:00:00.000Z");
}

BOOST_AUTO_TEST_CASE(test_json_field_names) {
    auto v = to_json(sample_record());
    BOOST_REQUIRE_EQUAL(v["id"].asString(), "19a3c0ffee01234567");
    BOOST_REQUIRE_EQUAL(v["originalName"].asString(), "report.json");
    BOOST_REQUIRE_EQUAL(v["size"].asUInt64(), 400000);
    BOOST_REQUIRE_EQUAL(v["originalSize"].asUInt64(), 1000000);
    BOOST_REQUIRE(v["compressed"].asBool());
    BOOST_REQUIRE_EQUAL(v["compressionRatio"].asDouble(), 60);
    BOOST_REQUIRE_EQUAL(v["uploadedAt"].asString(), "2025-03-01T10:00:00.250Z");
    BOOST_REQUIRE_EQUAL(v["blobUrl"].asString(), "/files/19a3c0ffee01234567");

    BOOST_REQUIRE(parse_file_record(dump_file_record(sample_record())) == sample_record());
}

BOOST_AUTO_TEST_CASE(test_record_from_foreign_json) {
    auto r = parse_file_record(R"({
        "id": "abc", "originalName": "a b.txt", "size": 12, "originalSize": 12,
        "compressed": false, "compressionRatio": 0,
        "uploadedAt": "2025-03-01T10:00:00Z", "blobUrl": "http://localhost:8080/files/abc",
        "extra": [1, 2, 3]
    })");
    BOOST_REQUIRE_EQUAL(r.id, "abc");
    BOOST_REQUIRE_EQUAL(r.original_name, "a b.txt");
    BOOST_REQUIRE_EQUAL(r.size, 12);
    BOOST_REQUIRE(!r.compressed);
    BOOST_REQUIRE_EQUAL(r.blob_locator, "http://localhost:8080/files/abc");
}

BOOST_AUTO_TEST_CASE(test_malformed_records_are_rejected) {
    BOOST_REQUIRE_EXCEPTION(parse_file_record("not json"), transfer_error, is_rejected);
    BOOST_REQUIRE_EXCEPTION(parse_file_record("[1, 2]"), transfer_error, is_rejected);

    auto v = to_json(sample_record());
    v.removeMember("blobUrl");
    BOOST_REQUIRE_EXCEPTION(file_record_from_json(v), transfer_error, is_rejected);

    v = to_json(sample_record());
    v["size"] = -1;
    BOOST_REQUIRE_EXCEPTION(file_record_from_json(v), transfer_error, is_rejected);

    v = to_json(sample_record());
    v["uploadedAt"] = "2025-13-45";
    BOOST_REQUIRE_EXCEPTION(file_record_from_json(v), transfer_error, is_rejected);
}

BOOST_AUTO_TEST_CASE(test_expiry) {
    auto now = std::chrono::system_clock::now();
    auto record = sample_record();
    const std::chrono::seconds retention = 24h;

    record.uploaded_at = now - 25h;
    BOOST_REQUIRE(record.expired(now, retention));

    record.uploaded_at = now - 23h;
    BOOST_REQUIRE(!record.expired(now, retention));

    // Exactly at the boundary the file is still served
    record.uploaded_at = now - 24h;
    BOOST_REQUIRE(!record.expired(now, retention));
    BOOST_REQUIRE(record.expires_at(retention) == now);
}
