/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#define BOOST_TEST_MODULE protocol

#include <cerrno>
#include <system_error>

#include <boost/test/unit_test.hpp>
#include <seastar/core/abort_source.hh>

#include "store/protocol.hh"
#include "transfer/errors.hh"

using namespace store;
using transfer::error_kind;
using transfer::transfer_error;
using status = seastar::http::reply::status_type;

BOOST_TEST_DONT_PRINT_LOG_VALUE(transfer::error_kind)

static bool is_rejected(const transfer_error& e) {
    return e.kind() == error_kind::remote_rejected && !e.is_retryable();
}

BOOST_AUTO_TEST_CASE(test_range_header) {
    auto r = parse_range_header("bytes=2097152-");
    BOOST_REQUIRE(r);
    BOOST_REQUIRE_EQUAL(r->first, 2097152);
    BOOST_REQUIRE(!r->last);

    r = parse_range_header("bytes=10-19");
    BOOST_REQUIRE(r);
    BOOST_REQUIRE_EQUAL(r->first, 10);
    BOOST_REQUIRE_EQUAL(*r->last, 19);

    BOOST_REQUIRE(!parse_range_header(""));
    BOOST_REQUIRE(!parse_range_header("bytes=-500"));
    BOOST_REQUIRE(!parse_range_header("bytes=20-10"));
    BOOST_REQUIRE(!parse_range_header("bytes=a-"));
    BOOST_REQUIRE(!parse_range_header("items=0-"));
}

BOOST_AUTO_TEST_CASE(test_content_range) {
    auto r = parse_content_range("bytes 2097152-5242879/5242880");
    BOOST_REQUIRE(r);
    BOOST_REQUIRE_EQUAL(r->first, 2097152);
    BOOST_REQUIRE_EQUAL(r->last, 5242879);
    BOOST_REQUIRE_EQUAL(r->total, 5242880);
    BOOST_REQUIRE_EQUAL(format_content_range(*r), "bytes 2097152-5242879/5242880");

    BOOST_REQUIRE(!parse_content_range("bytes */5242880"));
    BOOST_REQUIRE(!parse_content_range("bytes 10-5/20"));
    BOOST_REQUIRE(!parse_content_range("bytes 0-5"));
}

BOOST_AUTO_TEST_CASE(test_chunk_request_parameters) {
    chunk_request req{
        .session_id = "s1",
        .chunk_index = 2,
        .total_chunks = 3,
        .original_file_name = "my report.json",
        .original_size = 1000000,
        .compressed = true,
        .compression_ratio = 59.996,
    };
    query_parameters params;
    encode_chunk_request(req, params);
    BOOST_REQUIRE_EQUAL(params.at("chunkIndex"), "2");
    BOOST_REQUIRE_EQUAL(params.at("totalChunks"), "3");
    BOOST_REQUIRE_EQUAL(params.at("fileName"), "my report.json");
    BOOST_REQUIRE_EQUAL(params.at("originalSize"), "1000000");
    BOOST_REQUIRE_EQUAL(params.at("compressed"), "true");
    BOOST_REQUIRE_EQUAL(params.at("compressionRatio"), "60.00");

    auto decoded = decode_chunk_request("s1", params);
    BOOST_REQUIRE_EQUAL(decoded.session_id, "s1");
    BOOST_REQUIRE_EQUAL(decoded.chunk_index, 2);
    BOOST_REQUIRE_EQUAL(decoded.total_chunks, 3);
    BOOST_REQUIRE_EQUAL(decoded.original_file_name, "my report.json");
    BOOST_REQUIRE_EQUAL(decoded.original_size, 1000000);
    BOOST_REQUIRE(decoded.compressed);
    BOOST_REQUIRE_CLOSE(decoded.compression_ratio, 60.0, 0.001);
}

BOOST_AUTO_TEST_CASE(test_bad_chunk_requests) {
    query_parameters params{{"chunkIndex", "0"}, {"totalChunks", "1"}, {"fileName", "a"}, {"originalSize", "1"}};
    BOOST_REQUIRE_NO_THROW(decode_chunk_request("s", params));
    BOOST_REQUIRE(!decode_chunk_request("s", params).compressed);

    auto missing = params;
    missing.erase("fileName");
    BOOST_REQUIRE_EXCEPTION(decode_chunk_request("s", missing), transfer_error, is_rejected);

    auto out_of_range = params;
    out_of_range["chunkIndex"] = "1";
    BOOST_REQUIRE_EXCEPTION(decode_chunk_request("s", out_of_range), transfer_error, is_rejected);

    auto no_chunks = params;
    no_chunks["totalChunks"] = "0";
    BOOST_REQUIRE_EXCEPTION(decode_chunk_request("s", no_chunks), transfer_error, is_rejected);

    auto garbage = params;
    garbage["originalSize"] = "12kb";
    BOOST_REQUIRE_EXCEPTION(decode_chunk_request("s", garbage), transfer_error, is_rejected);

    auto bad_ratio = params;
    bad_ratio["compressionRatio"] = "lots";
    BOOST_REQUIRE_EXCEPTION(decode_chunk_request("s", bad_ratio), transfer_error, is_rejected);
}

BOOST_AUTO_TEST_CASE(test_chunk_ack) {
    chunk_ack ack{.accepted = true, .chunk_index = 0, .total_chunks = 2};
    auto parsed = parse_chunk_ack(dump_chunk_ack(ack));
    BOOST_REQUIRE(parsed.accepted);
    BOOST_REQUIRE(!parsed.completed);
    BOOST_REQUIRE_EQUAL(parsed.total_chunks, 2);
    BOOST_REQUIRE(!parsed.record);
    BOOST_REQUIRE(!parsed.download_locator);

    auto last = parse_chunk_ack(R"({"success": true, "chunkIndex": 1, "totalChunks": 2, "completed": true,
        "downloadUrl": "/files/f1",
        "record": {"id": "f1", "originalName": "a.txt", "size": 3, "originalSize": 3, "compressed": false,
                   "compressionRatio": 0, "uploadedAt": "2025-03-01T10:00:00.000Z", "blobUrl": "/files/f1"}})");
    BOOST_REQUIRE(last.completed);
    BOOST_REQUIRE_EQUAL(*last.download_locator, "/files/f1");
    BOOST_REQUIRE(last.record);
    BOOST_REQUIRE_EQUAL(last.record->original_name, "a.txt");

    BOOST_REQUIRE_EXCEPTION(parse_chunk_ack(R"({"chunkIndex": 1})"), transfer_error, is_rejected);
    BOOST_REQUIRE_EXCEPTION(parse_chunk_ack("<html>"), transfer_error, is_rejected);
}

BOOST_AUTO_TEST_CASE(test_error_body) {
    auto body = dump_error("file f1 expired", "expired");
    BOOST_REQUIRE_EQUAL(*parse_error(body), "file f1 expired");
    BOOST_REQUIRE(!parse_error("Service Unavailable"));
    BOOST_REQUIRE(!parse_error(R"({"message": "x"})"));
}

BOOST_AUTO_TEST_CASE(test_paths) {
    BOOST_REQUIRE_EQUAL(upload_path("s1"), "/upload/s1");
    BOOST_REQUIRE_EQUAL(object_path("f1"), "/files/f1");
    BOOST_REQUIRE_EQUAL(metadata_path("f1"), "/metadata/f1");
}

BOOST_AUTO_TEST_CASE(test_status_mapping) {
    BOOST_REQUIRE_EQUAL(transfer::from_http_status(status::not_found), error_kind::not_found);
    BOOST_REQUIRE_EQUAL(transfer::from_http_status(status::conflict), error_kind::incomplete_assembly);
    BOOST_REQUIRE_EQUAL(transfer::from_http_status(transfer::http_status::gone), error_kind::expired);
    BOOST_REQUIRE_EQUAL(transfer::from_http_status(status::service_unavailable), error_kind::transient_network);
    BOOST_REQUIRE_EQUAL(transfer::from_http_status(transfer::http_status::too_many_requests), error_kind::transient_network);
    BOOST_REQUIRE_EQUAL(transfer::from_http_status(status::bad_request), error_kind::remote_rejected);
    BOOST_REQUIRE_EQUAL(transfer::from_http_status(transfer::http_status::range_not_satisfiable), error_kind::remote_rejected);

    for (auto kind : {error_kind::not_found, error_kind::incomplete_assembly, error_kind::expired, error_kind::transient_network}) {
        BOOST_REQUIRE_EQUAL(transfer::from_http_status(transfer::to_http_status(kind)), kind);
    }

    auto e = transfer::make_status_error(status::gateway_timeout, "");
    BOOST_REQUIRE_EQUAL(e.kind(), error_kind::transient_network);
    BOOST_REQUIRE(e.is_retryable());
    BOOST_REQUIRE(!transfer::make_status_error(status::forbidden, "denied").is_retryable());
}

BOOST_AUTO_TEST_CASE(test_classify) {
    auto classify = [] (auto e) {
        return transfer::classify(std::make_exception_ptr(std::move(e)));
    };
    BOOST_REQUIRE_EQUAL(classify(transfer_error(error_kind::expired, "gone")).kind(), error_kind::expired);
    BOOST_REQUIRE_EQUAL(classify(seastar::abort_requested_exception()).kind(), error_kind::cancelled);

    auto reset = classify(std::system_error(ECONNRESET, std::system_category()));
    BOOST_REQUIRE_EQUAL(reset.kind(), error_kind::transient_network);
    BOOST_REQUIRE(reset.is_retryable());

    auto enospc = classify(std::system_error(ENOSPC, std::system_category()));
    BOOST_REQUIRE_EQUAL(enospc.kind(), error_kind::local_io);
    BOOST_REQUIRE(!enospc.is_retryable());

    auto unknown = classify(std::logic_error("boom"));
    BOOST_REQUIRE_EQUAL(unknown.kind(), error_kind::remote_rejected);
    BOOST_REQUIRE(!unknown.is_retryable());
    BOOST_REQUIRE_EQUAL(std::string(unknown.what()), "boom");

    // Nested causes are looked through
    std::exception_ptr nested;
    try {
        try {
            throw std::system_error(ECONNREFUSED, std::system_category());
        } catch (...) {
            std::throw_with_nested(std::runtime_error("connecting to store"));
        }
    } catch (...) {
        nested = std::current_exception();
    }
    BOOST_REQUIRE_EQUAL(transfer::classify(nested).kind(), error_kind::transient_network);
}
