/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <string_view>

#include <zlib.h>

#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>
#include <seastar/core/units.hh>
#include <seastar/util/noncopyable_function.hh>

namespace transfer {

using namespace seastar;

struct compression_policy {
    bool enabled = true;
    uint64_t min_size = 100_KiB;        // files at or below this are never compressed
    double min_ratio_percent = 5.0;     // compressed output must save at least this much
    int level = 6;
};

// True when the name or MIME type marks content that is already compressed.
bool is_precompressed(std::string_view file_name, std::string_view mime_type);

bool should_compress(std::string_view file_name, std::string_view mime_type, uint64_t size, const compression_policy& policy);

// Best effort guess from the file extension, application/octet-stream otherwise.
std::string_view guess_mime_type(std::string_view file_name);

// Percent saved, 0 for empty input. Negative when the output grew.
double compression_ratio(uint64_t original_size, uint64_t compressed_size) noexcept;

struct compression_outcome {
    temporary_buffer<char> data;
    double ratio_percent = 0;
};

bool worth_keeping(const compression_outcome& outcome, const compression_policy& policy) noexcept;

// Gzip (RFC 1952) encodes the whole input. Throws transfer_error(compression_failure)
// on zlib errors and std::bad_alloc when the output cannot be allocated.
future<compression_outcome> gzip_compress(const temporary_buffer<char>& input, int level);

// Streaming gzip inflater. Output is handed to the consumer in blocks as it
// is produced; concatenated gzip members are decoded back to back.
class gzip_decompressor {
public:
    using consumer = noncopyable_function<future<>(temporary_buffer<char>)>;
private:
    z_stream _zs;
    consumer _out;
    bool _member_done = false;
public:
    explicit gzip_decompressor(consumer out);
    gzip_decompressor(const gzip_decompressor&) = delete;
    ~gzip_decompressor();

    future<> feed(temporary_buffer<char> in);
    // Fails when the stream stopped in the middle of a member.
    future<> finish();
};

future<temporary_buffer<char>> gzip_decompress(temporary_buffer<char> input);

} // namespace transfer
