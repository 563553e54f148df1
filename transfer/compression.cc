/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/compression.hh"

#include <algorithm>
#include <array>
#include <iterator>
#include <cctype>
#include <cstring>
#include <string>
#include <vector>

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/maybe_yield.hh>
#include <seastar/util/log.hh>

#include "transfer/errors.hh"

static seastar::logger zlog("compression");

namespace transfer {

static constexpr size_t deflate_block_size = 64_KiB;
static constexpr size_t inflate_block_size = 64_KiB;

static constexpr std::string_view precompressed_extensions[] = {
    "zip", "gz", "bz2", "xz", "7z", "rar", "zst", "lz4", "br",
    "jpg", "jpeg", "png", "gif", "webp", "heic", "avif",
    "mp4", "mkv", "mov", "avi", "webm",
    "mp3", "aac", "ogg", "opus", "flac", "m4a",
    "pdf", "docx", "xlsx", "pptx", "epub",
};

static constexpr std::string_view precompressed_mime_types[] = {
    "application/zip", "application/gzip", "application/x-gzip", "application/x-bzip2",
    "application/x-xz", "application/x-7z-compressed", "application/vnd.rar", "application/x-rar-compressed",
    "application/zstd", "application/pdf",
};

static constexpr std::string_view precompressed_mime_prefixes[] = {
    "image/", "video/", "audio/",
};

struct mime_entry {
    const char* extension;
    const char* mime_type;
};

static constexpr std::array mime_table = {
    mime_entry{"txt", "text/plain"}, mime_entry{"log", "text/plain"}, mime_entry{"csv", "text/csv"},
    mime_entry{"html", "text/html"}, mime_entry{"htm", "text/html"}, mime_entry{"css", "text/css"},
    mime_entry{"js", "text/javascript"}, mime_entry{"json", "application/json"}, mime_entry{"xml", "application/xml"},
    mime_entry{"svg", "image/svg+xml"}, mime_entry{"md", "text/markdown"},
    mime_entry{"zip", "application/zip"}, mime_entry{"gz", "application/gzip"}, mime_entry{"bz2", "application/x-bzip2"},
    mime_entry{"xz", "application/x-xz"}, mime_entry{"7z", "application/x-7z-compressed"}, mime_entry{"rar", "application/vnd.rar"},
    mime_entry{"zst", "application/zstd"}, mime_entry{"pdf", "application/pdf"},
    mime_entry{"jpg", "image/jpeg"}, mime_entry{"jpeg", "image/jpeg"}, mime_entry{"png", "image/png"},
    mime_entry{"gif", "image/gif"}, mime_entry{"webp", "image/webp"},
    mime_entry{"mp4", "video/mp4"}, mime_entry{"webm", "video/webm"}, mime_entry{"mov", "video/quicktime"},
    mime_entry{"mp3", "audio/mpeg"}, mime_entry{"ogg", "audio/ogg"}, mime_entry{"flac", "audio/flac"},
};

static std::string lowercase_extension(std::string_view file_name) {
    auto dot = file_name.rfind('.');
    if (dot == std::string_view::npos || dot + 1 == file_name.size()) {
        return {};
    }
    std::string ext(file_name.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(), [] (unsigned char c) { return std::tolower(c); });
    return ext;
}

bool is_precompressed(std::string_view file_name, std::string_view mime_type) {
    auto ext = lowercase_extension(file_name);
    if (!ext.empty() && std::ranges::find(precompressed_extensions, std::string_view(ext)) != std::end(precompressed_extensions)) {
        return true;
    }
    if (mime_type.empty()) {
        return false;
    }
    if (std::ranges::find(precompressed_mime_types, mime_type) != std::end(precompressed_mime_types)) {
        return true;
    }
    // SVG is text and compresses well even though it lives under image/
    if (mime_type == "image/svg+xml") {
        return false;
    }
    return std::ranges::any_of(precompressed_mime_prefixes, [mime_type] (std::string_view prefix) {
        return mime_type.starts_with(prefix);
    });
}

bool should_compress(std::string_view file_name, std::string_view mime_type, uint64_t size, const compression_policy& policy) {
    return policy.enabled && size > policy.min_size && !is_precompressed(file_name, mime_type);
}

std::string_view guess_mime_type(std::string_view file_name) {
    auto ext = lowercase_extension(file_name);
    for (const auto& e : mime_table) {
        if (ext == e.extension) {
            return e.mime_type;
        }
    }
    return "application/octet-stream";
}

double compression_ratio(uint64_t original_size, uint64_t compressed_size) noexcept {
    if (original_size == 0) {
        return 0;
    }
    return (1.0 - double(compressed_size) / double(original_size)) * 100.0;
}

bool worth_keeping(const compression_outcome& outcome, const compression_policy& policy) noexcept {
    return outcome.ratio_percent >= policy.min_ratio_percent;
}

namespace {

class zlib_deflater {
    z_stream _zs;
public:
    explicit zlib_deflater(int level) {
        std::memset(&_zs, 0, sizeof(_zs));
        int rc = deflateInit2(&_zs, std::clamp(level, Z_NO_COMPRESSION, Z_BEST_COMPRESSION), Z_DEFLATED,
                16 + MAX_WBITS, 8, Z_DEFAULT_STRATEGY);
        if (rc != Z_OK) {
            throw transfer_error(error_kind::compression_failure, fmt::format("deflateInit2 failed: {}", rc));
        }
    }
    ~zlib_deflater() {
        deflateEnd(&_zs);
    }

    future<temporary_buffer<char>> deflate_all(const char* data, size_t len) {
        // deflateBound covers the worst case, so the output never has to grow
        temporary_buffer<char> out(deflateBound(&_zs, len));
        size_t consumed = 0;
        int rc = Z_OK;
        while (rc != Z_STREAM_END) {
            co_await coroutine::maybe_yield();
            if (_zs.avail_in == 0 && consumed < len) {
                auto n = std::min(len - consumed, deflate_block_size);
                _zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data + consumed));
                _zs.avail_in = uInt(n);
                consumed += n;
            }
            size_t produced = _zs.total_out;
            if (produced == out.size()) {
                throw transfer_error(error_kind::compression_failure, "deflate output exceeded its bound");
            }
            _zs.next_out = reinterpret_cast<Bytef*>(out.get_write() + produced);
            _zs.avail_out = uInt(std::min(out.size() - produced, deflate_block_size));
            rc = ::deflate(&_zs, consumed == len ? Z_FINISH : Z_NO_FLUSH);
            if (rc == Z_STREAM_ERROR) {
                throw transfer_error(error_kind::compression_failure, fmt::format("deflate failed: {}", _zs.msg ? _zs.msg : "stream error"));
            }
        }
        out.trim(_zs.total_out);
        co_return out;
    }
};

} // anonymous namespace

future<compression_outcome> gzip_compress(const temporary_buffer<char>& input, int level) {
    zlib_deflater deflater(level);
    auto out = co_await deflater.deflate_all(input.get(), input.size());
    auto ratio = compression_ratio(input.size(), out.size());
    zlog.debug("Compressed {} bytes into {} ({:.1f}% saved)", input.size(), out.size(), ratio);
    co_return compression_outcome{std::move(out), ratio};
}

gzip_decompressor::gzip_decompressor(consumer out)
    : _out(std::move(out))
{
    std::memset(&_zs, 0, sizeof(_zs));
    if (inflateInit2(&_zs, 16 + MAX_WBITS) != Z_OK) {
        throw std::bad_alloc();
    }
}

gzip_decompressor::~gzip_decompressor() {
    inflateEnd(&_zs);
}

future<> gzip_decompressor::feed(temporary_buffer<char> in) {
    _zs.next_in = reinterpret_cast<Bytef*>(in.get_write());
    _zs.avail_in = uInt(in.size());
    bool output_full = false;
    while (_zs.avail_in > 0 || output_full) {
        if (_member_done) {
            if (_zs.avail_in == 0) {
                break;
            }
            if (inflateReset(&_zs) != Z_OK) {
                throw transfer_error(error_kind::decompression_failure, "cannot start next gzip member");
            }
            _member_done = false;
        }
        temporary_buffer<char> block(inflate_block_size);
        _zs.next_out = reinterpret_cast<Bytef*>(block.get_write());
        _zs.avail_out = uInt(block.size());
        int rc = ::inflate(&_zs, Z_NO_FLUSH);
        if (rc == Z_STREAM_END) {
            _member_done = true;
        } else if (rc != Z_OK && rc != Z_BUF_ERROR) {
            throw transfer_error(error_kind::decompression_failure,
                    fmt::format("corrupt gzip stream: {}", _zs.msg ? _zs.msg : zError(rc)));
        }
        output_full = _zs.avail_out == 0;
        block.trim(block.size() - _zs.avail_out);
        if (!block.empty()) {
            co_await _out(std::move(block));
        }
        if (rc == Z_BUF_ERROR && !output_full) {
            break;
        }
        co_await coroutine::maybe_yield();
    }
}

future<> gzip_decompressor::finish() {
    if (!_member_done) {
        return make_exception_future<>(transfer_error(error_kind::decompression_failure, "truncated gzip stream"));
    }
    return make_ready_future<>();
}

future<temporary_buffer<char>> gzip_decompress(temporary_buffer<char> input) {
    std::vector<temporary_buffer<char>> blocks;
    size_t total = 0;
    gzip_decompressor inflater([&blocks, &total] (temporary_buffer<char> block) {
        total += block.size();
        blocks.push_back(std::move(block));
        return make_ready_future<>();
    });
    co_await inflater.feed(std::move(input));
    co_await inflater.finish();

    temporary_buffer<char> out(total);
    size_t pos = 0;
    for (const auto& b : blocks) {
        std::copy_n(b.get(), b.size(), out.get_write() + pos);
        pos += b.size();
    }
    co_return out;
}

} // namespace transfer
