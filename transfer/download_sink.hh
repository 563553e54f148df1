/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <filesystem>
#include <optional>
#include <vector>

#include <seastar/core/file.hh>
#include <seastar/core/iostream.hh>
#include <seastar/core/temporary_buffer.hh>

namespace transfer {

using namespace seastar;

// Destination of a download. Bytes arrive in order; truncate() rewinds
// before a restart.
class download_sink {
public:
    virtual ~download_sink() = default;

    virtual future<> put(temporary_buffer<char> buf) = 0;
    // Only rewinding to 0 or staying at size() is supported.
    virtual future<> truncate(uint64_t size) = 0;
    virtual uint64_t size() const noexcept = 0;
    // The body is complete; inflates it when `compressed`.
    virtual future<> finalize(bool compressed) = 0;
    virtual future<> close() = 0;
};

class memory_sink : public download_sink {
    std::vector<temporary_buffer<char>> _buffers;
    uint64_t _size = 0;
    std::optional<temporary_buffer<char>> _content;
public:
    future<> put(temporary_buffer<char> buf) override;
    future<> truncate(uint64_t size) override;
    uint64_t size() const noexcept override { return _size; }
    future<> finalize(bool compressed) override;
    future<> close() override;

    // Final bytes, valid after finalize().
    const temporary_buffer<char>& content() const;
};

// Writes into "<path>.part" and moves the result to `path` on finalize.
// A ".part" left by an interrupted run can be adopted and resumed.
class file_sink : public download_sink {
    std::filesystem::path _path;
    std::filesystem::path _part_path;
    std::optional<output_stream<char>> _out;
    uint64_t _size = 0;

    future<> open();
    future<> close_stream();
    future<> inflate_into_place();
public:
    explicit file_sink(std::filesystem::path path);

    // Takes over an existing "<path>.part" so that size() reports the bytes
    // it holds. Returns false when there is none.
    future<bool> adopt_partial();

    future<> put(temporary_buffer<char> buf) override;
    future<> truncate(uint64_t size) override;
    uint64_t size() const noexcept override { return _size; }
    future<> finalize(bool compressed) override;
    future<> close() override;

    const std::filesystem::path& path() const noexcept { return _path; }
};

} // namespace transfer
