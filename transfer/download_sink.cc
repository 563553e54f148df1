/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/download_sink.hh"

#include <algorithm>
#include <stdexcept>

#include <fmt/format.h>
#include <seastar/core/coroutine.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>

#include "transfer/compression.hh"

namespace transfer {

future<> memory_sink::put(temporary_buffer<char> buf) {
    _size += buf.size();
    _buffers.push_back(std::move(buf));
    return make_ready_future<>();
}

future<> memory_sink::truncate(uint64_t size) {
    if (size == _size) {
        return make_ready_future<>();
    }
    if (size != 0) {
        return make_exception_future<>(std::invalid_argument(fmt::format("cannot truncate {} bytes to {}", _size, size)));
    }
    _buffers.clear();
    _size = 0;
    _content.reset();
    return make_ready_future<>();
}

future<> memory_sink::finalize(bool compressed) {
    temporary_buffer<char> joined(_size);
    size_t pos = 0;
    for (const auto& b : _buffers) {
        std::copy_n(b.get(), b.size(), joined.get_write() + pos);
        pos += b.size();
    }
    _buffers.clear();
    if (compressed) {
        _content = co_await gzip_decompress(std::move(joined));
    } else {
        _content = std::move(joined);
    }
}

future<> memory_sink::close() {
    return make_ready_future<>();
}

const temporary_buffer<char>& memory_sink::content() const {
    if (!_content) {
        throw std::logic_error("download is not finalized");
    }
    return *_content;
}

file_sink::file_sink(std::filesystem::path path)
    : _path(std::move(path))
    , _part_path(_path.native() + ".part")
{}

future<> file_sink::open() {
    auto f = co_await open_file_dma(_part_path.native(), open_flags::wo | open_flags::create | open_flags::truncate);
    _out = co_await make_file_output_stream(std::move(f));
    _size = 0;
}

future<bool> file_sink::adopt_partial() {
    if (_out || !co_await file_exists(_part_path.native())) {
        co_return false;
    }
    // File output streams always start at offset 0, so the held bytes are
    // copied into a fresh ".part" before new ones are appended.
    auto held_path = _part_path.native() + ".held";
    co_await rename_file(_part_path.native(), held_path);
    co_await open();
    auto in = make_file_input_stream(co_await open_file_dma(held_path, open_flags::ro));
    std::exception_ptr ex;
    try {
        while (auto buf = co_await in.read()) {
            _size += buf.size();
            co_await _out->write(std::move(buf));
        }
    } catch (...) {
        ex = std::current_exception();
    }
    co_await in.close();
    if (ex) {
        _size = 0;
        co_await rename_file(held_path, _part_path.native());
        co_await close_stream();
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    co_await remove_file(held_path);
    co_return true;
}

future<> file_sink::close_stream() {
    if (!_out) {
        co_return;
    }
    auto out = std::move(*_out);
    _out.reset();
    std::exception_ptr ex;
    try {
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await out.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
}

future<> file_sink::put(temporary_buffer<char> buf) {
    if (!_out) {
        co_await open();
    }
    _size += buf.size();
    co_await _out->write(std::move(buf));
}

future<> file_sink::truncate(uint64_t size) {
    if (size == _size && (_out || size == 0)) {
        co_return;
    }
    if (size != 0) {
        throw std::invalid_argument(fmt::format("cannot truncate {} to {} bytes", _part_path.native(), size));
    }
    co_await close_stream();
    co_await open();
}

future<> file_sink::inflate_into_place() {
    auto in = make_file_input_stream(co_await open_file_dma(_part_path.native(), open_flags::ro));
    auto out = co_await make_file_output_stream(
            co_await open_file_dma(_path.native(), open_flags::wo | open_flags::create | open_flags::truncate));
    std::exception_ptr ex;
    try {
        gzip_decompressor inflater([&out] (temporary_buffer<char> block) {
            return out.write(std::move(block));
        });
        while (auto buf = co_await in.read()) {
            co_await inflater.feed(std::move(buf));
        }
        co_await inflater.finish();
        co_await out.flush();
    } catch (...) {
        ex = std::current_exception();
    }
    co_await in.close();
    co_await out.close();
    if (ex) {
        co_await remove_file(_path.native());
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    co_await remove_file(_part_path.native());
}

future<> file_sink::finalize(bool compressed) {
    if (!_out) {
        co_await open();
    }
    co_await close_stream();
    if (compressed) {
        co_await inflate_into_place();
    } else {
        co_await rename_file(_part_path.native(), _path.native());
    }
}

future<> file_sink::close() {
    return close_stream();
}

} // namespace transfer
