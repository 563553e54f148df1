/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "test/lib/fake_remote_store.hh"

#include <algorithm>

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>

#include "test/lib/log.hh"

using namespace seastar;
using namespace std::chrono_literals;

namespace tests {

namespace {

class fragment_source : public data_source_impl {
    temporary_buffer<char> _data;
    size_t _fragment;
    std::optional<uint64_t> _stall_at;
    abort_source* _as;
    uint64_t _pos = 0;
public:
    fragment_source(temporary_buffer<char> data, size_t fragment, std::optional<uint64_t> stall_at, abort_source* as)
        : _data(std::move(data)), _fragment(fragment), _stall_at(stall_at), _as(as) {}

    future<temporary_buffer<char>> get() override {
        if (_stall_at && _pos >= *_stall_at) {
            if (!_as) {
                throw std::logic_error("a stalled body needs an abort source");
            }
            co_await seastar::sleep_abortable(1h, *_as);
        }
        if (_data.empty()) {
            co_return temporary_buffer<char>();
        }
        auto n = std::min(_fragment, _data.size());
        if (_stall_at && _pos < *_stall_at) {
            n = std::min<uint64_t>(n, *_stall_at - _pos);
        }
        auto out = _data.share(0, n);
        _data.trim_front(n);
        _pos += n;
        co_return out;
    }
};

} // anonymous namespace

transfer::file_record fake_remote_store::add_file(std::string id, std::string name, temporary_buffer<char> data,
        bool compressed, uint64_t original_size, std::chrono::system_clock::time_point uploaded_at) {
    transfer::file_record r{
        .id = id,
        .original_name = std::move(name),
        .size = data.size(),
        .original_size = original_size ? original_size : data.size(),
        .compressed = compressed,
        .uploaded_at = std::chrono::floor<std::chrono::milliseconds>(uploaded_at),
        .blob_locator = store::object_path(id),
    };
    objects[r.blob_locator] = std::move(data);
    records[id] = r;
    return r;
}

future<store::chunk_ack> fake_remote_store::upload_chunk(const store::chunk_request& req, temporary_buffer<char> bytes, abort_source* as) {
    ++chunk_calls;
    if (as && as->abort_requested()) {
        throw abort_requested_exception();
    }
    if (!chunk_failures.empty()) {
        auto e = chunk_failures.front();
        chunk_failures.pop_front();
        testlog.debug("Failing chunk {} of {}: {}", req.chunk_index, req.session_id, e.what());
        throw e;
    }
    accepted_chunks.push_back(req);
    auto& parts = _chunks[req.session_id];
    if (parts.size() <= req.chunk_index) {
        parts.resize(req.chunk_index + 1);
    }
    parts[req.chunk_index] = std::move(bytes);

    store::chunk_ack ack{.accepted = true, .chunk_index = req.chunk_index, .total_chunks = req.total_chunks};
    if (req.chunk_index + 1 < req.total_chunks || skip_completion) {
        co_return ack;
    }
    size_t total = 0;
    for (auto& p : parts) {
        total += p.size();
    }
    temporary_buffer<char> joined(total);
    size_t pos = 0;
    for (auto& p : parts) {
        std::copy_n(p.get(), p.size(), joined.get_write() + pos);
        pos += p.size();
    }
    _chunks.erase(req.session_id);
    auto record = add_file(req.session_id, req.original_file_name, std::move(joined), req.compressed, req.original_size);
    record.compression_ratio = req.compression_ratio;
    records[record.id] = record;
    ack.completed = true;
    ack.download_locator = record.blob_locator;
    ack.record = record;
    co_return ack;
}

future<> fake_remote_store::get_object(std::string locator, std::optional<uint64_t> offset, store::object_handler handler, abort_source* as) {
    requested_offsets.push_back(offset);
    auto it = objects.find(locator);
    if (it == objects.end()) {
        throw transfer::transfer_error(transfer::error_kind::not_found, fmt::format("{} not found", locator));
    }
    auto data = it->second.share();
    const uint64_t size = data.size();
    store::object_reply rep;
    if (offset && *offset > 0 && !ignore_ranges) {
        if (*offset >= size) {
            throw transfer::make_status_error(transfer::http_status::range_not_satisfiable, "range not satisfiable");
        }
        data.trim_front(*offset);
        rep.status = http::reply::status_type::partial_content;
        rep.range = store::content_range{*offset, size - 1, size};
    } else {
        rep.status = http::reply::status_type::ok;
    }
    rep.content_length = data.size();
    if (truncate_body_at) {
        data.trim(std::min<uint64_t>(data.size(), *truncate_body_at));
        truncate_body_at.reset();
    }
    auto stall = std::exchange(stall_after, std::nullopt);
    auto in = input_stream<char>(data_source(std::make_unique<fragment_source>(std::move(data), fragment_size, stall, as)));
    co_await handler(rep, std::move(in));
}

future<transfer::file_record> fake_remote_store::get_metadata(std::string file_id, abort_source*) {
    ++metadata_calls;
    auto it = records.find(file_id);
    if (it == records.end()) {
        throw transfer::transfer_error(transfer::error_kind::not_found, fmt::format("file {} not found", file_id));
    }
    co_return it->second;
}

future<> fake_remote_store::delete_file(std::string file_id, abort_source*) {
    ++delete_calls;
    auto it = records.find(file_id);
    if (it != records.end()) {
        objects.erase(it->second.blob_locator);
        records.erase(it);
    }
    co_return;
}

} // namespace tests
