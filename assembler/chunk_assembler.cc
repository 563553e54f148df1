/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "assembler/chunk_assembler.hh"

#include <algorithm>
#include <cctype>

#include <seastar/core/coroutine.hh>
#include <seastar/core/sleep.hh>
#include <seastar/coroutine/maybe_yield.hh>
#include <seastar/util/log.hh>

#include "transfer/errors.hh"

static seastar::logger alog("assembler");

using transfer::error_kind;
using transfer::transfer_error;

namespace assembler {

static bool valid_id(std::string_view id) {
    return !id.empty() && id.size() <= 128 && std::ranges::all_of(id, [] (char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_';
    });
}

static std::string safe_name(std::string_view name) {
    std::string out(name);
    std::ranges::replace(out, '/', '_');
    return out;
}

chunk_assembler::chunk_assembler(blob_store& blobs, assembler_config cfg)
    : _blobs(blobs)
    , _cfg(cfg)
    , _fetch_retry(cfg.fetch_attempts, cfg.fetch_base_delay)
{}

std::string chunk_assembler::chunk_key(std::string_view session_id, unsigned index) {
    return fmt::format("temp/{}/chunk_{:04}", session_id, index);
}

std::string chunk_assembler::object_key(const transfer::file_record& record) {
    return fmt::format("files/{}_{}{}", record.id, safe_name(record.original_name), record.compressed ? ".gz" : "");
}

std::string chunk_assembler::metadata_key(std::string_view file_id) {
    return fmt::format("metadata_{}.json", file_id);
}

future<store::chunk_ack> chunk_assembler::accept_chunk(store::chunk_request req, temporary_buffer<char> bytes,
        std::chrono::system_clock::time_point now) {
    if (!valid_id(req.session_id)) {
        throw transfer_error(error_kind::remote_rejected, fmt::format("invalid session id '{}'", req.session_id));
    }
    if (req.total_chunks == 0 || req.chunk_index >= req.total_chunks) {
        throw transfer_error(error_kind::remote_rejected,
                fmt::format("chunk index {} out of range for {} chunks", req.chunk_index, req.total_chunks));
    }
    alog.debug("Chunk {}/{} of session {}: {} bytes", req.chunk_index + 1, req.total_chunks, req.session_id, bytes.size());
    co_await _blobs.put(chunk_key(req.session_id, req.chunk_index), std::move(bytes));

    store::chunk_ack ack{
        .accepted = true,
        .chunk_index = req.chunk_index,
        .total_chunks = req.total_chunks,
    };
    if (req.chunk_index + 1 < req.total_chunks) {
        co_return ack;
    }

    auto record = co_await assemble(req, now);
    ack.completed = true;
    ack.download_locator = record.blob_locator;
    ack.record = std::move(record);
    co_return ack;
}

future<temporary_buffer<char>> chunk_assembler::fetch_chunk(const std::string& session_id, unsigned index, unsigned total) {
    unsigned attempts = 0;
    while (true) {
        ++attempts;
        auto chunk = co_await _blobs.get(chunk_key(session_id, index));
        if (chunk) {
            co_return std::move(*chunk);
        }
        transfer_error missing(error_kind::incomplete_assembly,
                fmt::format("chunk {} of {} for session {} is missing", index, total, session_id), transfer::retryable::yes);
        if (!_fetch_retry.should_retry(missing, attempts)) {
            throw transfer_error(error_kind::incomplete_assembly, missing.what());
        }
        auto delay = _fetch_retry.delay_before_retry(missing, attempts);
        alog.debug("{}, looking again in {}ms", missing.what(), delay.count());
        co_await seastar::sleep(delay);
    }
}

future<transfer::file_record> chunk_assembler::assemble(const store::chunk_request& req, std::chrono::system_clock::time_point now) {
    std::vector<temporary_buffer<char>> parts;
    parts.reserve(req.total_chunks);
    size_t total = 0;
    for (unsigned i = 0; i < req.total_chunks; ++i) {
        parts.push_back(co_await fetch_chunk(req.session_id, i, req.total_chunks));
        total += parts.back().size();
    }

    temporary_buffer<char> joined(total);
    size_t pos = 0;
    for (const auto& p : parts) {
        std::copy_n(p.get(), p.size(), joined.get_write() + pos);
        pos += p.size();
        co_await coroutine::maybe_yield();
    }
    parts.clear();

    transfer::file_record record{
        .id = req.session_id,
        .original_name = req.original_file_name,
        .size = total,
        .original_size = req.original_size,
        .compressed = req.compressed,
        .compression_ratio = req.compression_ratio,
        .uploaded_at = std::chrono::floor<std::chrono::milliseconds>(now),
        .blob_locator = store::object_path(req.session_id),
    };
    co_await _blobs.put(object_key(record), std::move(joined));
    auto json = transfer::dump_file_record(record);
    co_await _blobs.put(metadata_key(record.id), temporary_buffer<char>(json.data(), json.size()));
    alog.info("Assembled {} ({} bytes{}) from {} chunk(s) as {}", record.original_name, record.size,
            record.compressed ? ", gzip" : "", req.total_chunks, record.id);

    co_await drop_chunks(req.session_id);
    co_return record;
}

future<> chunk_assembler::drop_chunks(const std::string& session_id) {
    auto keys = co_await _blobs.list(fmt::format("temp/{}/", session_id));
    for (auto& key : keys) {
        try {
            co_await _blobs.remove(key);
        } catch (...) {
            // Leftover chunks only waste space
            alog.warn("Failed to remove {}: {}", key, std::current_exception());
        }
    }
}

future<transfer::file_record> chunk_assembler::metadata(std::string file_id, std::chrono::system_clock::time_point now) {
    if (!valid_id(file_id)) {
        throw transfer_error(error_kind::not_found, fmt::format("file {} not found", file_id));
    }
    auto blob = co_await _blobs.get(metadata_key(file_id));
    if (!blob) {
        throw transfer_error(error_kind::not_found, fmt::format("file {} not found", file_id));
    }
    auto record = transfer::parse_file_record(std::string_view(blob->get(), blob->size()));
    if (record.expired(now, _cfg.retention)) {
        throw transfer_error(error_kind::expired, fmt::format("file {} has expired", file_id));
    }
    co_return record;
}

future<std::pair<transfer::file_record, temporary_buffer<char>>> chunk_assembler::object(std::string file_id,
        std::chrono::system_clock::time_point now) {
    auto record = co_await metadata(file_id, now);
    auto data = co_await _blobs.get(object_key(record));
    if (!data) {
        throw transfer_error(error_kind::not_found, fmt::format("contents of file {} are gone", file_id));
    }
    co_return std::make_pair(std::move(record), std::move(*data));
}

future<> chunk_assembler::remove(std::string file_id) {
    if (!valid_id(file_id)) {
        co_return;
    }
    auto blob = co_await _blobs.get(metadata_key(file_id));
    if (!blob) {
        alog.debug("File {} is already gone", file_id);
        co_return;
    }
    auto record = transfer::parse_file_record(std::string_view(blob->get(), blob->size()));
    co_await _blobs.remove(object_key(record));
    co_await _blobs.remove(metadata_key(file_id));
    alog.info("Removed {} ({})", file_id, record.original_name);
}

} // namespace assembler
