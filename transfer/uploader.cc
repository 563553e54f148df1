/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/uploader.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/core/fstream.hh>
#include <seastar/core/seastar.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/util/short_streams.hh>

#include "transfer/chunk_splitter.hh"
#include "transfer/compression.hh"
#include "transfer/log.hh"

namespace transfer {

future<upload_source> read_upload_source(std::filesystem::path path) {
    auto f = co_await open_file_dma(path.native(), open_flags::ro);
    auto in = make_file_input_stream(std::move(f));
    std::exception_ptr ex;
    sstring content;
    try {
        content = co_await util::read_entire_stream_contiguous(in);
    } catch (...) {
        ex = std::current_exception();
    }
    co_await in.close();
    if (ex) {
        co_await coroutine::return_exception_ptr(std::move(ex));
    }
    co_return upload_source{
        .file_name = path.filename().native(),
        .mime_type = std::string(guess_mime_type(path.filename().native())),
        .data = temporary_buffer<char>(content.data(), content.size()),
    };
}

uploader::uploader(store::remote_store& store, session_registry& sessions, transfer_config_ptr cfg, compress_func compress)
    : _store(store)
    , _sessions(sessions)
    , _cfg(std::move(cfg))
    , _retry(_cfg->max_attempts, _cfg->retry_base_delay)
    , _chunks(_store, _retry)
    , _compress(std::move(compress))
{}

lw_shared_ptr<transfer_session> uploader::prepare(const upload_source& src) {
    auto session = _sessions.create(session_kind::upload, src.file_name);
    session->set_total_bytes(src.data.size());
    session->arm();
    return session;
}

future<result<file_record>> uploader::upload(upload_source src) {
    auto session = prepare(src);
    return upload(std::move(session), std::move(src));
}

future<result<file_record>> uploader::upload(lw_shared_ptr<transfer_session> session, upload_source src) {
    std::exception_ptr ex;
    try {
        auto record = co_await do_upload(*session, std::move(src));
        session->set_status(session_status::completed);
        session->notify();
        _sessions.retire(session->id());
        co_return record;
    } catch (...) {
        ex = std::current_exception();
    }
    auto err = classify(ex);
    if (session->cancel_requested()) {
        err = transfer_error(error_kind::cancelled, "upload cancelled");
    }
    if (err.kind() == error_kind::cancelled) {
        xlog.info("Upload of {} (session {}) cancelled", session->file_name(), session->id());
    } else {
        xlog.error("Upload of {} (session {}) failed: {}: {}", session->file_name(), session->id(), err.kind(), err.what());
    }
    session->set_status(session_status::error, err.what());
    session->notify();
    _sessions.retire(session->id());
    co_return transfer_failure::from(err);
}

future<file_record> uploader::do_upload(transfer_session& session, upload_source src) {
    auto* as = session.current_abort_source();
    if (!as) {
        as = &session.arm();
    }
    const uint64_t original_size = src.data.size();
    auto mime_type = src.mime_type.empty() ? std::string(guess_mime_type(src.file_name)) : src.mime_type;
    auto payload = std::move(src.data);
    auto policy = _cfg->compression();
    bool compressed = false;
    double ratio = 0;

    if (should_compress(src.file_name, mime_type, original_size, policy)) {
        session.set_status(session_status::compressing);
        session.notify();
        std::optional<compression_outcome> outcome;
        std::exception_ptr ex;
        try {
            outcome = co_await _compress(payload, policy.level);
        } catch (...) {
            ex = std::current_exception();
        }
        if (ex) {
            auto err = transfer_error(error_kind::compression_failure, classify(ex).what());
            xlog.warn("Compressing {} failed, sending it uncompressed: {}", src.file_name, err.what());
            session.set_warning(transfer_failure::from(err));
            session.set_status(session_status::compressing, std::string(describe(err.kind())));
            session.notify();
        }
        if (outcome && worth_keeping(*outcome, policy)) {
            xlog.debug("Compressed {} from {} to {} bytes ({:.1f}% saved)", src.file_name, original_size, outcome->data.size(), outcome->ratio_percent);
            payload = std::move(outcome->data);
            ratio = outcome->ratio_percent;
            compressed = true;
        } else if (outcome) {
            xlog.debug("Compression of {} saves only {:.1f}%, sending it uncompressed", src.file_name, outcome->ratio_percent);
        }
    }
    as->check();

    auto ranges = split_into_chunks(payload.size(), _cfg->chunk_size);
    std::vector<transfer_unit> units;
    units.reserve(ranges.size());
    for (const auto& r : ranges) {
        units.push_back(transfer_unit{.index = r.index, .size_bytes = r.size()});
    }
    session.set_units(std::move(units));
    session.set_total_bytes(payload.size());
    session.set_compression_ratio(ratio);
    session.set_status(session_status::uploading);
    session.notify();
    xlog.info("Uploading {} as session {}: {} bytes in {} chunk(s){}", src.file_name, session.id(), payload.size(), ranges.size(),
            compressed ? fmt::format(", gzip {:.1f}% smaller", ratio) : "");

    store::chunk_request req{
        .session_id = session.id(),
        .total_chunks = unsigned(ranges.size()),
        .original_file_name = src.file_name,
        .original_size = original_size,
        .compressed = compressed,
        .compression_ratio = ratio,
    };
    rate_sampler sampler(_cfg->upload_sample_interval, clock_type::now());

    for (const auto& r : ranges) {
        as->check();
        req.chunk_index = r.index;
        auto res = co_await _chunks.upload(session, req, payload.share(r.start, r.size()));
        if (!res) {
            throw res.failure().to_error();
        }
        session.add_transferred(r.size());
        bool last = r.index + 1 == ranges.size();
        if (sampler.maybe_sample(clock_type::now(), session.transferred_bytes(), session.total_bytes(), last)) {
            session.update_rate(sampler);
        }
        session.notify(r.index);
        if (!last) {
            continue;
        }

        auto& ack = res.value();
        if (!ack.completed || !ack.record) {
            throw transfer_error(error_kind::incomplete_assembly,
                    fmt::format("store acknowledged the last chunk of {} without assembling the file", src.file_name));
        }
        auto record = std::move(*ack.record);
        if (record.blob_locator.empty() && ack.download_locator) {
            record.blob_locator = *ack.download_locator;
        }
        xlog.info("Uploaded {} as file {}", src.file_name, record.id);
        co_return record;
    }
    // split_into_chunks never returns an empty list
    throw transfer_error(error_kind::incomplete_assembly, fmt::format("no chunks were sent for {}", src.file_name));
}

future<std::vector<result<file_record>>> uploader::upload_all(std::vector<upload_source> sources) {
    std::vector<result<file_record>> results;
    results.reserve(sources.size());
    for (auto& src : sources) {
        results.push_back(co_await upload(std::move(src)));
    }
    co_return results;
}

future<result<file_record>> uploader::upload_file(std::filesystem::path path) {
    std::exception_ptr ex;
    try {
        auto src = co_await read_upload_source(path);
        co_return co_await upload(std::move(src));
    } catch (...) {
        ex = std::current_exception();
    }
    auto err = classify(ex);
    xlog.error("Cannot upload {}: {}", path.native(), err.what());
    co_return transfer_failure{error_kind::local_io, err.what()};
}

} // namespace transfer
