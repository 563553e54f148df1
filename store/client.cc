/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "store/client.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/coroutine/exception.hh>
#include <seastar/http/request.hh>
#include <seastar/util/log.hh>
#include <seastar/util/short_streams.hh>

#include "transfer/errors.hh"
#include "utils/http.hh"

using namespace seastar;
namespace bpo = boost::program_options;

static logger slog("store");

namespace store {

void add_options(bpo::options_description_easy_init opts) {
    const endpoint_config defaults;
    opts
        ("endpoint", bpo::value<std::string>()->default_value("http://127.0.0.1:8080"), "store endpoint, http[s]://host[:port]")
        ("connections", bpo::value<unsigned>()->default_value(defaults.max_connections), "maximum number of connections to the store")
    ;
}

std::string from_options(const bpo::variables_map& vm, endpoint_config& cfg) {
    auto url = utils::http::parse_simple_url(vm["endpoint"].as<std::string>());
    cfg.port = url.port;
    cfg.use_https = url.is_https();
    cfg.max_connections = vm["connections"].as<unsigned>();
    return url.host;
}

client::client(std::string host, endpoint_config_ptr cfg, private_tag)
    : _host(std::move(host))
    , _cfg(std::move(cfg))
    , _retry_strategy(_cfg->metadata_attempts, _cfg->metadata_retry_delay)
    , _http(std::make_unique<utils::http::dns_connection_factory>(_host, _cfg->port, _cfg->use_https, slog),
            _cfg->max_connections, _retry_strategy) {
}

shared_ptr<client> client::make(std::string host, endpoint_config_ptr cfg) {
    if (!cfg) {
        cfg = make_lw_shared<endpoint_config>();
    }
    return seastar::make_shared<client>(std::move(host), std::move(cfg), private_tag{});
}

shared_ptr<client> client::make(std::string url) {
    auto info = utils::http::parse_simple_url(url);
    auto cfg = make_lw_shared<endpoint_config>();
    cfg->port = info.port;
    cfg->use_https = info.is_https();
    return make(std::move(info.host), std::move(cfg));
}

std::string client::locator_path(const std::string& locator) const {
    if (locator.starts_with("/")) {
        return locator;
    }
    auto url = utils::http::parse_simple_url(locator);
    if (url.host != _host) {
        slog.warn("Locator {} points at {}, fetching it from {}", locator, url.host, _host);
    }
    return url.path.empty() ? "/" : url.path;
}

future<chunk_ack> client::upload_chunk(const chunk_request& creq, temporary_buffer<char> bytes, abort_source* as) {
    auto req = http::request::make("PUT", _host, upload_path(creq.session_id));
    encode_chunk_request(creq, req.query_parameters);
    auto len = bytes.size();
    slog.trace("PUT chunk {}/{} of session {} ({} bytes)", creq.chunk_index, creq.total_chunks, creq.session_id, len);
    req.write_body("bin", len, [buf = std::move(bytes)] (output_stream<char>&& out_) -> future<> {
        auto out = std::move(out_);
        std::exception_ptr ex;
        try {
            co_await out.write(buf.get(), buf.size());
            co_await out.flush();
        } catch (...) {
            ex = std::current_exception();
        }
        co_await out.close();
        if (ex) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
    });

    chunk_ack ack;
    co_await _http.make_request(std::move(req), [&ack] (const http::reply&, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        ack = parse_chunk_ack(std::string_view(body.data(), body.size()));
    }, http::reply::status_type::ok, as);
    co_return ack;
}

future<> client::get_object(std::string locator, std::optional<uint64_t> offset, object_handler handler, abort_source* as) {
    auto path = locator_path(locator);
    auto req = http::request::make("GET", _host, path);
    if (offset && *offset > 0) {
        req._headers["Range"] = format("bytes={}-", *offset);
    }
    slog.trace("GET {} from offset {}", path, offset.value_or(0));

    co_await _http.make_request(std::move(req), [handler = std::move(handler)] (const http::reply& rep, input_stream<char>&& in) mutable -> future<> {
        object_reply info{
            .status = rep._status,
            .content_length = rep.content_length,
        };
        if (rep._status == http::reply::status_type::partial_content) {
            auto header = rep.get_header("Content-Range");
            info.range = parse_content_range(std::string_view(header.data(), header.size()));
            if (!info.range) {
                throw transfer::transfer_error(transfer::error_kind::remote_rejected,
                        fmt::format("206 reply with malformed Content-Range '{}'", header));
            }
        }
        co_await handler(info, std::move(in));
    }, std::nullopt, as);
}

future<transfer::file_record> client::get_metadata(std::string file_id, abort_source* as) {
    auto req = http::request::make("GET", _host, metadata_path(file_id));
    std::optional<transfer::file_record> record;
    co_await _http.make_retryable_request(std::move(req), [&record] (const http::reply&, input_stream<char>&& in_) -> future<> {
        auto in = std::move(in_);
        auto body = co_await util::read_entire_stream_contiguous(in);
        record = transfer::parse_file_record(std::string_view(body.data(), body.size()));
    }, http::reply::status_type::ok, as);
    co_return std::move(*record);
}

future<> client::delete_file(std::string file_id, abort_source* as) {
    auto req = http::request::make("DELETE", _host, object_path(file_id));
    std::exception_ptr ex;
    try {
        co_await _http.make_retryable_request(std::move(req), [] (const http::reply&, input_stream<char>&& in_) -> future<> {
            auto in = std::move(in_);
            co_await util::skip_entire_stream(in);
        }, http::reply::status_type::no_content, as);
    } catch (...) {
        ex = std::current_exception();
    }
    if (ex) {
        auto err = transfer::classify(ex);
        if (err.kind() != transfer::error_kind::not_found) {
            co_await coroutine::return_exception_ptr(std::move(ex));
        }
        slog.debug("File {} was already deleted", file_id);
    }
}

future<> client::close() {
    return _http.close();
}

} // namespace store
