/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "assembler/handlers.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/util/log.hh>

#include "store/protocol.hh"
#include "transfer/errors.hh"

static seastar::logger hlog("assembler_http");

using transfer::error_kind;
using transfer::transfer_error;

namespace assembler {

static sstring to_sstring(std::string_view s) {
    return sstring(s.data(), s.size());
}

static void reply_error(http::reply& rep, const transfer_error& e) {
    rep.set_status(transfer::to_http_status(e.kind()));
    auto body = store::dump_error(e.what(), transfer::to_string(e.kind()));
    rep.write_body("json", to_sstring(body));
}

static std::optional<std::string_view> strip_prefix(std::string_view path, std::string_view prefix) {
    if (!path.starts_with(prefix) || path.size() == prefix.size()) {
        return std::nullopt;
    }
    return path.substr(prefix.size());
}

future<std::unique_ptr<http::reply>> store_handler::handle(const sstring& path, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) {
    auto method = req->_method;
    const std::string url_path(path.data(), path.size());
    std::string_view p(url_path);
    hlog.trace("{} {}", method, req->get_url());

    std::exception_ptr ex;
    try {
        if (method == "PUT") {
            if (auto id = strip_prefix(p, "/upload/")) {
                co_return co_await put_chunk(*id, std::move(req), std::move(rep));
            }
        } else if (method == "GET") {
            if (auto id = strip_prefix(p, "/files/")) {
                co_return co_await get_object(*id, std::move(req), std::move(rep));
            }
            if (auto id = strip_prefix(p, "/metadata/")) {
                co_return co_await get_metadata(*id, std::move(rep));
            }
        } else if (method == "DELETE") {
            if (auto id = strip_prefix(p, "/files/")) {
                co_return co_await delete_object(*id, std::move(rep));
            }
        }
    } catch (...) {
        ex = std::current_exception();
    }
    if (!rep) {
        rep = std::make_unique<http::reply>();
    }
    if (ex) {
        auto err = transfer::classify(ex);
        if (err.kind() != error_kind::not_found && err.kind() != error_kind::expired) {
            hlog.warn("{} {} failed: {}", method, url_path, err.what());
        }
        reply_error(*rep, err);
    } else {
        reply_error(*rep, transfer_error(error_kind::not_found, fmt::format("no route for {} {}", method, url_path)));
    }
    co_return std::move(rep);
}

future<std::unique_ptr<http::reply>> store_handler::put_chunk(std::string_view session_id, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) {
    auto creq = store::decode_chunk_request(session_id, req->query_parameters);
    auto body = temporary_buffer<char>(req->content.data(), req->content.size());
    auto ack = co_await _assembler.accept_chunk(std::move(creq), std::move(body));
    auto json = store::dump_chunk_ack(ack);
    rep->set_status(http::reply::status_type::ok);
    rep->write_body("json", to_sstring(json));
    co_return std::move(rep);
}

future<std::unique_ptr<http::reply>> store_handler::get_object(std::string_view file_id, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) {
    auto [record, data] = co_await _assembler.object(std::string(file_id));
    const uint64_t size = data.size();
    auto range_header = req->get_header("Range");
    rep->add_header("Accept-Ranges", "bytes");

    if (range_header.empty()) {
        rep->set_status(http::reply::status_type::ok);
        rep->write_body("bin", sstring(data.get(), data.size()));
        co_return std::move(rep);
    }

    auto range = store::parse_range_header(std::string_view(range_header.data(), range_header.size()));
    if (!range || range->first >= size) {
        hlog.debug("Unsatisfiable range '{}' for {} ({} bytes)", range_header, file_id, size);
        rep->set_status(transfer::http_status::range_not_satisfiable);
        rep->add_header("Content-Range", to_sstring(fmt::format("bytes */{}", size)));
        rep->write_body("json", to_sstring(store::dump_error("requested range not satisfiable", "remote_rejected")));
        co_return std::move(rep);
    }
    auto last = std::min(range->last.value_or(size - 1), size - 1);
    rep->set_status(http::reply::status_type::partial_content);
    rep->add_header("Content-Range", to_sstring(store::format_content_range({range->first, last, size})));
    rep->write_body("bin", sstring(data.get() + range->first, last - range->first + 1));
    co_return std::move(rep);
}

future<std::unique_ptr<http::reply>> store_handler::get_metadata(std::string_view file_id, std::unique_ptr<http::reply> rep) {
    auto record = co_await _assembler.metadata(std::string(file_id));
    auto json = transfer::dump_file_record(record);
    rep->set_status(http::reply::status_type::ok);
    rep->write_body("json", to_sstring(json));
    co_return std::move(rep);
}

future<std::unique_ptr<http::reply>> store_handler::delete_object(std::string_view file_id, std::unique_ptr<http::reply> rep) {
    co_await _assembler.remove(std::string(file_id));
    rep->set_status(http::reply::status_type::no_content);
    co_return std::move(rep);
}

store_server::store_server(chunk_assembler& assembler, std::unique_ptr<seastar::httpd::handler_base> handler)
    : _assembler(assembler)
    , _handler(handler ? std::move(handler) : std::make_unique<store_handler>(_assembler))
    , _server("blobshare")
{
    _server._routes.add_default_handler(_handler.get());
}

future<> store_server::listen(socket_address addr) {
    hlog.info("Listening on {}", addr);
    return _server.listen(addr);
}

future<> store_server::stop() {
    return _server.stop();
}

} // namespace assembler
