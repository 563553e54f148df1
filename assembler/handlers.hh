/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <memory>

#include <seastar/http/handlers.hh>
#include <seastar/http/httpd.hh>

#include "assembler/chunk_assembler.hh"

namespace assembler {

// Serves the upload, download, metadata and delete endpoints on top of a
// chunk_assembler. Errors are answered with the mapped status and a JSON body.
class store_handler : public seastar::httpd::handler_base {
    chunk_assembler& _assembler;

    future<std::unique_ptr<http::reply>> put_chunk(std::string_view session_id, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep);
    future<std::unique_ptr<http::reply>> get_object(std::string_view file_id, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep);
    future<std::unique_ptr<http::reply>> get_metadata(std::string_view file_id, std::unique_ptr<http::reply> rep);
    future<std::unique_ptr<http::reply>> delete_object(std::string_view file_id, std::unique_ptr<http::reply> rep);
public:
    explicit store_handler(chunk_assembler& assembler) : _assembler(assembler) {}

    future<std::unique_ptr<http::reply>> handle(const sstring& path, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) override;
};

// Single-shard HTTP front end for an assembler. Owns the handler.
class store_server {
    chunk_assembler& _assembler;
    std::unique_ptr<seastar::httpd::handler_base> _handler;
    seastar::httpd::http_server _server;
public:
    explicit store_server(chunk_assembler& assembler, std::unique_ptr<seastar::httpd::handler_base> handler = nullptr);

    future<> listen(socket_address addr);
    future<> stop();
};

} // namespace assembler
