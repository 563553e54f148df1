/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "test/lib/store_fixture.hh"

#include <seastar/core/coroutine.hh>
#include <seastar/net/inet_address.hh>

#include "store/protocol.hh"
#include "test/lib/log.hh"
#include "test/lib/random_utils.hh"

using namespace seastar;

namespace tests {

namespace {

class injecting_handler : public httpd::handler_base {
    store_fixture& _fixture;
    assembler::store_handler _inner;
public:
    injecting_handler(store_fixture& fixture, assembler::chunk_assembler& assembler)
        : _fixture(fixture), _inner(assembler) {}

    future<std::unique_ptr<http::reply>> handle(const sstring& path, std::unique_ptr<http::request> req, std::unique_ptr<http::reply> rep) override {
        testlog.debug("{}\t{}", req->_method, req->get_url());
        if (req->_method == "PUT") {
            ++_fixture.upload_requests;
            if (_fixture.fail_uploads > 0) {
                --_fixture.fail_uploads;
                rep->set_status(http::reply::status_type::service_unavailable);
                auto body = store::dump_error("injected failure", "transient_network");
                rep->write_body("json", sstring(body.data(), body.size()));
                return make_ready_future<std::unique_ptr<http::reply>>(std::move(rep));
            }
        } else if (req->_method == "GET") {
            auto it = req->_headers.find("Range");
            if (it != req->_headers.end()) {
                _fixture.range_headers.emplace_back(it->second.data(), it->second.size());
                if (_fixture.ignore_ranges) {
                    req->_headers.erase(it);
                }
            }
        }
        return _inner.handle(path, std::move(req), std::move(rep));
    }
};

} // anonymous namespace

store_fixture::store_fixture(assembler::assembler_config cfg)
    : _assembler(_blobs, cfg)
    , _server(_assembler, std::make_unique<injecting_handler>(*this, _assembler))
    , _port(random::get_int<uint16_t>(20000, 60000))
{}

std::string store_fixture::url() const {
    return fmt::format("http://127.0.0.1:{}", _port);
}

future<> store_fixture::start() {
    co_await _server.listen(socket_address(net::inet_address("127.0.0.1"), _port));
    _client = store::client::make(url());
    testlog.info("Store listening on {}", url());
}

future<> store_fixture::stop() {
    if (_client) {
        co_await _client->close();
    }
    co_await _server.stop();
}

} // namespace tests
