/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include <csignal>

#include <seastar/core/app-template.hh>
#include <seastar/core/condition-variable.hh>
#include <seastar/core/coroutine.hh>
#include <seastar/core/reactor.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/util/log.hh>

#include "assembler/blob_store.hh"
#include "assembler/chunk_assembler.hh"
#include "assembler/handlers.hh"

using namespace seastar;
namespace bpo = boost::program_options;

static logger blog("blobshare");

class stop_signal {
    bool _caught = false;
    condition_variable _cond;

    void signaled() {
        if (_caught) {
            return;
        }
        _caught = true;
        _cond.broadcast();
    }
public:
    stop_signal() {
        engine().handle_signal(SIGINT, [this] { signaled(); });
        engine().handle_signal(SIGTERM, [this] { signaled(); });
    }
    ~stop_signal() {
        // There's no way to unregister a handler yet, so register a no-op handler instead.
        engine().handle_signal(SIGINT, [] {});
        engine().handle_signal(SIGTERM, [] {});
    }
    future<> wait() {
        return _cond.wait([this] { return _caught; });
    }
};

int main(int argc, char** argv) {
    app_template app;
    app.add_options()
        ("address", bpo::value<std::string>()->default_value("127.0.0.1"), "address to listen on")
        ("port", bpo::value<uint16_t>()->default_value(8080), "port to listen on")
        ("retention-hours", bpo::value<unsigned>()->default_value(24), "how long assembled files stay downloadable")
    ;

    return app.run(argc, argv, [&app] () -> future<int> {
        const auto& cfg = app.configuration();
        assembler::assembler_config acfg;
        acfg.retention = std::chrono::hours(cfg["retention-hours"].as<unsigned>());

        assembler::memory_blob_store blobs;
        assembler::chunk_assembler chunks(blobs, acfg);
        assembler::store_server server(chunks);
        stop_signal stop;

        std::exception_ptr ex;
        try {
            co_await server.listen(socket_address(net::inet_address(cfg["address"].as<std::string>()), cfg["port"].as<uint16_t>()));
            co_await stop.wait();
            blog.info("Shutting down");
        } catch (...) {
            ex = std::current_exception();
        }
        co_await server.stop();
        if (ex) {
            blog.error("Server failed: {}", ex);
            co_return 1;
        }
        co_return 0;
    });
}
