/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <seastar/core/semaphore.hh>
#include <seastar/core/shared_ptr.hh>
#include <seastar/http/client.hh>
#include <seastar/net/inet_address.hh>
#include <seastar/net/tls.hh>
#include <seastar/util/log.hh>

namespace utils::http {

seastar::future<seastar::shared_ptr<seastar::tls::certificate_credentials>> system_trust_credentials();

struct url_info {
    std::string scheme;
    std::string host;
    std::string path;
    uint16_t port;

    bool is_https() const;
};

// Accepts scheme://host[:port][/path], with bracketed numeric IPv6 hosts.
url_info parse_simple_url(std::string_view uri);

// Resolves the host once, then hands out connections round robin over the
// resolved addresses. invalidate() forces a fresh lookup for the next one.
class dns_connection_factory : public seastar::http::experimental::connection_factory {
    std::string _host;
    uint16_t _port;
    bool _use_https;
    seastar::logger& _logger;
    std::vector<seastar::net::inet_address> _addresses;
    size_t _next = 0;
    seastar::shared_ptr<seastar::tls::certificate_credentials> _creds;
    seastar::semaphore _init_semaphore{1};

    seastar::future<> resolve();
    seastar::future<seastar::net::inet_address> get_address();

public:
    dns_connection_factory(std::string host, uint16_t port, bool use_https, seastar::logger& logger);
    dns_connection_factory(const url_info& url, seastar::logger& logger);

    seastar::future<seastar::connected_socket> make(seastar::abort_source*) override;
    void invalidate() noexcept;
};

} // namespace utils::http
