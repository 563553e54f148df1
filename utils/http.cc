/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "utils/http.hh"

#include <strings.h>

#include <boost/regex.hpp>
#include <fmt/ranges.h>
#include <seastar/core/coroutine.hh>
#include <seastar/net/dns.hh>

using namespace seastar;

static const char HTTPS[] = "https";

future<shared_ptr<tls::certificate_credentials>> utils::http::system_trust_credentials() {
    static thread_local shared_ptr<tls::certificate_credentials> system_trust_credentials;
    if (!system_trust_credentials) {
        auto cred = make_shared<tls::certificate_credentials>();
        co_await cred->set_system_trust();
        system_trust_credentials = std::move(cred);
    }
    co_return system_trust_credentials;
}

utils::http::dns_connection_factory::dns_connection_factory(std::string host, uint16_t port, bool use_https, logger& logger)
    : _host(std::move(host))
    , _port(port)
    , _use_https(use_https)
    , _logger(logger)
{}

utils::http::dns_connection_factory::dns_connection_factory(const url_info& url, logger& logger)
    : dns_connection_factory(url.host, url.port, url.is_https(), logger)
{}

future<> utils::http::dns_connection_factory::resolve() {
    if (auto numeric = net::inet_address::parse_numerical(_host)) {
        _addresses = {*numeric};
        co_return;
    }
    auto hent = co_await net::dns::get_host_by_name(_host, net::inet_address::family::INET);
    std::vector<net::inet_address> addresses;
    for (const auto& entry : hent.addr_entries) {
        addresses.push_back(entry.addr);
    }
    if (addresses.empty()) {
        throw std::system_error(EHOSTUNREACH, std::system_category(), fmt::format("No addresses for host {}", _host));
    }
    _addresses = std::move(addresses);
    _logger.debug("Resolved {} to {}", _host, _addresses);
}

future<net::inet_address> utils::http::dns_connection_factory::get_address() {
    if (_addresses.empty()) [[unlikely]] {
        auto units = co_await get_units(_init_semaphore, 1);
        if (_addresses.empty()) {
            co_await resolve();
        }
    }
    co_return _addresses[_next++ % _addresses.size()];
}

void utils::http::dns_connection_factory::invalidate() noexcept {
    _addresses.clear();
}

future<connected_socket> utils::http::dns_connection_factory::make(abort_source*) {
    auto socket_addr = socket_address(co_await get_address(), _port);
    if (_use_https) {
        if (!_creds) {
            _creds = co_await system_trust_credentials();
        }
        _logger.debug("Making new HTTPS connection addr={} host={}", socket_addr, _host);
        co_return co_await tls::connect(_creds, socket_addr, tls::tls_options{.server_name = _host});
    }
    _logger.debug("Making new HTTP connection addr={} host={}", socket_addr, _host);
    co_return co_await seastar::connect(socket_addr, {}, transport::TCP);
}

utils::http::url_info utils::http::parse_simple_url(std::string_view uri) {
    // Numeric IPv6 hosts come bracketed when a port follows: http://[2001:db8::1]:8080
    static boost::regex simple_url(R"foo(([a-zA-Z]+):\/\/((?:\[[^\]]+\])|[^\/:]+)(:\d+)?(\/.*)?)foo");

    boost::smatch m;
    std::string tmp(uri);
    if (!boost::regex_match(tmp, m, simple_url)) {
        throw std::invalid_argument(fmt::format("Could not parse URI {}", uri));
    }

    auto scheme = m[1].str();
    auto host = m[2].str();
    auto port = m[3].str();
    auto path = m[4].str();
    bool https = strcasecmp(scheme.c_str(), HTTPS) == 0;

    if (host.size() > 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return url_info {
        .scheme = std::move(scheme),
        .host = std::move(host),
        .path = std::move(path),
        .port = uint16_t(port.empty() ? (https ? 443 : 80) : std::stoi(port.substr(1)))
    };
}

bool utils::http::url_info::is_https() const {
    return strcasecmp(scheme.c_str(), HTTPS) == 0;
}
