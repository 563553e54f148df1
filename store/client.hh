/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <chrono>
#include <string>

#include <boost/program_options.hpp>
#include <seastar/core/shared_ptr.hh>

#include "store/remote_store.hh"
#include "store/retryable_http_client.hh"
#include "transfer/retry_strategy.hh"

namespace store {

struct endpoint_config {
    uint16_t port = 80;
    bool use_https = false;
    unsigned max_connections = 4;
    // Metadata and delete calls are idempotent and retried on their own.
    unsigned metadata_attempts = 3;
    std::chrono::milliseconds metadata_retry_delay{1000};
};

using endpoint_config_ptr = seastar::lw_shared_ptr<endpoint_config>;

void add_options(boost::program_options::options_description_easy_init opts);
// Returns the endpoint host; cfg is filled from the same options.
std::string from_options(const boost::program_options::variables_map& vm, endpoint_config& cfg);

// HTTP client for the chunk assembler endpoints.
class client : public remote_store, public seastar::enable_shared_from_this<client> {
    std::string _host;
    endpoint_config_ptr _cfg;
    transfer::linear_retry_strategy _retry_strategy;
    retryable_http_client _http;

    struct private_tag {};
    std::string locator_path(const std::string& locator) const;
public:
    client(std::string host, endpoint_config_ptr cfg, private_tag);

    static seastar::shared_ptr<client> make(std::string host, endpoint_config_ptr cfg);
    // http[s]://host[:port]
    static seastar::shared_ptr<client> make(std::string url);

    const std::string& host() const noexcept { return _host; }

    seastar::future<chunk_ack> upload_chunk(const chunk_request& req, seastar::temporary_buffer<char> bytes,
            seastar::abort_source* as = nullptr) override;
    seastar::future<> get_object(std::string locator, std::optional<uint64_t> offset, object_handler handler,
            seastar::abort_source* as = nullptr) override;
    seastar::future<transfer::file_record> get_metadata(std::string file_id, seastar::abort_source* as = nullptr) override;
    seastar::future<> delete_file(std::string file_id, seastar::abort_source* as = nullptr) override;

    seastar::future<> close();
};

} // namespace store
