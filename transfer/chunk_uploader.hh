/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <optional>

#include <seastar/core/temporary_buffer.hh>

#include "store/remote_store.hh"
#include "transfer/errors.hh"
#include "transfer/progress.hh"
#include "transfer/result.hh"
#include "transfer/retry_strategy.hh"

namespace transfer {

enum class attempt_status { ok, retryable, fatal };

struct attempt_outcome {
    attempt_status status;
    std::optional<store::chunk_ack> ack;
    std::optional<transfer_error> error;
};

// Sends one chunk, retrying per the strategy. Unit state and the session's
// event channel are updated on every attempt.
class chunk_uploader {
    store::remote_store& _store;
    const retry_strategy& _retry;

    future<attempt_outcome> attempt(const store::chunk_request& req, temporary_buffer<char> bytes, abort_source* as);
public:
    chunk_uploader(store::remote_store& store, const retry_strategy& retry);

    future<result<store::chunk_ack>> upload(transfer_session& session, const store::chunk_request& req, temporary_buffer<char> bytes);
};

} // namespace transfer
