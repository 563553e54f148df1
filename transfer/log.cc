/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "transfer/log.hh"

namespace transfer {

seastar::logger xlog("transfer");

} // namespace transfer
