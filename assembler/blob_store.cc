/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#include "assembler/blob_store.hh"

namespace assembler {

future<> memory_blob_store::put(std::string key, temporary_buffer<char> data) {
    _blobs.insert_or_assign(std::move(key), std::move(data));
    return make_ready_future<>();
}

future<std::optional<temporary_buffer<char>>> memory_blob_store::get(std::string key) {
    auto it = _blobs.find(key);
    if (it == _blobs.end()) {
        return make_ready_future<std::optional<temporary_buffer<char>>>(std::nullopt);
    }
    return make_ready_future<std::optional<temporary_buffer<char>>>(it->second.share());
}

future<bool> memory_blob_store::remove(std::string key) {
    return make_ready_future<bool>(_blobs.erase(key) > 0);
}

future<std::vector<std::string>> memory_blob_store::list(std::string prefix) {
    std::vector<std::string> keys;
    for (auto it = _blobs.lower_bound(prefix); it != _blobs.end() && it->first.starts_with(prefix); ++it) {
        keys.push_back(it->first);
    }
    return make_ready_future<std::vector<std::string>>(std::move(keys));
}

} // namespace assembler
