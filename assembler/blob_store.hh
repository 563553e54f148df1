/*
 * Copyright (C) 2025-present ScyllaDB
 */

/*
 * SPDX-License-Identifier: LicenseRef-ScyllaDB-Source-Available-1.0
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <seastar/core/future.hh>
#include <seastar/core/temporary_buffer.hh>

namespace assembler {

using namespace seastar;

// Flat key/value blob storage backing the assembler.
class blob_store {
public:
    virtual ~blob_store() = default;

    virtual future<> put(std::string key, temporary_buffer<char> data) = 0;
    virtual future<std::optional<temporary_buffer<char>>> get(std::string key) = 0;
    // Returns false when there was nothing to remove.
    virtual future<bool> remove(std::string key) = 0;
    virtual future<std::vector<std::string>> list(std::string prefix) = 0;
};

class memory_blob_store : public blob_store {
    std::map<std::string, temporary_buffer<char>> _blobs;
public:
    future<> put(std::string key, temporary_buffer<char> data) override;
    future<std::optional<temporary_buffer<char>>> get(std::string key) override;
    future<bool> remove(std::string key) override;
    future<std::vector<std::string>> list(std::string prefix) override;

    size_t size() const noexcept { return _blobs.size(); }
    bool contains(const std::string& key) const { return _blobs.contains(key); }
};

} // namespace assembler
