/**
 * Snapshot Backend
 *
 * Persists the whole table set to a single text file.
 *
 * SAFETY FEATURES:
 * - Atomic saves: write to <path>.tmp, fsync, then rename over <path>
 * - Checksum validation: FNV-1a over the record lines, stored in a footer
 * - Load is all-or-nothing: a corrupt or truncated file leaves the store empty
 *
 * Record format: one row per line, tab-separated fields, the first field names
 * the table. Tabs, newlines and '%' inside strings are percent-escaped.
 */

#pragma once

#include "store.hpp"
#include <string>

namespace hashfleet {
namespace store {

class SnapshotBackend : public StoreBackend {
public:
    explicit SnapshotBackend(std::string path) : path_(std::move(path)) {}

    Status save(const Tables& tables) override;
    Status load(Tables& tables) override;

    const std::string& path() const { return path_; }

    static uint32_t compute_checksum(const std::string& body);

    // Exposed for tests
    static std::string serialize(const Tables& tables);
    static Status deserialize(const std::string& text, Tables& tables);

private:
    std::string path_;
};

}  // namespace store
}  // namespace hashfleet
