#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "crypto/keys.hpp"
#include "network/sync_engine.hpp"

#include <QSettings>
#include <QString>
#include <chrono>
#include <cstdint>
#include <string>

namespace spool::config {

// QSettings keys.
constexpr const char* kSyncAddress = "sync/address";
constexpr const char* kSyncFrequencySeconds = "sync/frequency_seconds";
constexpr const char* kSyncAutoSync = "sync/auto_sync";
constexpr const char* kSyncPushBatchSize = "sync/push_batch_size";
constexpr const char* kSyncPageSize = "sync/page_size";
constexpr const char* kSyncMaxBackoffSeconds = "sync/max_backoff_seconds";
constexpr const char* kSyncHostId = "sync/host_id";
constexpr const char* kPathsDb = "paths/db";
constexpr const char* kPathsKey = "paths/key";

constexpr const char* kDefaultAddress = "https://api.spool.sh";

struct SyncSettings {
    std::string address{kDefaultAddress};
    std::chrono::seconds frequency{3600};
    bool auto_sync{true};
    size_t push_batch_size{100};
    int64_t page_size{network::DEFAULT_PAGE_SIZE};
    std::chrono::seconds max_backoff{6 * 3600};
    QString db_path;
    QString key_path;
};

/**
 * Read sync settings, filling defaults for missing keys. Values that are
 * present but unusable (non-numeric, out of range, bad address) fail
 * with InvalidConfig instead of silently falling back.
 */
[[nodiscard]] Result<SyncSettings, Error> load_sync_settings(QSettings& settings);

[[nodiscard]] network::SyncOptions to_sync_options(const SyncSettings& settings);

/**
 * This machine's host id: generated on first use and stored under
 * sync/host_id so it survives restarts.
 */
[[nodiscard]] Uuid get_or_create_host_id(QSettings& settings);

/**
 * Write the sync key as base64, readable by the owner only.
 */
[[nodiscard]] Result<void, Error> save_key(const QString& path, const crypto::SyncKey& key);

/**
 * NotFound when the file does not exist.
 */
[[nodiscard]] Result<crypto::SyncKey, Error> load_key(const QString& path);

/**
 * Load the key, or generate and save a new one when none exists yet.
 */
[[nodiscard]] Result<crypto::SyncKey, Error> load_or_create_key(const QString& path);

} // namespace spool::config
