#include "config/settings.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QStandardPaths>
#include <QUrl>
#include <optional>

namespace spool::config {

namespace {

QString key_name(const char* key) {
    return QString::fromLatin1(key);
}

QString default_data_file(const char* name) {
    const auto base = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation);
    if (base.isEmpty()) {
        return QString::fromLatin1(name);
    }
    return QDir(base).filePath(QString::fromLatin1(name));
}

// Missing keys yield `fallback`; present but invalid values yield nullopt.
std::optional<int64_t> read_int(QSettings& settings, const char* key,
                                int64_t fallback, int64_t min, int64_t max) {
    const auto value = settings.value(key_name(key));
    if (!value.isValid()) {
        return fallback;
    }
    bool ok = false;
    const auto parsed = value.toString().trimmed().toLongLong(&ok);
    if (!ok || parsed < min || parsed > max) {
        return std::nullopt;
    }
    return parsed;
}

Error invalid(const char* key, const std::string& detail) {
    return Error{ErrorCode::InvalidConfig, std::string(key) + ": " + detail};
}

} // namespace

Result<SyncSettings, Error> load_sync_settings(QSettings& settings) {
    SyncSettings out;

    out.address = settings.value(key_name(kSyncAddress), QString::fromLatin1(kDefaultAddress))
                      .toString().trimmed().toStdString();
    const QUrl url(QString::fromStdString(out.address), QUrl::StrictMode);
    if (!url.isValid() || (url.scheme() != "http" && url.scheme() != "https") ||
        url.host().isEmpty()) {
        return Result<SyncSettings, Error>::err(
            invalid(kSyncAddress, "expected an http(s) URL, got \"" + out.address + "\""));
    }

    auto frequency = read_int(settings, kSyncFrequencySeconds, out.frequency.count(),
                              0, 7 * 24 * 3600);
    if (!frequency) {
        return Result<SyncSettings, Error>::err(
            invalid(kSyncFrequencySeconds, "expected 0 to 604800 seconds"));
    }
    out.frequency = std::chrono::seconds(*frequency);

    out.auto_sync = settings.value(key_name(kSyncAutoSync), out.auto_sync).toBool();

    auto batch = read_int(settings, kSyncPushBatchSize,
                          static_cast<int64_t>(out.push_batch_size),
                          1, static_cast<int64_t>(network::MAX_BATCH_RECORDS));
    if (!batch) {
        return Result<SyncSettings, Error>::err(invalid(kSyncPushBatchSize,
            "expected 1 to " + std::to_string(network::MAX_BATCH_RECORDS)));
    }
    out.push_batch_size = static_cast<size_t>(*batch);

    auto page = read_int(settings, kSyncPageSize, out.page_size, 1, network::MAX_PAGE_SIZE);
    if (!page) {
        return Result<SyncSettings, Error>::err(invalid(kSyncPageSize,
            "expected 1 to " + std::to_string(network::MAX_PAGE_SIZE)));
    }
    out.page_size = *page;

    auto backoff = read_int(settings, kSyncMaxBackoffSeconds, out.max_backoff.count(),
                            1, 7 * 24 * 3600);
    if (!backoff) {
        return Result<SyncSettings, Error>::err(
            invalid(kSyncMaxBackoffSeconds, "expected 1 to 604800 seconds"));
    }
    out.max_backoff = std::chrono::seconds(*backoff);

    out.db_path = settings.value(key_name(kPathsDb), default_data_file("history.db")).toString();
    out.key_path = settings.value(key_name(kPathsKey), default_data_file("key")).toString();
    if (out.db_path.isEmpty() || out.key_path.isEmpty()) {
        return Result<SyncSettings, Error>::err(invalid(kPathsDb, "paths must not be empty"));
    }

    return Result<SyncSettings, Error>::ok(std::move(out));
}

network::SyncOptions to_sync_options(const SyncSettings& settings) {
    return network::SyncOptions{
        .scope = settings.address,
        .push_batch_size = settings.push_batch_size,
        .page_size = settings.page_size
    };
}

Uuid get_or_create_host_id(QSettings& settings) {
    const QString host_id_key = key_name(kSyncHostId);
    QString stored_id = settings.value(host_id_key).toString();
    if (!stored_id.isEmpty()) {
        auto parsed_id = Uuid::parse(stored_id.toStdString());
        if (parsed_id && !parsed_id->is_nil()) {
            return *parsed_id;
        }
    }
    auto id = Uuid::generate();
    settings.setValue(host_id_key, QString::fromStdString(id.to_string()));
    settings.sync();
    return id;
}

Result<void, Error> save_key(const QString& path, const crypto::SyncKey& key) {
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        return fail(ErrorCode::IoFailure,
                    "Cannot create directory " + info.absolutePath().toStdString());
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return fail(ErrorCode::IoFailure,
                    "Cannot write key file " + path.toStdString() + ": " +
                    file.errorString().toStdString());
    }
    if (!file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner)) {
        return fail(ErrorCode::IoFailure,
                    "Cannot restrict permissions of key file " + path.toStdString());
    }

    const auto encoded = crypto::key_to_base64(key);
    const auto written = file.write(encoded.data(), static_cast<qint64>(encoded.size()));
    if (written != static_cast<qint64>(encoded.size()) || !file.flush()) {
        return fail(ErrorCode::IoFailure,
                    "Short write to key file " + path.toStdString());
    }
    return Result<void, Error>::ok();
}

Result<crypto::SyncKey, Error> load_key(const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        return fail<crypto::SyncKey>(ErrorCode::NotFound,
                                     "No key file at " + path.toStdString());
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return fail<crypto::SyncKey>(ErrorCode::IoFailure,
                                     "Cannot read key file " + path.toStdString() + ": " +
                                     file.errorString().toStdString());
    }
    const auto contents = file.readAll().trimmed().toStdString();
    return crypto::key_from_base64(contents);
}

Result<crypto::SyncKey, Error> load_or_create_key(const QString& path) {
    auto loaded = load_key(path);
    if (loaded.is_ok() || loaded.unwrap_err().code != ErrorCode::NotFound) {
        return loaded;
    }

    const auto key = crypto::generate_key();
    auto saved = save_key(path, key);
    if (saved.is_err()) {
        return Result<crypto::SyncKey, Error>::err(saved.unwrap_err());
    }
    return Result<crypto::SyncKey, Error>::ok(key);
}

} // namespace spool::config
