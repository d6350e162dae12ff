#include <QCommandLineParser>
#include <QCoreApplication>
#include <QSettings>
#include <QTextStream>

#include "config/settings.hpp"
#include "crypto/keys.hpp"
#include "logging/file_logging.hpp"
#include "network/sync_engine.hpp"
#include "server/history_service.hpp"
#include "server/loopback_channel.hpp"
#include "server/session_store.hpp"
#include "server/sqlite_record_storage.hpp"
#include "storage/database.hpp"
#include "storage/history_repository.hpp"
#include "storage/migrations.hpp"

#include <chrono>

// End-to-end smoke check: two clients with disjoint histories sync
// through one in-process server, one deletion included, and must end
// up with identical stores.

namespace {

struct Client {
    spool::storage::Database db;
    spool::Uuid host_id;
};

bool open_client(Client& client) {
    auto db = spool::storage::Database::open_memory();
    if (db.is_err()) {
        qCritical().noquote() << QString::fromStdString(db.unwrap_err().describe());
        return false;
    }
    client.db = std::move(db).unwrap();
    auto migrated = spool::storage::initialize_local_database(client.db);
    if (migrated.is_err()) {
        qCritical().noquote() << QString::fromStdString(migrated.unwrap_err().describe());
        return false;
    }
    client.host_id = spool::Uuid::generate();
    return true;
}

bool seed(Client& client, const char* name, int records) {
    spool::storage::HistoryRepository repo(client.db);
    const auto base = spool::Timestamp::now();
    for (int i = 0; i < records; ++i) {
        auto record = spool::make_record(
            client.host_id,
            base + std::chrono::milliseconds(i),
            std::string("echo ") + name + " " + std::to_string(i),
            "/home/check",
            name);
        auto appended = repo.append(record);
        if (appended.is_err()) {
            qCritical().noquote() << QString::fromStdString(appended.unwrap_err().describe());
            return false;
        }
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("spool_sync_check");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Sync two in-process clients and verify convergence."));
    parser.addHelpOption();

    const QCommandLineOption recordsOption(
        QStringList{QStringLiteral("records")},
        QStringLiteral("Records to create on each client."),
        QStringLiteral("n"),
        QStringLiteral("50"));
    parser.addOption(recordsOption);

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("config")},
        QStringLiteral("INI file with sync/* settings (batch and page sizes)."),
        QStringLiteral("path"));
    parser.addOption(configOption);

    const QCommandLineOption logOption(
        QStringList{QStringLiteral("log")},
        QStringLiteral("Also write log output to this file."),
        QStringLiteral("path"));
    parser.addOption(logOption);

    parser.process(app);

    if (parser.isSet(logOption)) {
        auto installed = spool::logging::install_file_logging(parser.value(logOption));
        if (installed.is_err()) {
            qCritical().noquote() << QString::fromStdString(installed.unwrap_err().describe());
            return 1;
        }
    }

    bool ok = false;
    const int records = parser.value(recordsOption).toInt(&ok);
    if (!ok || records < 1) {
        qCritical() << "--records must be a positive integer";
        return 1;
    }

    spool::network::SyncOptions options;
    if (parser.isSet(configOption)) {
        QSettings settings(parser.value(configOption), QSettings::IniFormat);
        auto loaded = spool::config::load_sync_settings(settings);
        if (loaded.is_err()) {
            qCritical().noquote() << QString::fromStdString(loaded.unwrap_err().describe());
            return 1;
        }
        options = spool::config::to_sync_options(loaded.unwrap());
    }

    auto init = spool::crypto::init();
    if (init.is_err()) {
        qCritical().noquote() << QString::fromStdString(init.unwrap_err().describe());
        return 1;
    }

    auto server_db = spool::storage::Database::open_memory();
    if (server_db.is_err()) {
        qCritical().noquote() << QString::fromStdString(server_db.unwrap_err().describe());
        return 1;
    }
    auto& server_database = server_db.unwrap();
    auto server_schema = spool::storage::initialize_server_database(server_database);
    if (server_schema.is_err()) {
        qCritical().noquote() << QString::fromStdString(server_schema.unwrap_err().describe());
        return 1;
    }

    spool::server::SqliteRecordStorage storage(server_database);
    spool::server::SessionStore sessions;
    spool::server::HistoryService service(storage, sessions);

    Client a;
    Client b;
    if (!open_client(a) || !open_client(b)) {
        return 1;
    }
    if (!seed(a, "a", records) || !seed(b, "b", records)) {
        return 1;
    }

    // Delete one of A's records before it ever syncs.
    spool::storage::HistoryRepository repo_a(a.db);
    spool::storage::HistoryRepository repo_b(b.db);
    auto first = repo_a.list(1);
    if (first.is_err() || first.unwrap().empty()) {
        qCritical() << "client A has no history";
        return 1;
    }
    const auto deleted_id = first.unwrap().front().id;
    auto deleted = repo_a.mark_deleted(deleted_id, spool::Timestamp::now());
    if (deleted.is_err()) {
        qCritical().noquote() << QString::fromStdString(deleted.unwrap_err().describe());
        return 1;
    }

    const auto key = spool::crypto::generate_key();
    spool::server::LoopbackChannel channel_a(service, sessions.create_session("check"));
    spool::server::LoopbackChannel channel_b(service, sessions.create_session("check"));
    spool::network::SyncEngine engine_a(a.db, channel_a, key, options);
    spool::network::SyncEngine engine_b(b.db, channel_b, key, options);

    QTextStream out(stdout);
    for (int round = 0; round < 2; ++round) {
        for (auto* engine : {&engine_a, &engine_b}) {
            auto report = engine->run_cycle();
            if (report.is_err()) {
                qCritical().noquote() << QString::fromStdString(report.unwrap_err().describe());
                return 2;
            }
            out << "round " << round
                << " pushed=" << report.unwrap().pushed
                << " pulled=" << report.unwrap().pulled
                << " merged=" << report.unwrap().merged
                << " failures=" << report.unwrap().failures.size() << Qt::endl;
        }
    }

    auto live_a = repo_a.count();
    auto live_b = repo_b.count();
    auto all_a = repo_a.count(true);
    auto all_b = repo_b.count(true);
    auto on_b = repo_b.get(deleted_id);
    if (live_a.is_err() || live_b.is_err() || all_a.is_err() || all_b.is_err() || on_b.is_err()) {
        qCritical() << "failed to read client stores";
        return 1;
    }

    out << "live a=" << live_a.unwrap() << " b=" << live_b.unwrap()
        << " total a=" << all_a.unwrap() << " b=" << all_b.unwrap() << Qt::endl;

    const int64_t expected_live = 2 * static_cast<int64_t>(records) - 1;
    const bool converged = live_a.unwrap() == expected_live && live_b.unwrap() == expected_live &&
                           all_a.unwrap() == all_b.unwrap();
    const bool tombstoned = on_b.unwrap() && on_b.unwrap()->is_deleted();
    if (!converged || !tombstoned) {
        out << "NOT CONVERGED" << Qt::endl;
        return 2;
    }
    out << "converged" << Qt::endl;
    return 0;
}
