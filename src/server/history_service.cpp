#include "server/history_service.hpp"

#include "network/protocol.hpp"

#include <QDebug>
#include <QLoggingCategory>
#include <QString>

Q_LOGGING_CATEGORY(spoolServerLog, "spool.server")

namespace spool::server {

using network::HttpMethod;
using network::HttpRequest;
using network::HttpResponse;

namespace {

constexpr std::string_view AUTH_SCHEME = "Token ";

HttpResponse error_response(int status, const std::string& message) {
    return HttpResponse{status, network::encode_error(QString::fromStdString(message))};
}

int status_for(ErrorCode code) {
    switch (code) {
        case ErrorCode::MalformedPayload: return 400;
        case ErrorCode::Unauthorized: return 401;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::PayloadTooLarge: return 413;
        default: return 500;
    }
}

HttpResponse failure(const Error& error, const std::string& account_id) {
    const int status = status_for(error.code);
    if (status == 500) {
        qCritical().noquote() << "SERVER: storage failure for account"
                              << QString::fromStdString(account_id) << ":"
                              << QString::fromStdString(error.describe());
        return error_response(status, "internal error");
    }
    qCDebug(spoolServerLog).noquote() << "rejected request:"
                                      << QString::fromStdString(error.describe());
    return error_response(status, error.message);
}

} // namespace

std::optional<std::string> HistoryService::authenticate(const HttpRequest& request) const {
    std::string_view header = request.authorization;
    if (header.substr(0, AUTH_SCHEME.size()) != AUTH_SCHEME) {
        return std::nullopt;
    }
    return sessions_.resolve(header.substr(AUTH_SCHEME.size()));
}

HttpResponse HistoryService::handle(const HttpRequest& request) {
    if (request.body.size() > network::MAX_BODY_BYTES) {
        return error_response(413, "request body too large");
    }

    auto account = authenticate(request);
    if (!account) {
        return error_response(401, "invalid or missing session token");
    }

    if (request.path == "/history") {
        switch (request.method) {
            case HttpMethod::Post: return push(*account, request);
            case HttpMethod::Get: return pull(*account, request);
            default: return error_response(405, "method not allowed");
        }
    }
    if (request.path == "/history/count") {
        if (request.method != HttpMethod::Get) {
            return error_response(405, "method not allowed");
        }
        return count(*account);
    }
    if (request.path == "/history/index") {
        if (request.method != HttpMethod::Get) {
            return error_response(405, "method not allowed");
        }
        return index(*account);
    }
    if (request.path == "/account") {
        if (request.method != HttpMethod::Delete) {
            return error_response(405, "method not allowed");
        }
        return delete_account(*account);
    }
    return error_response(404, "no route for " + request.path);
}

HttpResponse HistoryService::push(const std::string& account_id, const HttpRequest& request) {
    auto batch = network::decode_push_batch(request.body);
    if (batch.is_err()) {
        return failure(batch.unwrap_err(), account_id);
    }

    auto inserted = storage_.upsert_batch(account_id, batch.unwrap());
    if (inserted.is_err()) {
        return failure(inserted.unwrap_err(), account_id);
    }

    qCDebug(spoolServerLog) << "push account=" << QString::fromStdString(account_id)
                            << "records=" << batch.unwrap().size()
                            << "new=" << inserted.unwrap();
    return HttpResponse{200, network::encode_push_ack(
        static_cast<int64_t>(batch.unwrap().size()))};
}

HttpResponse HistoryService::pull(const std::string& account_id, const HttpRequest& request) {
    auto query = network::decode_pull_query(request.query);
    if (query.is_err()) {
        return failure(query.unwrap_err(), account_id);
    }

    auto page = storage_.page_since(account_id, query.unwrap().since, query.unwrap().limit);
    if (page.is_err()) {
        return failure(page.unwrap_err(), account_id);
    }

    network::PullResponse response{
        .records = std::move(page.unwrap().records),
        .has_more = page.unwrap().has_more
    };
    return HttpResponse{200, network::encode_pull_response(response)};
}

HttpResponse HistoryService::count(const std::string& account_id) {
    auto bounds = storage_.log_bounds(account_id);
    if (bounds.is_err()) {
        return failure(bounds.unwrap_err(), account_id);
    }
    return HttpResponse{200, network::encode_count(network::LogStatus{
        .count = bounds.unwrap().count,
        .max_seq = bounds.unwrap().max_seq,
        .erased_through = bounds.unwrap().erased_through
    })};
}

HttpResponse HistoryService::index(const std::string& account_id) {
    auto hosts = storage_.host_index(account_id);
    if (hosts.is_err()) {
        return failure(hosts.unwrap_err(), account_id);
    }

    std::vector<network::HostSummary> summaries;
    summaries.reserve(hosts.unwrap().size());
    for (const auto& host : hosts.unwrap()) {
        summaries.push_back({host.host_token, host.count, host.last_seq});
    }
    return HttpResponse{200, network::encode_host_index(summaries)};
}

HttpResponse HistoryService::delete_account(const std::string& account_id) {
    auto deleted = storage_.delete_account_data(account_id);
    if (deleted.is_err()) {
        return failure(deleted.unwrap_err(), account_id);
    }

    const auto ended = sessions_.revoke_all(account_id);
    qInfo().noquote() << "SERVER: deleted account" << QString::fromStdString(account_id)
                      << "and ended" << ended << "session(s)";
    return HttpResponse{204, {}};
}

} // namespace spool::server
