#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <string>

namespace spool::network {

enum class HttpMethod {
    Get,
    Post,
    Delete
};

struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string path;
    std::string query;          // without the leading '?'
    QByteArray body;
    std::string authorization;  // full header value, e.g. "Token abc"
};

struct HttpResponse {
    int status{200};
    QByteArray body;

    [[nodiscard]] bool is_success() const noexcept { return status >= 200 && status < 300; }
};

/**
 * HttpChannel - Authenticated request/response transport used by the
 * sync engine.
 *
 * Implementations attach credentials and return an error only when no
 * response arrived (ErrorCode::Transport). Non-2xx responses are
 * returned as responses.
 */
class HttpChannel {
public:
    virtual ~HttpChannel() = default;

    [[nodiscard]] virtual Result<HttpResponse, Error> send(const HttpRequest& request) = 0;
};

} // namespace spool::network
