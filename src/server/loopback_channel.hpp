#pragma once

#include "network/channel.hpp"
#include "server/history_service.hpp"

#include <string>

namespace spool::server {

/**
 * LoopbackChannel - Hands requests straight to an in-process
 * HistoryService, attaching a fixed session token.
 */
class LoopbackChannel : public network::HttpChannel {
public:
    LoopbackChannel(HistoryService& service, std::string token)
        : service_(service), token_(std::move(token)) {}

    [[nodiscard]] Result<network::HttpResponse, Error> send(
        const network::HttpRequest& request) override {
        network::HttpRequest authorized = request;
        authorized.authorization = "Token " + token_;
        return Result<network::HttpResponse, Error>::ok(service_.handle(authorized));
    }

    void set_token(std::string token) { token_ = std::move(token); }

private:
    HistoryService& service_;
    std::string token_;
};

} // namespace spool::server
