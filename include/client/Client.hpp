#pragma once

#include "client/Bucket.hpp"
#include "client/constants.hpp"
#include "config/Config.hpp"
#include "http/Dispatcher.hpp"

#include <memory>
#include <string>

namespace ais::client {

/**
 * Entry point to a cluster: owns the shared request dispatcher and hands out
 * Bucket handles bound to it. Buckets and objects only borrow the client, so
 * it must outlive them.
 */
class Client {
public:
    explicit Client(const config::ClientConfig& cfg);
    explicit Client(std::shared_ptr<http::Dispatcher> dispatcher);

    http::Response request(const http::Request& req) const;

    [[nodiscard]] Bucket bucket(std::string name,
                                std::string provider = PROVIDER_AIS,
                                std::string ns = "") const;

    [[nodiscard]] const std::shared_ptr<http::Dispatcher>& dispatcher() const { return dispatcher_; }

private:
    std::shared_ptr<http::Dispatcher> dispatcher_;
};

}
