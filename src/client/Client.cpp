#include "client/Client.hpp"
#include "http/CurlDispatcher.hpp"

#include <stdexcept>
#include <utility>

using namespace ais::client;
using namespace ais::http;

Client::Client(const config::ClientConfig& cfg)
: dispatcher_(std::make_shared<CurlDispatcher>(cfg)) {}

Client::Client(std::shared_ptr<Dispatcher> dispatcher)
: dispatcher_(std::move(dispatcher)) {
    if (!dispatcher_) throw std::invalid_argument("Client requires a dispatcher");
}

Response Client::request(const Request& req) const {
    return dispatcher_->request(req);
}

Bucket Client::bucket(std::string name, std::string provider, std::string ns) const {
    return {*this, std::move(name), std::move(provider), std::move(ns)};
}
