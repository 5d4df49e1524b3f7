#include "client/Bucket.hpp"
#include "client/Client.hpp"
#include "client/Object.hpp"
#include "client/constants.hpp"

#include <stdexcept>
#include <utility>

using namespace ais::client;
using namespace ais::http;

Bucket::Bucket(const Client& client, std::string name, std::string provider, std::string ns)
: client_(&client), name_(std::move(name)), provider_(std::move(provider)), ns_(std::move(ns)) {
    if (name_.empty()) throw std::invalid_argument("bucket name must not be empty");
}

QueryParams Bucket::qparam() const {
    QueryParams params{{QPARAM_PROVIDER, provider_}};
    if (!ns_.empty()) params.emplace(QPARAM_NAMESPACE, ns_);
    return params;
}

Response Bucket::request(const Request& req) const {
    return client_->request(req);
}

Object Bucket::object(std::string name) const {
    return {*this, std::move(name)};
}
