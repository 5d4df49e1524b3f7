#pragma once

#include "http/Request.hpp"
#include "http/Response.hpp"

#include <string>

namespace ais::client {

class Client;
class Object;

class Bucket {
public:
    Bucket(const Client& client, std::string name, std::string provider, std::string ns = "");

    [[nodiscard]] const Client& client() const { return *client_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& provider() const { return provider_; }
    [[nodiscard]] const std::string& ns() const { return ns_; }

    // Default query parameters scoping every request to this bucket. Returned by value.
    [[nodiscard]] http::QueryParams qparam() const;

    http::Response request(const http::Request& req) const;

    // The returned handle refers back to this bucket, which must outlive it
    [[nodiscard]] Object object(std::string name) const;

private:
    const Client* client_;
    std::string name_;
    std::string provider_;
    std::string ns_;
};

}
