#pragma once

#include "http/Request.hpp"
#include "http/Response.hpp"

namespace ais::http {

/**
 * Executes a single HTTP request against the cluster.
 *
 * Implementations throw a RequestError subclass on transport failure and
 * HttpError on any non-2xx status; a returned Response is always successful.
 */
class Dispatcher {
public:
    virtual ~Dispatcher() = default;

    virtual Response request(const Request& req) = 0;
};

}
