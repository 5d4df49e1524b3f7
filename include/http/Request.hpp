#pragma once

#include "http/Headers.hpp"

#include <cstdint>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace ais::http {

enum class Method { Head, Get, Put, Delete };

constexpr const char* toString(const Method m) {
    switch (m) {
        case Method::Head:   return "HEAD";
        case Method::Get:    return "GET";
        case Method::Put:    return "PUT";
        case Method::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

using QueryParams = std::map<std::string, std::string>;

struct Request {
    Method method = Method::Get;
    std::string path;               // relative to the API root, e.g. "objects/bucket/obj"
    QueryParams params;
    Headers headers;                // extra request headers

    // Request body. Not owned; must outlive the request() call.
    std::istream* body = nullptr;
    std::optional<uintmax_t> bodySize;

    // Hand the response body back unread instead of buffering it
    bool stream = false;
};

}
