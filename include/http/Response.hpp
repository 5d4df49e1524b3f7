#pragma once

#include "http/Headers.hpp"

#include <cstddef>
#include <memory>
#include <string>

namespace ais::http {

/**
 * Pull-based source for a response body that is still on the wire.
 * The owner must close() it (or destroy it) to release the connection.
 */
class BodyReader {
public:
    virtual ~BodyReader() = default;

    // Copies up to len bytes into dst; returns 0 once the body is exhausted.
    virtual size_t read(char* dst, size_t len) = 0;

    virtual void close() = 0;
};

struct Response {
    long status = 0;
    Headers headers;
    std::string body;                       // buffered requests only
    std::unique_ptr<BodyReader> stream;     // streamed requests only

    [[nodiscard]] bool ok() const { return status / 100 == 2; }
};

}
