#pragma once

#include <stdexcept>
#include <string>
#include <fmt/core.h>

namespace ais::http {

// Base for every failure raised while dispatching a request
class RequestError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConnectionError : public RequestError {
public:
    using RequestError::RequestError;
};

class TimeoutError : public RequestError {
public:
    using RequestError::RequestError;
};

class ConnectTimeout : public TimeoutError {
public:
    using TimeoutError::TimeoutError;
};

class ReadTimeout : public TimeoutError {
public:
    using TimeoutError::TimeoutError;
};

// Server answered with a non-2xx status
class HttpError : public RequestError {
public:
    HttpError(const long status, std::string message)
        : RequestError(fmt::format("HTTP {}: {}", status, message)),
          status_(status), message_(std::move(message)) {}

    [[nodiscard]] long status() const noexcept { return status_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    long status_;
    std::string message_;
};

}
