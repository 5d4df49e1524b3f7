#include "http/curlErrors.hpp"
#include "http/errors.hpp"

#include <fmt/core.h>

namespace ais::http {

void throwCurlError(const CURLcode rc, const bool connected, const std::string& what, const std::string& detail) {
    const std::string msg = fmt::format("{}: {}", what, detail.empty() ? curl_easy_strerror(rc) : detail);

    switch (rc) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_SSL_CONNECT_ERROR:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
            throw ConnectionError(msg);
        case CURLE_OPERATION_TIMEDOUT:
            if (connected) throw ReadTimeout(msg);
            throw ConnectTimeout(msg);
        default:
            throw RequestError(msg);
    }
}

}
