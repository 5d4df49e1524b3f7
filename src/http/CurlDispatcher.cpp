#include "http/CurlDispatcher.hpp"
#include "http/CurlBodyReader.hpp"
#include "http/curlErrors.hpp"
#include "http/errors.hpp"
#include "util/curlWrappers.hpp"
#include "util/httpHelpers.hpp"
#include "logging/LogRegistry.hpp"

#include <memory>
#include <stdexcept>
#include <string_view>
#include <utility>
#include <fmt/core.h>

using namespace ais::http;
using namespace ais::util;
using namespace ais::logging;

namespace {

std::string describe(const Request& req, const std::string& url) {
    return fmt::format("{} {}", toString(req.method), url);
}

}

CurlDispatcher::CurlDispatcher(config::ClientConfig cfg) : cfg_(std::move(cfg)) {
    if (cfg_.endpoint.empty()) throw std::invalid_argument("CurlDispatcher requires a non-empty endpoint");
    while (cfg_.endpoint.size() > 1 && cfg_.endpoint.back() == '/') cfg_.endpoint.pop_back();
    ensureCurlGlobalInit();
}

CurlDispatcher::~CurlDispatcher() = default;

std::string CurlDispatcher::buildUrl(const Request& req) const {
    CurlEasy tmpHandle;

    std::string_view path = req.path;
    while (!path.empty() && path.front() == '/') path.remove_prefix(1);

    std::string url = fmt::format("{}/{}/{}", cfg_.endpoint, API_VERSION,
                                  escapePathPreserveSlashes(tmpHandle, std::string(path)));

    if (const auto query = encodeQuery(tmpHandle, req.params); !query.empty()) url += "?" + query;
    return url;
}

Response CurlDispatcher::request(const Request& req) {
    if (req.body && req.method != Method::Put)
        throw std::invalid_argument(fmt::format("{} requests cannot carry a body", toString(req.method)));

    const std::string url = buildUrl(req);
    LogRegistry::http()->debug("[CurlDispatcher] {}{}", describe(req, url), req.stream ? " (stream)" : "");

    return req.stream ? performStreamed(req, url) : performBuffered(req, url);
}

void CurlDispatcher::applyOptions(CURL* h, const Request& req, const std::string& url, const SList& headers) const {
    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_USERAGENT, cfg_.user_agent.c_str());
    curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get());

    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(cfg_.connect_timeout_ms));
    if (cfg_.read_timeout_ms > 0) {
        // Stall detection: abort when under 1 B/s for the whole window
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_LIMIT, 1L);
        curl_easy_setopt(h, CURLOPT_LOW_SPEED_TIME, static_cast<long>((cfg_.read_timeout_ms + 999) / 1000));
    }

    if (!cfg_.verify_tls) {
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, 0L);
    }

    switch (req.method) {
        case Method::Head:
            curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
            break;
        case Method::Get:
            curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Put:
            if (req.body) {
                // Proxies redirect PUTs to a target; the seek callback lets curl replay the body
                curl_easy_setopt(h, CURLOPT_UPLOAD, 1L);
                curl_easy_setopt(h, CURLOPT_READFUNCTION, readFromStream);
                curl_easy_setopt(h, CURLOPT_READDATA, req.body);
                curl_easy_setopt(h, CURLOPT_SEEKFUNCTION, seekStream);
                curl_easy_setopt(h, CURLOPT_SEEKDATA, req.body);
                if (req.bodySize) curl_easy_setopt(h, CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(*req.bodySize));
            } else {
                curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
            }
            break;
        case Method::Delete:
            curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }
}

Response CurlDispatcher::performBuffered(const Request& req, const std::string& url) const {
    SList headers;
    for (const auto& [k, v] : req.headers) headers.add(k + ": " + v);

    CurlResult resp = performCurl([&](CURL* h) { applyOptions(h, req, url, headers); });

    if (resp.curl != CURLE_OK) {
        LogRegistry::http()->warn("[CurlDispatcher] {} failed: CURL={} ({})",
                                  describe(req, url), static_cast<int>(resp.curl), resp.error);
        throwCurlError(resp.curl, resp.connected, describe(req, url), resp.error);
    }

    if (!resp.ok()) {
        LogRegistry::http()->warn("[CurlDispatcher] {} failed: HTTP={}", describe(req, url), resp.http);
        throw HttpError(resp.http, errorMessageFromBody(resp.http, resp.body));
    }

    Response out;
    out.status = resp.http;
    out.headers = parseHeaderBlock(resp.hdr);
    out.body = std::move(resp.body);
    return out;
}

Response CurlDispatcher::performStreamed(const Request& req, const std::string& url) const {
    auto easy = std::make_unique<CurlEasy>();
    auto headers = std::make_unique<SList>();
    for (const auto& [k, v] : req.headers) headers->add(k + ": " + v);

    applyOptions(*easy, req, url, *headers);

    auto reader = std::make_unique<CurlBodyReader>(std::move(easy), std::move(headers), describe(req, url));
    reader->awaitHeaders();

    const long status = reader->status();
    if (status / 100 != 2) {
        std::string body;
        try {
            body = reader->drain(MAX_ERROR_BODY);
        } catch (const RequestError& e) {
            LogRegistry::http()->debug("[CurlDispatcher] {}: error body unreadable: {}", describe(req, url), e.what());
        }
        reader->close();

        LogRegistry::http()->warn("[CurlDispatcher] {} failed: HTTP={}", describe(req, url), status);
        throw HttpError(status, errorMessageFromBody(status, body));
    }

    Response out;
    out.status = status;
    out.headers = parseHeaderBlock(reader->rawHeaders());
    out.stream = std::move(reader);
    return out;
}
