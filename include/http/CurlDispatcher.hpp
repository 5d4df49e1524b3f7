#pragma once

#include "http/Dispatcher.hpp"
#include "config/Config.hpp"

#include <curl/curl.h>
#include <string>

namespace ais::util { class SList; }

namespace ais::http {

/**
 * libcurl-backed Dispatcher. Every call uses a fresh easy handle; nothing is
 * shared between calls, so one instance may serve concurrent callers.
 */
class CurlDispatcher : public Dispatcher {
public:
    static constexpr const char* API_VERSION = "v1";
    static constexpr size_t MAX_ERROR_BODY = 64 * 1024;

    explicit CurlDispatcher(config::ClientConfig cfg);
    ~CurlDispatcher() override;

    Response request(const Request& req) override;

    // {endpoint}/v1/{path}?{query}
    [[nodiscard]] std::string buildUrl(const Request& req) const;

    [[nodiscard]] const config::ClientConfig& config() const { return cfg_; }

private:
    config::ClientConfig cfg_;

    void applyOptions(CURL* h, const Request& req, const std::string& url, const util::SList& headers) const;

    Response performBuffered(const Request& req, const std::string& url) const;
    Response performStreamed(const Request& req, const std::string& url) const;
};

}
