#pragma once

#include "http/Response.hpp"
#include "util/curlWrappers.hpp"

#include <curl/curl.h>
#include <memory>
#include <string>

namespace ais::http {

/**
 * Streams a response body off a curl multi handle. The transfer only makes
 * progress while the owner is calling awaitHeaders() or read(), so the
 * amount buffered stays bounded by what a single perform round delivers.
 */
class CurlBodyReader : public BodyReader {
public:
    static constexpr int POLL_TIMEOUT_MS = 1000;

    // Takes the configured easy handle and the header list it points at
    CurlBodyReader(std::unique_ptr<util::CurlEasy> easy, std::unique_ptr<util::SList> reqHeaders, std::string what);
    ~CurlBodyReader() override;

    CurlBodyReader(const CurlBodyReader&) = delete;
    CurlBodyReader& operator=(const CurlBodyReader&) = delete;

    // Blocks until the final response headers are in; throws on transport failure
    void awaitHeaders();

    size_t read(char* dst, size_t len) override;
    void close() override;

    [[nodiscard]] long status() const;
    [[nodiscard]] const std::string& rawHeaders() const { return hdr_; }

    // Reads what is left of the body, up to limit bytes
    [[nodiscard]] std::string drain(size_t limit);

private:
    void pump();
    void finish();

    static size_t onBody(char* ptr, size_t size, size_t nmemb, void* userdata);
    static size_t onHeader(char* ptr, size_t size, size_t nitems, void* userdata);

    CURLM* multi_ = nullptr;
    std::unique_ptr<util::CurlEasy> easy_;
    std::unique_ptr<util::SList> reqHeaders_;
    std::string what_;

    std::string buf_;
    size_t pos_ = 0;
    std::string hdr_;
    size_t received_ = 0;

    bool headersDone_ = false;
    bool done_ = false;
    bool closed_ = false;
    CURLcode result_ = CURLE_OK;
};

}
