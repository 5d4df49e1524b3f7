#include "http/CurlBodyReader.hpp"
#include "http/curlErrors.hpp"
#include "http/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string_view>
#include <fmt/core.h>

using namespace ais::http;
using namespace ais::util;
using namespace ais::logging;

CurlBodyReader::CurlBodyReader(std::unique_ptr<CurlEasy> easy, std::unique_ptr<SList> reqHeaders, std::string what)
: easy_(std::move(easy)), reqHeaders_(std::move(reqHeaders)), what_(std::move(what)) {
    curl_easy_setopt(*easy_, CURLOPT_WRITEFUNCTION, onBody);
    curl_easy_setopt(*easy_, CURLOPT_WRITEDATA, this);
    curl_easy_setopt(*easy_, CURLOPT_HEADERFUNCTION, onHeader);
    curl_easy_setopt(*easy_, CURLOPT_HEADERDATA, this);

    multi_ = curl_multi_init();
    if (!multi_) throw std::runtime_error("curl_multi_init failed");

    if (const CURLMcode mc = curl_multi_add_handle(multi_, *easy_); mc != CURLM_OK) {
        curl_multi_cleanup(multi_);
        multi_ = nullptr;
        throw RequestError(fmt::format("{}: curl_multi_add_handle failed: {}", what_, curl_multi_strerror(mc)));
    }
}

CurlBodyReader::~CurlBodyReader() { close(); }

size_t CurlBodyReader::onBody(char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlBodyReader*>(userdata);
    self->buf_.append(ptr, size * nmemb);
    self->received_ += size * nmemb;
    return size * nmemb;
}

size_t CurlBodyReader::onHeader(char* ptr, const size_t size, const size_t nitems, void* userdata) {
    auto* self = static_cast<CurlBodyReader*>(userdata);
    const size_t n = size * nitems;
    const std::string_view line(ptr, n);

    if (line.starts_with("HTTP/")) {
        // New response block (redirect hop or interim 1xx): start over
        self->hdr_.clear();
        self->buf_.clear();
        self->pos_ = 0;
    }
    self->hdr_.append(ptr, n);
    self->received_ += n;

    if (line == "\r\n" || line == "\n") {
        long code = 0;
        curl_easy_getinfo(*self->easy_, CURLINFO_RESPONSE_CODE, &code);
        const bool interim = code / 100 == 1;
        const bool redirect = code / 100 == 3 && parseHeaderBlock(self->hdr_).contains("location");
        if (!interim && !redirect) self->headersDone_ = true;
    }

    return n;
}

void CurlBodyReader::pump() {
    const size_t before = received_;

    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK)
        throw RequestError(fmt::format("{}: curl_multi_perform failed: {}", what_, curl_multi_strerror(mc)));

    if (running == 0) {
        finish();
        return;
    }

    if (received_ == before) {
        mc = curl_multi_poll(multi_, nullptr, 0, POLL_TIMEOUT_MS, nullptr);
        if (mc != CURLM_OK)
            throw RequestError(fmt::format("{}: curl_multi_poll failed: {}", what_, curl_multi_strerror(mc)));
    }
}

void CurlBodyReader::finish() {
    int left = 0;
    while (const CURLMsg* msg = curl_multi_info_read(multi_, &left))
        if (msg->msg == CURLMSG_DONE) result_ = msg->data.result;
    done_ = true;
}

void CurlBodyReader::awaitHeaders() {
    while (!headersDone_ && !done_) pump();
    if (done_ && result_ != CURLE_OK) throwCurlError(result_, wasConnected(*easy_), what_);
}

size_t CurlBodyReader::read(char* dst, const size_t len) {
    if (closed_) throw std::logic_error("read from a closed response body");
    if (len == 0) return 0;

    while (pos_ == buf_.size() && !done_) pump();

    if (pos_ == buf_.size()) {
        if (result_ != CURLE_OK) throwCurlError(result_, wasConnected(*easy_), what_);
        return 0;
    }

    const size_t n = std::min(len, buf_.size() - pos_);
    std::memcpy(dst, buf_.data() + pos_, n);
    pos_ += n;

    if (pos_ == buf_.size()) {
        buf_.clear();
        pos_ = 0;
    }
    return n;
}

std::string CurlBodyReader::drain(const size_t limit) {
    std::string out;
    char chunk[4096];
    while (out.size() < limit) {
        const size_t n = read(chunk, std::min(sizeof(chunk), limit - out.size()));
        if (n == 0) break;
        out.append(chunk, n);
    }
    return out;
}

long CurlBodyReader::status() const {
    long code = 0;
    if (easy_) curl_easy_getinfo(*easy_, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

void CurlBodyReader::close() {
    if (closed_) return;
    closed_ = true;

    if (multi_) {
        if (const CURLMcode mc = curl_multi_remove_handle(multi_, *easy_); mc != CURLM_OK)
            LogRegistry::http()->warn("[CurlBodyReader] {}: curl_multi_remove_handle failed: {}",
                                      what_, curl_multi_strerror(mc));
        curl_multi_cleanup(multi_);
        multi_ = nullptr;
    }

    easy_.reset();
    reqHeaders_.reset();
    buf_.clear();
    pos_ = 0;
}
