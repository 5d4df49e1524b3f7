#pragma once

#include "http/Headers.hpp"
#include "http/Request.hpp"

#include <cstdint>
#include <curl/curl.h>
#include <string>
#include <utility>

namespace ais::util {

void ensureCurlGlobalInit();

size_t writeToString(const char* ptr, size_t size, size_t nmemb, void* userdata);

// CURLOPT_READFUNCTION / CURLOPT_SEEKFUNCTION over a std::istream
size_t readFromStream(char* buf, size_t size, size_t nmemb, void* userdata);
int seekStream(void* userdata, curl_off_t offset, int origin);

[[nodiscard]] bool wasConnected(CURL* curl);

// Escapes each '/'-separated segment, keeping the separators (and empty segments) intact
std::string escapePathPreserveSlashes(CURL* curl, const std::string& path);

// key=value pairs joined by '&', keys and values escaped
std::string encodeQuery(CURL* curl, const http::QueryParams& params);

/**
 * Parses a raw header blob as delivered to CURLOPT_HEADERFUNCTION. When the
 * blob holds several responses (redirects, 100 Continue) only the last block
 * is kept.
 */
http::Headers parseHeaderBlock(const std::string& raw);

// Pulls "message" out of a JSON error body; falls back to the raw body, then to "HTTP <status>"
std::string errorMessageFromBody(long status, const std::string& body);

// Lenient content-length parsing: anything but a non-negative integer yields 0
uintmax_t parseContentLength(const std::string& value);

// "bucket/path/to/object" -> {"bucket", "path/to/object"}
std::pair<std::string, std::string> parseObjectUri(const std::string& uri);

void trimInPlace(std::string& s);

}
