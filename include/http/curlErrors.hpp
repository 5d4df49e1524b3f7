#pragma once

#include <curl/curl.h>
#include <string>

namespace ais::http {

/**
 * Maps a failed libcurl transfer onto the RequestError hierarchy.
 * connected tells a connect timeout apart from a stalled read.
 */
[[noreturn]] void throwCurlError(CURLcode rc, bool connected, const std::string& what, const std::string& detail = "");

}
