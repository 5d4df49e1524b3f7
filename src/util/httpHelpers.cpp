#include "util/httpHelpers.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <istream>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace ais::util {

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

size_t writeToString(const char* ptr, const size_t size, const size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t readFromStream(char* buf, const size_t size, const size_t nmemb, void* userdata) {
    auto* in = static_cast<std::istream*>(userdata);
    in->read(buf, static_cast<std::streamsize>(size * nmemb));
    if (in->bad()) return CURL_READFUNC_ABORT;
    return static_cast<size_t>(in->gcount());
}

int seekStream(void* userdata, const curl_off_t offset, const int origin) {
    auto* in = static_cast<std::istream*>(userdata);
    in->clear();

    std::ios_base::seekdir dir = std::ios_base::beg;
    if (origin == SEEK_CUR) dir = std::ios_base::cur;
    else if (origin == SEEK_END) dir = std::ios_base::end;

    in->seekg(static_cast<std::streamoff>(offset), dir);
    return in->fail() ? CURL_SEEKFUNC_CANTSEEK : CURL_SEEKFUNC_OK;
}

bool wasConnected(CURL* curl) {
    curl_off_t connectUs = 0;
    if (curl_easy_getinfo(curl, CURLINFO_CONNECT_TIME_T, &connectUs) != CURLE_OK) return false;
    return connectUs > 0;
}

std::string escapePathPreserveSlashes(CURL* curl, const std::string& path) {
    std::ostringstream out;
    size_t start = 0;

    while (true) {
        const auto slash = path.find('/', start);
        const std::string seg = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);

        if (!seg.empty()) {
            char* esc = curl_easy_escape(curl, seg.c_str(), static_cast<int>(seg.length()));
            if (!esc) throw std::runtime_error("escape failed for path segment: " + seg);
            out << esc;
            curl_free(esc);
        }

        if (slash == std::string::npos) break;
        out << '/';
        start = slash + 1;
    }

    return out.str();
}

std::string encodeQuery(CURL* curl, const http::QueryParams& params) {
    const auto escape = [curl](const std::string& s) {
        char* esc = curl_easy_escape(curl, s.c_str(), static_cast<int>(s.length()));
        if (!esc) throw std::runtime_error("escape failed for query component: " + s);
        std::string out(esc);
        curl_free(esc);
        return out;
    };

    std::string query;
    for (const auto& [k, v] : params) {
        if (!query.empty()) query += '&';
        query += escape(k);
        query += '=';
        query += escape(v);
    }
    return query;
}

http::Headers parseHeaderBlock(const std::string& raw) {
    http::Headers headers;
    std::istringstream headerStream(raw);
    std::string line;

    while (std::getline(headerStream, line)) {
        if (line.rfind("HTTP/", 0) == 0) {
            headers.clear();        // status line of a new response block
            continue;
        }
        if (const auto pos = line.find(':'); pos != std::string::npos) {
            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            trimInPlace(key);
            trimInPlace(value);
            if (key.empty()) continue;
            headers.insert_or_assign(std::move(key), std::move(value));
        }
    }

    return headers;
}

std::string errorMessageFromBody(const long status, const std::string& body) {
    if (const auto j = nlohmann::json::parse(body, nullptr, false); !j.is_discarded() && j.is_object()) {
        if (const auto it = j.find("message"); it != j.end() && it->is_string())
            return it->get<std::string>();
    }

    std::string trimmed = body;
    trimInPlace(trimmed);
    if (!trimmed.empty()) return trimmed;
    return "HTTP " + std::to_string(status);
}

uintmax_t parseContentLength(const std::string& value) {
    std::string v = value;
    trimInPlace(v);
    if (v.empty()) return 0;

    uintmax_t out = 0;
    const auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), out);
    if (ec != std::errc() || ptr != v.data() + v.size()) return 0;
    return out;
}

std::pair<std::string, std::string> parseObjectUri(const std::string& uri) {
    std::string s = uri;
    if (s.rfind("ais://", 0) == 0) s.erase(0, 6);

    const auto slash = s.find('/');
    if (slash == std::string::npos || slash == 0 || slash + 1 == s.size())
        throw std::invalid_argument("expected BUCKET/OBJECT, got: " + uri);

    return {s.substr(0, slash), s.substr(slash + 1)};
}

void trimInPlace(std::string& s) {
    // Trim start
    s.erase(s.begin(), std::ranges::find_if(s.begin(), s.end(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }));

    // Trim end
    s.erase(std::find_if(s.rbegin(), s.rend(), [](const unsigned char ch) {
        return !std::isspace(ch);
    }).base(), s.end());
}

}
