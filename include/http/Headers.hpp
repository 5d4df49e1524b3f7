#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <string>

namespace ais::http {

struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(),
            [](const unsigned char x, const unsigned char y) { return std::tolower(x) < std::tolower(y); });
    }
};

// Response metadata; lookups ignore header name case
using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

inline std::string headerOr(const Headers& headers, const std::string& name, const std::string& def = "") {
    const auto it = headers.find(name);
    return it == headers.end() ? def : it->second;
}

}
