#pragma once

#include <sys/ioctl.h>
#include <unistd.h>
#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>
#include <fmt/core.h>

namespace ais::util {

inline int term_width(const int fd = STDERR_FILENO) {
    if (!isatty(fd)) return 80;
    winsize ws{};
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) return ws.ws_col;
    const char* c = std::getenv("COLUMNS");
    if (c) { int n = std::atoi(c); if (n > 0) return n; }
    return 80;
}

inline std::string wrap_text(std::string_view s, size_t width, size_t indent = 0) {
    const std::string pad(indent, ' ');
    std::string out = pad; size_t col = indent;
    bool lineEmpty = true;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && s[i] == ' ') ++i;
        if (i >= s.size()) break;
        size_t j = i;
        while (j < s.size() && s[j] != ' ') ++j;
        const size_t wlen = j - i;
        if (!lineEmpty && col + 1 + wlen > width) { out += '\n'; out += pad; col = indent; lineEmpty = true; }
        if (!lineEmpty) { out += ' '; ++col; }
        out.append(s.substr(i, wlen));
        col += wlen;
        lineEmpty = false;
        i = j;
    }
    return out;
}

// Whole decimal number in [1, max]; anything else (sign, junk, overflow) throws std::invalid_argument
inline size_t parse_size_arg(std::string_view s, const size_t max) {
    size_t n = 0;
    const auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), n);
    if (s.empty() || ec != std::errc() || end != s.data() + s.size())
        throw std::invalid_argument(fmt::format("expected a positive integer, got: '{}'", s));
    if (n == 0 || n > max)
        throw std::invalid_argument(fmt::format("{} is out of range (1-{})", n, max));
    return n;
}

inline std::string human_bytes(uint64_t b) {
    static const char* kUnits[] = {"B","KiB","MiB","GiB","TiB","PiB"};
    int u = 0;
    auto v = static_cast<double>(b);
    while (v >= 1024.0 && u < 5) { v /= 1024.0; ++u; }
    // whole bytes for B, one decimal above
    if (u == 0) return fmt::format("{} {}", b, kUnits[u]);
    return fmt::format("{:.1f} {}", v, kUnits[u]);
}

}
