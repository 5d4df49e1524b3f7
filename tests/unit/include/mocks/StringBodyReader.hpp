#pragma once

#include "http/Response.hpp"

#include <algorithm>
#include <cstring>
#include <utility>
#include <memory>
#include <stdexcept>
#include <string>

namespace ais::test {

// In-memory body; hands out at most maxRead bytes per read() to mimic short network reads.
// largestRead, when given, records the biggest len a caller asked for.
class StringBodyReader : public http::BodyReader {
public:
    explicit StringBodyReader(std::string data, size_t maxRead = 7, std::shared_ptr<int> closeCount = nullptr,
                              std::shared_ptr<size_t> largestRead = nullptr)
        : data_(std::move(data)), maxRead_(maxRead), closeCount_(std::move(closeCount)),
          largestRead_(std::move(largestRead)) {}

    size_t read(char* dst, const size_t len) override {
        if (closed_) throw std::logic_error("read after close");
        if (largestRead_) *largestRead_ = std::max(*largestRead_, len);
        const size_t n = std::min({len, maxRead_, data_.size() - pos_});
        std::memcpy(dst, data_.data() + pos_, n);
        pos_ += n;
        return n;
    }

    void close() override {
        if (closed_) return;
        closed_ = true;
        if (closeCount_) ++*closeCount_;
    }

private:
    std::string data_;
    size_t pos_ = 0;
    size_t maxRead_;
    std::shared_ptr<int> closeCount_;
    std::shared_ptr<size_t> largestRead_;
    bool closed_ = false;
};

}
