#include "client/ObjStream.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>

using namespace ais::client;

namespace fs = std::filesystem;

ObjStream::ObjStream(const uintmax_t contentLength,
                     std::string eTag,
                     std::string eTagType,
                     std::unique_ptr<http::BodyReader> stream,
                     const size_t chunkSize)
: contentLength_(contentLength),
  eTag_(std::move(eTag)),
  eTagType_(std::move(eTagType)),
  stream_(std::move(stream)),
  chunkSize_(chunkSize) {
    if (!stream_) throw std::invalid_argument("ObjStream requires a body stream");
    if (chunkSize_ == 0) throw std::invalid_argument("chunk size must be positive");
}

ObjStream::~ObjStream() { release(); }

std::string ObjStream::readChunk() {
    if (closed_) throw std::logic_error("read from a closed object stream");
    if (eof_) return {};
    if (!stream_) throw std::logic_error("read from a moved-from object stream");

    // Size the buffer by what the server announced; past that only the end of body is expected
    size_t want = chunkSize_;
    if (contentLength_ > consumed_) want = static_cast<size_t>(std::min<uintmax_t>(chunkSize_, contentLength_ - consumed_));
    else if (contentLength_ > 0) want = 1;

    std::string chunk(want, '\0');
    size_t filled = 0;
    while (filled < want) {
        const size_t n = stream_->read(chunk.data() + filled, want - filled);
        if (n == 0) {
            eof_ = true;
            release();
            break;
        }
        filled += n;
    }

    consumed_ += filled;
    chunk.resize(filled);
    return chunk;
}

std::string ObjStream::readAll() {
    std::string out;
    if (contentLength_ > 0) out.reserve(static_cast<size_t>(contentLength_));

    for (auto chunk = readChunk(); !chunk.empty(); chunk = readChunk()) out += chunk;
    return out;
}

uintmax_t ObjStream::copyTo(std::ostream& out) {
    uintmax_t total = 0;
    for (auto chunk = readChunk(); !chunk.empty(); chunk = readChunk()) {
        out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        if (!out) throw std::runtime_error("Failed to write object data to output stream");
        total += chunk.size();
    }
    return total;
}

uintmax_t ObjStream::saveTo(const fs::path& dest) {
    std::ofstream out(dest, std::ios::binary | std::ios::trunc);
    if (!out) throw fs::filesystem_error("Failed to open output file", dest,
                                         std::error_code(errno ? errno : EIO, std::generic_category()));

    try {
        const uintmax_t written = copyTo(out);
        out.close();
        if (!out) throw fs::filesystem_error("Failed to write output file", dest,
                                             std::error_code(errno ? errno : EIO, std::generic_category()));
        return written;
    } catch (const std::exception&) {
        out.close();
        std::error_code ec;
        fs::remove(dest, ec);
        throw;
    }
}

void ObjStream::close() {
    closed_ = true;
    release();
}

void ObjStream::release() {
    if (!stream_) return;
    stream_->close();
    stream_.reset();
}
