#pragma once

#include "http/Response.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <string>

namespace ais::client {

/**
 * A GET response whose body is still on the wire, plus the object metadata
 * that arrived with the headers.
 *
 * The stream holds a live connection until it is drained, closed or
 * destroyed. Reaching the end of the body releases it automatically.
 */
class ObjStream {
public:
    ObjStream(uintmax_t contentLength,
              std::string eTag,
              std::string eTagType,
              std::unique_ptr<http::BodyReader> stream,
              size_t chunkSize);

    ~ObjStream();

    ObjStream(ObjStream&&) noexcept = default;
    ObjStream& operator=(ObjStream&&) noexcept = default;
    ObjStream(const ObjStream&) = delete;
    ObjStream& operator=(const ObjStream&) = delete;

    [[nodiscard]] uintmax_t contentLength() const { return contentLength_; }
    [[nodiscard]] const std::string& eTag() const { return eTag_; }
    [[nodiscard]] const std::string& eTagType() const { return eTagType_; }
    [[nodiscard]] size_t chunkSize() const { return chunkSize_; }

    // Next chunkSize bytes (fewer only for the last chunk); empty once the body is exhausted
    std::string readChunk();

    std::string readAll();

    // Copies the remaining body chunk by chunk; returns the number of bytes written
    uintmax_t copyTo(std::ostream& out);

    // Writes the remaining body to dest; a partially written file is removed on failure
    uintmax_t saveTo(const std::filesystem::path& dest);

    void close();

    [[nodiscard]] bool isOpen() const { return static_cast<bool>(stream_); }
    [[nodiscard]] bool exhausted() const { return eof_; }

private:
    uintmax_t contentLength_;
    std::string eTag_;
    std::string eTagType_;
    std::unique_ptr<http::BodyReader> stream_;
    size_t chunkSize_;
    uintmax_t consumed_ = 0;
    bool eof_ = false;
    bool closed_ = false;

    void release();
};

}
