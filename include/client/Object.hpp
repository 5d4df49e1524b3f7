#pragma once

#include "client/ObjStream.hpp"
#include "client/constants.hpp"
#include "http/Headers.hpp"

#include <filesystem>
#include <string>

namespace ais::client {

class Bucket;

/**
 * A named object inside a bucket. Holds no state beyond the bucket it
 * borrows and its name; every call is one fresh request.
 *
 * Errors from the dispatcher (transport failures, HttpError for non-2xx,
 * 404 for a missing object) propagate unchanged.
 */
class Object {
public:
    // Throws std::invalid_argument for an empty name
    Object(const Bucket& bucket, std::string name);

    [[nodiscard]] const Bucket& bucket() const { return *bucket_; }
    [[nodiscard]] const std::string& name() const { return name_; }

    [[nodiscard]] http::Headers headObject() const;

    // archpath selects one member when the object is an archive
    [[nodiscard]] ObjStream getObject(const std::string& archpath = "",
                                      size_t chunkSize = DEFAULT_CHUNK_SIZE) const;

    // Throws std::filesystem::filesystem_error before any request if the file cannot be read
    http::Headers putObject(const std::filesystem::path& localPath) const;

    void deleteObject() const;

private:
    const Bucket* bucket_;
    std::string name_;

    [[nodiscard]] std::string path() const;
};

}
