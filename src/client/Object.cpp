#include "client/Object.hpp"
#include "client/Bucket.hpp"
#include "util/httpHelpers.hpp"

#include <cerrno>
#include <fstream>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <fmt/core.h>

using namespace ais::client;
using namespace ais::http;
using namespace ais::util;

namespace fs = std::filesystem;

Object::Object(const Bucket& bucket, std::string name)
: bucket_(&bucket), name_(std::move(name)) {
    if (name_.empty()) throw std::invalid_argument("object name must not be empty");
}

std::string Object::path() const {
    return fmt::format("{}/{}/{}", URL_PATH_OBJECTS, bucket_->name(), name_);
}

Headers Object::headObject() const {
    Request req;
    req.method = Method::Head;
    req.path = path();
    req.params = bucket_->qparam();
    return bucket_->request(req).headers;
}

ObjStream Object::getObject(const std::string& archpath, const size_t chunkSize) const {
    if (chunkSize == 0) throw std::invalid_argument("chunk size must be positive");

    Request req;
    req.method = Method::Get;
    req.path = path();
    req.params = bucket_->qparam();
    req.params.insert_or_assign(QPARAM_ARCHPATH, archpath);
    req.stream = true;

    Response resp = bucket_->request(req);

    return {
        parseContentLength(headerOr(resp.headers, HEADER_CONTENT_LENGTH)),
        headerOr(resp.headers, HEADER_CHECKSUM_VALUE),
        headerOr(resp.headers, HEADER_CHECKSUM_TYPE),
        std::move(resp.stream),
        chunkSize
    };
}

Headers Object::putObject(const fs::path& localPath) const {
    std::error_code ec;
    const uintmax_t size = fs::file_size(localPath, ec);
    if (ec) throw fs::filesystem_error("Failed to stat file for upload", localPath, ec);

    std::ifstream fin(localPath, std::ios::binary);
    if (!fin) throw fs::filesystem_error("Failed to open file for upload", localPath,
                                         std::error_code(errno ? errno : EIO, std::generic_category()));

    Request req;
    req.method = Method::Put;
    req.path = path();
    req.params = bucket_->qparam();
    req.body = &fin;
    req.bodySize = size;

    return bucket_->request(req).headers;
}

void Object::deleteObject() const {
    Request req;
    req.method = Method::Delete;
    req.path = path();
    req.params = bucket_->qparam();
    bucket_->request(req);
}
