#pragma once

#include <cstddef>

namespace ais::client {

constexpr const char* PROVIDER_AIS = "ais";

constexpr const char* URL_PATH_OBJECTS = "objects";

constexpr const char* QPARAM_PROVIDER  = "provider";
constexpr const char* QPARAM_NAMESPACE = "namespace";
constexpr const char* QPARAM_ARCHPATH  = "archpath";

constexpr const char* HEADER_CONTENT_LENGTH = "content-length";
constexpr const char* HEADER_CHECKSUM_VALUE = "ais-checksum-value";
constexpr const char* HEADER_CHECKSUM_TYPE  = "ais-checksum-type";

constexpr size_t DEFAULT_CHUNK_SIZE = 32 * 1024;    // 32 KiB
constexpr size_t MAX_CHUNK_SIZE = 64 * 1024 * 1024;  // 64 MiB

}
