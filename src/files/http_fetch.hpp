#pragma once

#include "files/iobject_store.hpp"
#include "core/utils.hpp"

#include <chrono>
#include <map>
#include <ostream>
#include <string>

namespace dbsync::detail {

/**
 * @brief Streaming GET shared by the object stores
 *
 * Non-2xx responses are mapped to NOT_FOUND / FORBIDDEN / ERROR and their
 * bodies are never written to out.
 */
FetchResult http_get(const utils::HttpUrl& url,
                     const std::map<std::string, std::string>& headers,
                     std::ostream& out,
                     uint64_t max_bytes,
                     std::chrono::milliseconds timeout);

} // namespace dbsync::detail
