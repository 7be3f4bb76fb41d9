#pragma once

#include "ftr/core/deadline.hpp"
#include "ftr/core/result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ftr::fetch {

/**
 * @brief Pull-style readable byte source
 *
 * read() returns the number of bytes placed in the buffer; 0 means the
 * stream is exhausted. Implementations never return 0 while more data may
 * still arrive.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual Result<std::size_t> read(void* buffer, std::size_t capacity) = 0;
};

struct FetchedStream {
    std::unique_ptr<ByteStream> stream;
    std::optional<std::uint64_t> size_hint;  ///< Content-Length when the server sent one
};

/**
 * @brief Opens a readable stream for a URL, bounded by a maximum size
 *
 * Reading past max_bytes fails the read rather than truncating.
 */
class UrlFetcher {
public:
    virtual ~UrlFetcher() = default;

    virtual Result<FetchedStream> open(const std::string& url,
                                       std::uint64_t max_bytes,
                                       Deadline deadline) = 0;
};

} // namespace ftr::fetch
