#pragma once

#include "ftr/fetch/byte_stream.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace ftr::fetch {

struct ParsedUrl {
    std::string host;
    std::string port;
    std::string target;  ///< path + query, always starts with '/'
};

/// Accepts http://host[:port][/path][?query]; anything else is InvalidArgument
Result<ParsedUrl> parse_http_url(const std::string& url);

/**
 * @brief Plain HTTP/1.1 GET client built on Boost.Beast
 *
 * The response body is exposed as a ByteStream and read incrementally;
 * nothing beyond the caller's buffer and Beast's header buffer is held in
 * memory. Redirects (301/302/303/307/308) are followed up to max_redirects.
 */
class HttpFetcher : public UrlFetcher {
public:
    struct Options {
        std::chrono::seconds connect_timeout{30};
        int max_redirects = 5;
        std::string user_agent{"ftrd/1.0"};
    };

    HttpFetcher() = default;
    explicit HttpFetcher(Options options) : options_(std::move(options)) {}

    Result<FetchedStream> open(const std::string& url,
                               std::uint64_t max_bytes,
                               Deadline deadline) override;

private:
    Options options_;
};

} // namespace ftr::fetch
