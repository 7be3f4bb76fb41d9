#pragma once

#include "ftr/core/result.hpp"
#include "ftr/file/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ftr {

/**
 * @brief Server settings; every key of the JSON file is optional
 *
 * Example:
 * ```json
 * {
 *   "port": 50052,
 *   "allowed_prefixes": ["/tmp/", "/var/tmp/"],
 *   "state_db": "/etc/ftr/state.json",
 *   "config_db": "/etc/ftr/config.json",
 *   "access": { "admin": ["file_readwrite"] }
 * }
 * ```
 */
struct ServerConfig {
    std::string listen_address = "0.0.0.0";
    uint16_t port = 50052;
    std::size_t io_threads = 2;
    std::size_t worker_threads = 4;
    std::string log_level = "info";

    std::vector<std::string> allowed_prefixes{"/tmp/", "/var/tmp/"};
    std::string host_mount = "/mnt/host";

    file::DigestMethod digest = file::DigestMethod::Md5;
    std::size_t chunk_size = 64 * 1024;
    uint64_t transfer_timeout_seconds = 300;
    uint64_t max_file_size = 4ULL * 1024 * 1024 * 1024;

    std::string state_db;
    std::string config_db;
    uint64_t dial_timeout_seconds = 5;

    /// client id -> roles; unset means every call is allowed
    std::optional<std::map<std::string, std::vector<std::string>>> access;

    /// InvalidArgument on malformed JSON, wrong value types or out-of-range values
    static Result<ServerConfig> from_json_text(const std::string& text);

    /// NotFound when the file cannot be opened
    static Result<ServerConfig> load(const std::string& path);
};

} // namespace ftr
