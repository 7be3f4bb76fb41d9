#include "ftr/core/config.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace ftr {

using json = nlohmann::json;

namespace {

// One week
constexpr uint64_t kMaxTimeoutSeconds = 7 * 24 * 60 * 60;

template<typename T>
void read_key(const json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it != j.end() && !it->is_null()) {
        out = it->get<T>();
    }
}

} // namespace

Result<ServerConfig> ServerConfig::from_json_text(const std::string& text) {
    ServerConfig config;

    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            return Fail<ServerConfig>(StatusCode::InvalidArgument, "config must be a JSON object");
        }

        read_key(j, "listen_address", config.listen_address);

        uint64_t port = config.port;
        read_key(j, "port", port);
        if (port > std::numeric_limits<uint16_t>::max()) {
            return Fail<ServerConfig>(StatusCode::InvalidArgument,
                "port out of range: " + std::to_string(port));
        }
        config.port = static_cast<uint16_t>(port);

        read_key(j, "io_threads", config.io_threads);
        read_key(j, "worker_threads", config.worker_threads);
        read_key(j, "log_level", config.log_level);
        read_key(j, "allowed_prefixes", config.allowed_prefixes);
        read_key(j, "host_mount", config.host_mount);

        std::string digest = file::digest_method_name(config.digest);
        read_key(j, "digest", digest);
        auto method = file::parse_digest_method(digest);
        if (!method || *method == file::DigestMethod::Unspecified) {
            return Fail<ServerConfig>(StatusCode::InvalidArgument, "unknown digest: " + digest);
        }
        config.digest = *method;

        read_key(j, "chunk_size", config.chunk_size);
        read_key(j, "transfer_timeout_seconds", config.transfer_timeout_seconds);
        read_key(j, "max_file_size", config.max_file_size);
        read_key(j, "state_db", config.state_db);
        read_key(j, "config_db", config.config_db);
        read_key(j, "dial_timeout_seconds", config.dial_timeout_seconds);

        auto access = j.find("access");
        if (access != j.end() && !access->is_null()) {
            config.access = access->get<std::map<std::string, std::vector<std::string>>>();
        }
    } catch (const json::exception& e) {
        return Fail<ServerConfig>(StatusCode::InvalidArgument, std::string("invalid config: ") + e.what());
    }

    if (config.io_threads == 0 || config.worker_threads == 0) {
        return Fail<ServerConfig>(StatusCode::InvalidArgument, "thread counts must be positive");
    }
    if (config.chunk_size == 0 || config.chunk_size > 1024 * 1024) {
        return Fail<ServerConfig>(StatusCode::InvalidArgument,
            "chunk_size must be between 1 and 1048576");
    }
    if (config.transfer_timeout_seconds == 0 || config.transfer_timeout_seconds > kMaxTimeoutSeconds) {
        return Fail<ServerConfig>(StatusCode::InvalidArgument,
            "transfer_timeout_seconds must be between 1 and " + std::to_string(kMaxTimeoutSeconds));
    }
    if (config.dial_timeout_seconds == 0 || config.dial_timeout_seconds > kMaxTimeoutSeconds) {
        return Fail<ServerConfig>(StatusCode::InvalidArgument,
            "dial_timeout_seconds must be between 1 and " + std::to_string(kMaxTimeoutSeconds));
    }
    if (config.allowed_prefixes.empty()) {
        return Fail<ServerConfig>(StatusCode::InvalidArgument, "allowed_prefixes cannot be empty");
    }
    for (const auto& prefix : config.allowed_prefixes) {
        if (prefix.empty() || prefix.front() != '/' || prefix.back() != '/') {
            return Fail<ServerConfig>(StatusCode::InvalidArgument,
                "allowed prefix must be absolute and end with '/': " + prefix);
        }
    }

    return Ok(std::move(config));
}

Result<ServerConfig> ServerConfig::load(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return Fail<ServerConfig>(StatusCode::NotFound, "cannot open config file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto config = from_json_text(buffer.str());
    if (config.is_error()) {
        return Err<ServerConfig>(config.error().wrap(path));
    }
    return config;
}

} // namespace ftr
