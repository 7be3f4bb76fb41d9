#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ftr::file {

enum class DigestMethod : std::uint8_t {
    Unspecified = 0,
    Md5 = 1,
    Sha256 = 2,
    Sha512 = 3
};

enum class TransferProtocol : std::uint8_t {
    Unknown = 0,
    Sftp = 1,
    Http = 2,
    Https = 3,
    Scp = 4
};

/// Incoming call metadata (header name -> value)
using CallMetadata = std::map<std::string, std::string>;

inline constexpr const char* kTargetTypeKey = "x-target-type";
inline constexpr const char* kTargetIndexKey = "x-target-index";
inline constexpr const char* kClientIdKey = "x-client-id";
inline constexpr const char* kDpuTargetType = "dpu";

struct HashValue {
    DigestMethod method = DigestMethod::Unspecified;
    std::vector<std::uint8_t> bytes;
};

struct RemoteSource {
    TransferProtocol protocol = TransferProtocol::Unknown;
    std::string url;
};

/**
 * @brief TransferToRemote request body
 */
struct TransferRequest {
    std::string local_path;
    std::optional<RemoteSource> source;
};

struct TransferResult {
    HashValue hash;
    std::uint64_t bytes = 0;
};

/**
 * @brief Routing information pulled out of call metadata
 */
struct RoutingTarget {
    std::string type;
    std::string index;

    bool is_dpu() const { return type == kDpuTargetType && !index.empty(); }
};

std::optional<RoutingTarget> routing_from_metadata(const CallMetadata& metadata);

// ════════════════════════════════════════════════════════
// Put stream messages
// ════════════════════════════════════════════════════════

inline constexpr std::uint32_t kDefaultPermissions = 0644;

struct PutOpen {
    std::string remote_file;
    std::uint32_t permissions = 0;
    DigestMethod digest = DigestMethod::Unspecified; ///< Unspecified means MD5
};

struct PutContent {
    std::vector<std::uint8_t> data;
};

struct PutHash {
    HashValue hash;
};

using PutMessage = std::variant<PutOpen, PutContent, PutHash>;

const char* digest_method_name(DigestMethod method);
std::optional<DigestMethod> parse_digest_method(const std::string& name);
const char* protocol_name(TransferProtocol protocol);

std::string to_hex(const std::vector<std::uint8_t>& bytes);

} // namespace ftr::file
