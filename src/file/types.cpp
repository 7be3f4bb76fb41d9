#include "ftr/file/types.hpp"

#include <algorithm>
#include <cctype>

namespace ftr::file {

std::optional<RoutingTarget> routing_from_metadata(const CallMetadata& metadata) {
    const auto type_it = metadata.find(kTargetTypeKey);
    const auto index_it = metadata.find(kTargetIndexKey);
    if (type_it == metadata.end() && index_it == metadata.end()) {
        return std::nullopt;
    }
    RoutingTarget target;
    if (type_it != metadata.end()) {
        target.type = type_it->second;
    }
    if (index_it != metadata.end()) {
        target.index = index_it->second;
    }
    return target;
}

const char* digest_method_name(DigestMethod method) {
    switch (method) {
        case DigestMethod::Unspecified: return "unspecified";
        case DigestMethod::Md5: return "md5";
        case DigestMethod::Sha256: return "sha256";
        case DigestMethod::Sha512: return "sha512";
    }
    return "unknown";
}

std::optional<DigestMethod> parse_digest_method(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "md5") {
        return DigestMethod::Md5;
    }
    if (lower == "sha256") {
        return DigestMethod::Sha256;
    }
    if (lower == "sha512") {
        return DigestMethod::Sha512;
    }
    return std::nullopt;
}

const char* protocol_name(TransferProtocol protocol) {
    switch (protocol) {
        case TransferProtocol::Unknown: return "UNKNOWN";
        case TransferProtocol::Sftp: return "SFTP";
        case TransferProtocol::Http: return "HTTP";
        case TransferProtocol::Https: return "HTTPS";
        case TransferProtocol::Scp: return "SCP";
    }
    return "UNKNOWN";
}

std::string to_hex(const std::vector<std::uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        out.push_back(digits[byte >> 4]);
        out.push_back(digits[byte & 0x0F]);
    }
    return out;
}

} // namespace ftr::file
