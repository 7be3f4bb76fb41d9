#include "ftr/file/path_validator.hpp"

#include <filesystem>
#include <sstream>
#include <system_error>

namespace ftr::file {
namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_segments(const std::string& path) {
    std::vector<std::string> segments;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) {
                segments.push_back(std::move(current));
                current.clear();
            }
        } else {
            current.push_back(c);
        }
    }
    if (!current.empty()) {
        segments.push_back(std::move(current));
    }
    return segments;
}

bool has_parent_segment(const std::string& path) {
    for (const auto& segment : split_segments(path)) {
        if (segment == "..") {
            return true;
        }
    }
    return false;
}

std::string join_prefixes(const std::vector<std::string>& prefixes) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < prefixes.size(); ++i) {
        if (i > 0) {
            oss << (i + 1 == prefixes.size() ? " or " : ", ");
        }
        oss << prefixes[i];
    }
    return oss.str();
}

} // namespace

PathValidator::PathValidator(Policy policy) : policy_(std::move(policy)) {}

std::string PathValidator::normalize(const std::string& path) {
    if (path.empty()) {
        return ".";
    }
    const bool absolute = path.front() == '/';
    std::vector<std::string> stack;
    for (auto& segment : split_segments(path)) {
        if (segment == ".") {
            continue;
        }
        if (segment == "..") {
            if (!stack.empty() && stack.back() != "..") {
                stack.pop_back();
            } else if (!absolute) {
                stack.push_back(std::move(segment));
            }
            // ".." at the root of an absolute path stays at the root
            continue;
        }
        stack.push_back(std::move(segment));
    }

    std::string out = absolute ? "/" : "";
    for (std::size_t i = 0; i < stack.size(); ++i) {
        if (i > 0) {
            out.push_back('/');
        }
        out += stack[i];
    }
    if (out.empty()) {
        return ".";
    }
    return out;
}

Result<std::string> PathValidator::validate(const std::string& raw) const {
    if (raw.empty() || raw.front() != '/') {
        return Fail<std::string>(StatusCode::InvalidArgument, "path must be absolute, got: " + raw);
    }

    const std::string clean = normalize(raw);

    if (has_parent_segment(clean)) {
        return Fail<std::string>(StatusCode::InvalidArgument, "path traversal not allowed: " + raw);
    }

    for (const auto& prefix : policy_.allowed_prefixes) {
        if (!prefix.empty() && clean.compare(0, prefix.size(), prefix) == 0) {
            return Ok(clean);
        }
    }

    return Fail<std::string>(StatusCode::InvalidArgument,
        "path must be under " + join_prefixes(policy_.allowed_prefixes) + ", got: " + clean);
}

std::string PathValidator::translate(const std::string& normalized) const {
    if (policy_.host_mount.empty()) {
        return normalized;
    }
    std::error_code ec;
    if (fs::exists(policy_.host_mount, ec) && !ec) {
        return policy_.host_mount + normalized;
    }
    return normalized;
}

Result<std::string> PathValidator::resolve(const std::string& raw) const {
    auto valid = validate(raw);
    if (valid.is_error()) {
        return valid;
    }
    return Ok(translate(valid.value()));
}

} // namespace ftr::file
