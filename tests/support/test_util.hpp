#pragma once

#include "ftr/fetch/byte_stream.hpp"
#include "ftr/file/path_validator.hpp"

#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ftr::test {

namespace fs = std::filesystem;

inline fs::path create_temp_dir(const std::string& prefix = "ftr_test") {
    const auto base = fs::temp_directory_path();
    static std::atomic<uint64_t> counter{0};
    const auto id = counter.fetch_add(1);
    fs::path dir = base / fs::path(prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(id));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

/// Validator allowing only dir, never translating
inline file::PathValidator validator_for(const fs::path& dir) {
    file::PathValidator::Policy policy;
    policy.allowed_prefixes = {dir.string() + "/"};
    policy.host_mount = "";
    return file::PathValidator(policy);
}

inline std::string read_file(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    std::ostringstream oss;
    oss << input.rdbuf();
    return oss.str();
}

inline void write_file(const fs::path& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::vector<std::uint8_t> bytes_of(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

/// Deterministic pseudo-random payload
inline std::string make_payload(std::size_t size, std::uint32_t seed = 7) {
    std::string out(size, '\0');
    std::uint32_t x = seed;
    for (auto& c : out) {
        x = x * 1664525u + 1013904223u;
        c = static_cast<char>(x >> 24);
    }
    return out;
}

/**
 * @brief ByteStream over an in-memory string, optionally failing midway
 */
class StringStream : public fetch::ByteStream {
public:
    explicit StringStream(std::string data, std::size_t max_read = SIZE_MAX,
                          std::size_t fail_after = SIZE_MAX)
        : data_(std::move(data)), max_read_(max_read), fail_after_(fail_after) {}

    Result<std::size_t> read(void* buffer, std::size_t capacity) override {
        if (pos_ >= fail_after_) {
            return Fail<std::size_t>(StatusCode::Internal, "connection reset by peer");
        }
        std::size_t n = std::min({capacity, max_read_, data_.size() - pos_});
        if (fail_after_ != SIZE_MAX) {
            n = std::min(n, fail_after_ - pos_);
        }
        std::memcpy(buffer, data_.data() + pos_, n);
        pos_ += n;
        return Ok(n);
    }

private:
    std::string data_;
    std::size_t max_read_;
    std::size_t fail_after_;
    std::size_t pos_ = 0;
};

/**
 * @brief UrlFetcher serving one canned body, or a canned open() error
 */
class StringFetcher : public fetch::UrlFetcher {
public:
    explicit StringFetcher(std::string body) : body_(std::move(body)) {}

    Result<fetch::FetchedStream> open(const std::string& url,
                                      std::uint64_t max_bytes,
                                      Deadline) override {
        ++opens;
        last_url = url;
        if (open_error) {
            return Err<fetch::FetchedStream>(*open_error);
        }
        if (body_.size() > max_bytes) {
            return Fail<fetch::FetchedStream>(StatusCode::Internal, "body exceeds maximum allowed size");
        }
        fetch::FetchedStream fetched;
        fetched.stream = std::make_unique<StringStream>(body_, max_read, fail_after);
        fetched.size_hint = body_.size();
        return Ok(std::move(fetched));
    }

    std::optional<Error> open_error;
    std::size_t max_read = SIZE_MAX;
    std::size_t fail_after = SIZE_MAX;
    int opens = 0;
    std::string last_url;

private:
    std::string body_;
};

} // namespace ftr::test
