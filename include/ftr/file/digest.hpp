#pragma once

#include "ftr/core/result.hpp"
#include "ftr/file/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

struct evp_md_ctx_st;

namespace ftr::file {

/// MD5 when unspecified
DigestMethod effective_method(DigestMethod method);

std::size_t digest_size(DigestMethod method);

/**
 * @brief Incremental fingerprint over an observed byte stream
 *
 * The result depends only on the bytes fed, never on how they were split
 * across update() calls.
 */
class DigestAccumulator {
public:
    static Result<DigestAccumulator> create(DigestMethod method);

    DigestAccumulator(DigestAccumulator&&) noexcept = default;
    DigestAccumulator& operator=(DigestAccumulator&&) noexcept = default;

    Result<void> update(const void* data, std::size_t size);

    /// Finalizes; further updates are rejected
    Result<HashValue> finish();

    DigestMethod method() const noexcept { return method_; }
    std::uint64_t bytes_observed() const noexcept { return bytes_; }

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    DigestAccumulator(DigestMethod method, std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx);

    DigestMethod method_;
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
    std::uint64_t bytes_ = 0;
    bool finished_ = false;
};

Result<HashValue> digest_bytes(DigestMethod method, const void* data, std::size_t size);

Result<HashValue> digest_file(DigestMethod method, const std::filesystem::path& path);

} // namespace ftr::file
