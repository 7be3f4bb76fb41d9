#include "ftr/file/digest.hpp"

#include <openssl/evp.h>

#include <fstream>

namespace ftr::file {

namespace {

const EVP_MD* evp_for(DigestMethod method) {
    switch (effective_method(method)) {
        case DigestMethod::Sha256: return EVP_sha256();
        case DigestMethod::Sha512: return EVP_sha512();
        default: return EVP_md5();
    }
}

} // namespace

DigestMethod effective_method(DigestMethod method) {
    return method == DigestMethod::Unspecified ? DigestMethod::Md5 : method;
}

std::size_t digest_size(DigestMethod method) {
    switch (effective_method(method)) {
        case DigestMethod::Sha256: return 32;
        case DigestMethod::Sha512: return 64;
        default: return 16;
    }
}

void DigestAccumulator::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

DigestAccumulator::DigestAccumulator(DigestMethod method, std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx)
    : method_(method), ctx_(std::move(ctx)) {}

Result<DigestAccumulator> DigestAccumulator::create(DigestMethod method) {
    const auto resolved = effective_method(method);
    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return Fail<DigestAccumulator>(StatusCode::Internal, "EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx.get(), evp_for(resolved), nullptr) != 1) {
        return Fail<DigestAccumulator>(StatusCode::Internal,
            std::string("digest init failed for ") + digest_method_name(resolved));
    }
    return Ok(DigestAccumulator(resolved, std::move(ctx)));
}

Result<void> DigestAccumulator::update(const void* data, std::size_t size) {
    if (finished_) {
        return Fail<void>(StatusCode::Internal, "digest already finalized");
    }
    if (size == 0) {
        return Ok();
    }
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        return Fail<void>(StatusCode::Internal, "digest update failed");
    }
    bytes_ += size;
    return Ok();
}

Result<HashValue> DigestAccumulator::finish() {
    if (finished_) {
        return Fail<HashValue>(StatusCode::Internal, "digest already finalized");
    }
    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int out_len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out, &out_len) != 1) {
        return Fail<HashValue>(StatusCode::Internal, "digest finalization failed");
    }
    finished_ = true;

    HashValue hash;
    hash.method = method_;
    hash.bytes.assign(out, out + out_len);
    return Ok(std::move(hash));
}

Result<HashValue> digest_bytes(DigestMethod method, const void* data, std::size_t size) {
    auto acc = DigestAccumulator::create(method);
    if (acc.is_error()) {
        return Err<HashValue>(acc.error());
    }
    if (auto res = acc.value().update(data, size); res.is_error()) {
        return Err<HashValue>(res.error());
    }
    return acc.value().finish();
}

Result<HashValue> digest_file(DigestMethod method, const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<HashValue>(StatusCode::Internal, "failed to open file for hashing: " + path.string());
    }

    auto acc = DigestAccumulator::create(method);
    if (acc.is_error()) {
        return Err<HashValue>(acc.error());
    }

    char buffer[64 * 1024];
    while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (auto res = acc.value().update(buffer, count); res.is_error()) {
            return Err<HashValue>(res.error());
        }
    }
    if (input.bad()) {
        return Fail<HashValue>(StatusCode::Internal, "read error while hashing: " + path.string());
    }
    return acc.value().finish();
}

} // namespace ftr::file
