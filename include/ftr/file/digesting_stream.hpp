#pragma once

#include "ftr/fetch/byte_stream.hpp"
#include "ftr/file/digest.hpp"

namespace ftr::file {

/**
 * @brief ByteStream decorator folding every byte it hands out into a digest
 *
 * The digest is updated inside the same read() that returns the bytes, so
 * the fingerprint always covers exactly what the consumer observed.
 */
class DigestingStream : public fetch::ByteStream {
public:
    DigestingStream(fetch::ByteStream& inner, DigestAccumulator& digest)
        : inner_(inner), digest_(digest) {}

    Result<std::size_t> read(void* buffer, std::size_t capacity) override {
        auto result = inner_.read(buffer, capacity);
        if (result.is_error()) {
            return result;
        }
        if (auto res = digest_.update(buffer, result.value()); res.is_error()) {
            return Err<std::size_t>(res.error());
        }
        return result;
    }

private:
    fetch::ByteStream& inner_;
    DigestAccumulator& digest_;
};

} // namespace ftr::file
