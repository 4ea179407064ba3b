#pragma once

#include "io/io.hpp"
#include "util/result.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace ipswdl {

enum class DigestAlgorithm {
    Sha1,
    Md5,
};

const char* DigestName(DigestAlgorithm alg);

// Incremental OpenSSL EVP digest. An empty FinalHex() means the digest failed.
class DigestHasher {
public:
    explicit DigestHasher(DigestAlgorithm alg);
    DigestHasher(const DigestHasher&) = delete;
    DigestHasher& operator=(const DigestHasher&) = delete;
    DigestHasher(DigestHasher&&) noexcept;
    DigestHasher& operator=(DigestHasher&&) noexcept;
    ~DigestHasher();

    void Update(std::span<const std::uint8_t> data);
    std::string FinalHex();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

std::string DigestHex(DigestAlgorithm alg, std::span<const std::uint8_t> data);
std::string DigestHex(DigestAlgorithm alg, IReader& reader);

// Case-insensitive comparison of two hex digests.
bool DigestEquals(const std::string& lhs, const std::string& rhs);

} // namespace ipswdl
