#include "crypto/digest.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <vector>

namespace ipswdl {

namespace {

std::string HexEncode(std::span<const std::uint8_t> bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.resize(bytes.size() * 2);
    for (size_t i = 0; i < bytes.size(); ++i) {
        out[i * 2] = kHex[(bytes[i] >> 4) & 0xF];
        out[i * 2 + 1] = kHex[bytes[i] & 0xF];
    }
    return out;
}

const EVP_MD* MdFor(DigestAlgorithm alg) {
    switch (alg) {
        case DigestAlgorithm::Sha1: return EVP_sha1();
        case DigestAlgorithm::Md5:  return EVP_md5();
    }
    return nullptr;
}

class EvpCtx final {
public:
    EvpCtx() : ctx_(EVP_MD_CTX_new()) {}
    EvpCtx(const EvpCtx&) = delete;
    EvpCtx& operator=(const EvpCtx&) = delete;
    ~EvpCtx() {
        if (ctx_) EVP_MD_CTX_free(ctx_);
    }

    EVP_MD_CTX* get() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_ = nullptr;
};

bool InitDigest(EvpCtx& ctx, DigestAlgorithm alg) {
    const EVP_MD* md = MdFor(alg);
    return ctx.ok() && md && EVP_DigestInit_ex(ctx.get(), md, nullptr) == 1;
}

bool UpdateDigest(EvpCtx& ctx, std::span<const std::uint8_t> data) {
    if (data.empty()) return true;
    return EVP_DigestUpdate(ctx.get(), data.data(), data.size()) == 1;
}

std::string FinalDigestHex(EvpCtx& ctx) {
    std::array<std::uint8_t, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) return {};
    return HexEncode(std::span<const std::uint8_t>(digest.data(), len));
}

} // namespace

const char* DigestName(DigestAlgorithm alg) {
    switch (alg) {
        case DigestAlgorithm::Sha1: return "sha1";
        case DigestAlgorithm::Md5:  return "md5";
    }
    return "digest";
}

struct DigestHasher::Impl {
    EvpCtx ctx;
    bool initialized = false;
    bool finalized = false;
};

DigestHasher::DigestHasher(DigestAlgorithm alg) : impl_(std::make_unique<Impl>()) {
    if (InitDigest(impl_->ctx, alg)) {
        impl_->initialized = true;
    }
}

DigestHasher::DigestHasher(DigestHasher&&) noexcept = default;
DigestHasher& DigestHasher::operator=(DigestHasher&&) noexcept = default;
DigestHasher::~DigestHasher() = default;

void DigestHasher::Update(std::span<const std::uint8_t> data) {
    if (!impl_ || !impl_->initialized || impl_->finalized) return;
    if (!UpdateDigest(impl_->ctx, data)) {
        impl_->finalized = true;
    }
}

std::string DigestHasher::FinalHex() {
    if (!impl_ || !impl_->initialized || impl_->finalized) return {};
    impl_->finalized = true;
    return FinalDigestHex(impl_->ctx);
}

std::string DigestHex(DigestAlgorithm alg, std::span<const std::uint8_t> data) {
    DigestHasher hasher(alg);
    hasher.Update(data);
    return hasher.FinalHex();
}

std::string DigestHex(DigestAlgorithm alg, IReader& reader) {
    DigestHasher hasher(alg);

    std::vector<std::uint8_t> buf(256 * 1024);
    while (true) {
        const ssize_t n = reader.Read(std::span<std::uint8_t>(buf.data(), buf.size()));
        if (n == 0) break;
        if (n < 0) return {};
        hasher.Update(std::span<const std::uint8_t>(buf.data(), static_cast<size_t>(n)));
    }
    return hasher.FinalHex();
}

bool DigestEquals(const std::string& lhs, const std::string& rhs) {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](unsigned char a, unsigned char b) {
               return std::tolower(a) == std::tolower(b);
           });
}

} // namespace ipswdl
