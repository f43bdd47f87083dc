#include <psyche/hash.hpp>
#include <openssl/evp.h>
#include <stdexcept>

namespace psyche {

Digest sha256(const uint8_t* data, size_t len) {
    Digest out{};

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) throw std::runtime_error("OpenSSL: EVP_MD_CTX_new failed");

    unsigned int out_len = 0;
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx, data, len) != 1 ||
        EVP_DigestFinal_ex(ctx, out.data(), &out_len) != 1) {
        EVP_MD_CTX_free(ctx);
        throw std::runtime_error("OpenSSL: EVP sha256 digest failed");
    }

    EVP_MD_CTX_free(ctx);
    if (out_len != out.size()) {
        throw std::runtime_error("OpenSSL: unexpected SHA-256 digest length");
    }
    return out;
}

Digest sha256(const std::string& text) {
    return sha256(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

Packer& Packer::word(uint64_t value) {
    // 24 bytes of zero padding, then the value big-endian
    bytes_.insert(bytes_.end(), 24, 0);
    for (int shift = 56; shift >= 0; shift -= 8) {
        bytes_.push_back(static_cast<uint8_t>(value >> shift));
    }
    return *this;
}

Packer& Packer::digest(const Digest& d) {
    bytes_.insert(bytes_.end(), d.begin(), d.end());
    return *this;
}

Digest Packer::sha256() const {
    return psyche::sha256(bytes_.data(), bytes_.size());
}

uint64_t digest_mod(const Digest& d, uint64_t m) {
    if (m == 0) throw std::invalid_argument("digest_mod: zero modulus");
    // Horner over bytes; m < 2^56 keeps (r << 8) in range
    if (m >= (uint64_t{1} << 56)) throw std::invalid_argument("digest_mod: modulus too large");
    uint64_t r = 0;
    for (uint8_t byte : d) {
        r = ((r << 8) | byte) % m;
    }
    return r;
}

std::string to_hex(const Digest& d) {
    static const char* digits = "0123456789abcdef";
    std::string out;
    out.reserve(d.size() * 2);
    for (uint8_t byte : d) {
        out += digits[byte >> 4];
        out += digits[byte & 0x0F];
    }
    return out;
}

} // namespace psyche
