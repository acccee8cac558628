/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#include "powex/crypto/sha256.hpp"
#include <openssl/evp.h>
#include <stdexcept>

namespace powex {
namespace crypto {

std::array<std::uint8_t, kNonceSize> encode_nonce(std::uint64_t nonce) {
    std::array<std::uint8_t, kNonceSize> out{};
    for (std::size_t i = 0; i < kNonceSize; ++i) {
        out[i] = static_cast<std::uint8_t>((nonce >> (i * 8)) & 0xFF);
    }
    return out;
}

Payload to_payload(std::string_view text) {
    return Payload(text.begin(), text.end());
}

Sha256Digest sha256(const std::uint8_t* data, std::size_t len) {
    Sha256Digest out;
    unsigned int out_len = static_cast<unsigned int>(out.bytes.size());
    if (EVP_Digest(data, len, out.bytes.data(), &out_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to compute SHA256");
    }
    return out;
}

Sha256Digest pow_digest(const Payload& payload, std::uint64_t nonce) {
    PayloadHasher hasher(payload);
    return hasher.digest(nonce);
}

void PayloadHasher::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

PayloadHasher::PayloadHasher(const Payload& payload)
    : midstate_(EVP_MD_CTX_new())
    , work_(EVP_MD_CTX_new()) {
    if (!midstate_ || !work_) {
        throw std::runtime_error("Failed to create EVP_MD_CTX");
    }
    if (EVP_DigestInit_ex(midstate_.get(), EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("Failed to initialize SHA256");
    }
    if (!payload.empty() &&
        EVP_DigestUpdate(midstate_.get(), payload.data(), payload.size()) != 1) {
        throw std::runtime_error("Failed to absorb payload into SHA256");
    }
}

PayloadHasher::~PayloadHasher() = default;

Sha256Digest PayloadHasher::digest(std::uint64_t nonce) {
    if (EVP_MD_CTX_copy_ex(work_.get(), midstate_.get()) != 1) {
        throw std::runtime_error("Failed to copy SHA256 midstate");
    }

    const auto encoded = encode_nonce(nonce);
    if (EVP_DigestUpdate(work_.get(), encoded.data(), encoded.size()) != 1) {
        throw std::runtime_error("Failed to update SHA256");
    }

    Sha256Digest out;
    unsigned int len = static_cast<unsigned int>(out.bytes.size());
    if (EVP_DigestFinal_ex(work_.get(), out.bytes.data(), &len) != 1) {
        throw std::runtime_error("Failed to finalize SHA256");
    }
    return out;
}

} // namespace crypto
} // namespace powex
