/*
 * Copyright (C) 2025 Regis Araujo Melo
 * This program is free software under the GPL-3.0 license. See LICENSE file.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

// Forward declaration keeps <openssl/evp.h> out of public headers
struct evp_md_ctx_st;

namespace powex::crypto {

using Payload = std::vector<std::uint8_t>;

struct Sha256Digest {
    std::array<std::uint8_t, 32> bytes{};

    bool operator==(const Sha256Digest& other) const { return bytes == other.bytes; }
    bool operator!=(const Sha256Digest& other) const { return bytes != other.bytes; }
};

// Nonces are appended to the payload as 8 little-endian bytes.
constexpr std::size_t kNonceSize = 8;

std::array<std::uint8_t, kNonceSize> encode_nonce(std::uint64_t nonce);

Payload to_payload(std::string_view text);

/**
 * Plain SHA-256 of a buffer
 * @throws std::runtime_error if the OpenSSL digest backend fails
 */
Sha256Digest sha256(const std::uint8_t* data, std::size_t len);

/**
 * SHA-256(payload || encode_nonce(nonce))
 * @throws std::runtime_error if the OpenSSL digest backend fails
 */
Sha256Digest pow_digest(const Payload& payload, std::uint64_t nonce);

/**
 * Reusable hasher for one payload.
 *
 * The payload is absorbed once into a midstate context; every digest()
 * copies that midstate and only hashes the 8 nonce bytes. Not thread-safe:
 * each search worker owns its own instance.
 */
class PayloadHasher {
public:
    explicit PayloadHasher(const Payload& payload);
    ~PayloadHasher();

    PayloadHasher(const PayloadHasher&) = delete;
    PayloadHasher& operator=(const PayloadHasher&) = delete;

    Sha256Digest digest(std::uint64_t nonce);

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };
    using CtxPtr = std::unique_ptr<evp_md_ctx_st, CtxDeleter>;

    CtxPtr midstate_;
    CtxPtr work_;
};

} // namespace powex::crypto
