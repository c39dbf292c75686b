#pragma once

#include "core/result.hpp"

#include <sodium.h>

#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace datlan::crypto {

constexpr size_t PUBLIC_KEY_SIZE = crypto_sign_PUBLICKEYBYTES;
constexpr size_t SECRET_KEY_SIZE = crypto_sign_SECRETKEYBYTES;
constexpr size_t DISCOVERY_KEY_SIZE = 32;
constexpr size_t TOKEN_ENTROPY_SIZE = 32;

using PublicKey = std::array<uint8_t, PUBLIC_KEY_SIZE>;
using SecretKey = std::array<uint8_t, SECRET_KEY_SIZE>;
using DiscoveryKey = std::array<uint8_t, DISCOVERY_KEY_SIZE>;

/**
 * KeyPair - ed25519 signing key pair identifying an archive.
 */
struct KeyPair {
    PublicKey public_key;
    SecretKey secret_key;
};

// BLAKE2b "message" hashed under the public key to obtain the discovery key.
inline constexpr std::string_view DISCOVERY_KEY_NAME = "hypercore";

/**
 * Initialize libsodium. Must succeed before any other function is used.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(
            Error{"Failed to initialize libsodium", ErrorCode::CryptoFailure});
    }
    return Result<void, Error>::ok();
}

/**
 * Generate a new ed25519 key pair.
 */
[[nodiscard]] inline KeyPair generate_keypair() {
    KeyPair kp;
    crypto_sign_keypair(kp.public_key.data(), kp.secret_key.data());
    return kp;
}

/**
 * Derive the discovery key: BLAKE2b-256 keyed with the public key over
 * DISCOVERY_KEY_NAME. Peers sharing a public key agree on it without
 * revealing the key itself on the network.
 */
[[nodiscard]] inline DiscoveryKey generate_discovery_key(const PublicKey& public_key) {
    DiscoveryKey out;
    crypto_generichash(out.data(), out.size(),
                       reinterpret_cast<const unsigned char*>(DISCOVERY_KEY_NAME.data()),
                       DISCOVERY_KEY_NAME.size(),
                       public_key.data(), public_key.size());
    return out;
}

/**
 * Encode bytes as lowercase hex.
 */
[[nodiscard]] inline std::string to_hex(const uint8_t* data, size_t len) {
    std::string hex(len * 2 + 1, '\0');
    sodium_bin2hex(hex.data(), hex.size(), data, len);
    hex.pop_back();
    return hex;
}

[[nodiscard]] inline std::string to_hex(const std::vector<uint8_t>& data) {
    return to_hex(data.data(), data.size());
}

/**
 * Decode hex (either case). The whole input must be consumed.
 */
[[nodiscard]] inline Result<std::vector<uint8_t>, Error> from_hex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{"Odd-length hex string", ErrorCode::InvalidArgument});
    }

    std::vector<uint8_t> out(hex.size() / 2);
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_hex2bin(out.data(), out.size(), hex.data(), hex.size(),
                       nullptr, &out_len, &end) != 0
        || end != hex.data() + hex.size()) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{"Invalid hex string", ErrorCode::InvalidArgument});
    }
    out.resize(out_len);
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

/**
 * Encode bytes as standard (padded) Base64.
 */
[[nodiscard]] inline std::string to_base64(const std::vector<uint8_t>& data) {
    const size_t max_len = sodium_base64_ENCODED_LEN(data.size(), sodium_base64_VARIANT_ORIGINAL);
    std::string out(max_len, '\0');
    sodium_bin2base64(out.data(), out.size(), data.data(), data.size(),
                      sodium_base64_VARIANT_ORIGINAL);
    out.resize(max_len - 1);
    return out;
}

/**
 * Decode standard Base64. Rejects foreign characters, bad padding and
 * trailing garbage instead of skipping them.
 */
[[nodiscard]] inline Result<std::vector<uint8_t>, Error> from_base64(std::string_view b64) {
    std::vector<uint8_t> out(b64.size() / 4 * 3 + 3);
    size_t out_len = 0;
    const char* end = nullptr;
    if (sodium_base642bin(out.data(), out.size(), b64.data(), b64.size(),
                          nullptr, &out_len, &end, sodium_base64_VARIANT_ORIGINAL) != 0
        || end != b64.data() + b64.size()) {
        return Result<std::vector<uint8_t>, Error>::err(
            Error{"Invalid Base64", ErrorCode::MalformedPayload});
    }
    out.resize(out_len);
    return Result<std::vector<uint8_t>, Error>::ok(std::move(out));
}

/**
 * Generate random bytes.
 */
[[nodiscard]] inline std::vector<uint8_t> random_bytes(size_t count) {
    std::vector<uint8_t> bytes(count);
    randombytes_buf(bytes.data(), count);
    return bytes;
}

/**
 * Generate a process identity token: Base64 of SHA-256 over fresh entropy.
 * Only used to recognize our own discovery answers.
 */
[[nodiscard]] inline std::string generate_random_token() {
    const auto entropy = random_bytes(TOKEN_ENTROPY_SIZE);
    std::vector<uint8_t> digest(crypto_hash_sha256_BYTES);
    crypto_hash_sha256(digest.data(), entropy.data(), entropy.size());
    return to_base64(digest);
}

} // namespace datlan::crypto
