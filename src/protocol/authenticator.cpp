/**
 * @file authenticator.cpp
 * @brief Authenticator implementation on OpenSSL's HMAC.
 */

#include "protocol/authenticator.hpp"

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <optional>

namespace lan_beacon {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::optional<Signature> compute_hmac(const std::vector<uint8_t>& key,
                                      std::span<const uint8_t> data) {
    Signature sig{};
    unsigned int sig_len = 0;

    // HMAC() wants a non-null key pointer even for a zero-length key.
    static const uint8_t empty_key = 0;
    const void* key_ptr = key.empty() ? &empty_key : key.data();
    static const uint8_t empty_data = 0;
    const uint8_t* data_ptr = data.empty() ? &empty_data : data.data();

    if (::HMAC(EVP_sha256(), key_ptr, static_cast<int>(key.size()),
               data_ptr, data.size(), sig.data(), &sig_len) == nullptr
        || sig_len != SIGNATURE_SIZE) {
        return std::nullopt;
    }
    return sig;
}

}  // anonymous namespace

std::vector<uint8_t> derive_key(std::string_view secret) {
    bool is_hex = !secret.empty() && secret.size() % 2 == 0;
    for (size_t i = 0; is_hex && i < secret.size(); ++i) {
        is_hex = hex_value(secret[i]) >= 0;
    }

    if (!is_hex) {
        return std::vector<uint8_t>(secret.begin(), secret.end());
    }

    std::vector<uint8_t> key;
    key.reserve(secret.size() / 2);
    for (size_t i = 0; i < secret.size(); i += 2) {
        key.push_back(static_cast<uint8_t>(
            (hex_value(secret[i]) << 4) | hex_value(secret[i + 1])));
    }
    return key;
}

// ─────────────────────────────────────────────
// Authenticator
// ─────────────────────────────────────────────

Authenticator::Authenticator(std::string_view secret) : key_(derive_key(secret)) {}

Result<Signature> Authenticator::sign(std::span<const uint8_t> data) const {
    auto sig = compute_hmac(key_, data);
    if (!sig) {
        return Error{ErrorCode::Generic, "HMAC-SHA256 computation failed"};
    }
    return *sig;
}

bool Authenticator::verify(std::span<const uint8_t> signature,
                           std::span<const uint8_t> data) const {
    if (signature.size() != SIGNATURE_SIZE) return false;
    auto expected = compute_hmac(key_, data);
    if (!expected) return false;
    return ::CRYPTO_memcmp(expected->data(), signature.data(), SIGNATURE_SIZE) == 0;
}

Result<std::vector<uint8_t>> Authenticator::seal(std::span<const uint8_t> data) const {
    auto sig = sign(data);
    if (!sig) return sig.error();
    std::vector<uint8_t> packet;
    packet.reserve(SIGNATURE_SIZE + data.size());
    packet.insert(packet.end(), sig->begin(), sig->end());
    packet.insert(packet.end(), data.begin(), data.end());
    return packet;
}

// ─────────────────────────────────────────────
// Free functions
// ─────────────────────────────────────────────

Result<Signature> sign(std::span<const uint8_t> data, std::string_view secret) {
    return Authenticator(secret).sign(data);
}

bool verify(std::span<const uint8_t> signature,
            std::span<const uint8_t> data,
            std::string_view secret) {
    return Authenticator(secret).verify(signature, data);
}

}  // namespace lan_beacon
