/**
 * @file authenticator.hpp
 * @brief HMAC-SHA256 signing and constant-time verification of payloads.
 *
 * The shared secret is distributed out of band. A secret made entirely of
 * hex digit pairs is decoded to raw key bytes; any other string is used as
 * raw bytes. Both sides apply the same rule.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lan_beacon {

/**
 * @brief Derive the HMAC key from a shared secret string.
 */
[[nodiscard]] std::vector<uint8_t> derive_key(std::string_view secret);

class Authenticator {
public:
    explicit Authenticator(std::string_view secret);

    /// Fails with ErrorCode::Generic only if libcrypto reports an error.
    [[nodiscard]] Result<Signature> sign(std::span<const uint8_t> data) const;

    /**
     * @brief Verify a signature in constant time.
     *
     * A signature of any length other than SIGNATURE_SIZE fails, as does
     * any libcrypto error.
     */
    [[nodiscard]] bool verify(std::span<const uint8_t> signature,
                              std::span<const uint8_t> data) const;

    /// signature || data, ready for the wire.
    [[nodiscard]] Result<std::vector<uint8_t>> seal(std::span<const uint8_t> data) const;

private:
    std::vector<uint8_t> key_;
};

[[nodiscard]] Result<Signature> sign(std::span<const uint8_t> data, std::string_view secret);
[[nodiscard]] bool verify(std::span<const uint8_t> signature,
                          std::span<const uint8_t> data,
                          std::string_view secret);

}  // namespace lan_beacon
