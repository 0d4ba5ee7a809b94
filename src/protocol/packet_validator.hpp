/**
 * @file packet_validator.hpp
 * @brief Short-circuiting acceptance pipeline for inbound datagrams.
 *
 * Order of checks:
 *   1. length <= SIGNATURE_SIZE          -> TooShort
 *   2. HMAC over datagram[32:] mismatch  -> BadSignature
 *   3. payload does not decode           -> Malformed
 *   4. |now - timestamp| > tolerance     -> StaleTimestamp
 *   5. mac equals the local MAC          -> SelfOrigin
 *
 * Rejections are values; nothing here throws on hostile input.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "protocol/authenticator.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace lan_beacon {

class Logger;

class PacketValidator {
public:
    PacketValidator(const Authenticator& authenticator,
                    MacAddress local_mac,
                    std::chrono::seconds tolerance = std::chrono::seconds(60),
                    Logger* logger = nullptr);

    [[nodiscard]] Result<HostMetadata, DropReason> validate(
        std::span<const uint8_t> datagram,
        std::string_view sender,
        Timestamp now) const;

    [[nodiscard]] std::chrono::seconds tolerance() const noexcept { return tolerance_; }

private:
    const Authenticator& authenticator_;
    MacAddress local_mac_;
    std::chrono::seconds tolerance_;
    Logger* logger_;
};

}  // namespace lan_beacon
