/**
 * @file packet_validator.cpp
 * @brief PacketValidator implementation.
 */

#include "protocol/packet_validator.hpp"

#include "core/logger.hpp"
#include "protocol/payload_codec.hpp"

#include <cstdint>

namespace lan_beacon {

PacketValidator::PacketValidator(const Authenticator& authenticator,
                                 MacAddress local_mac,
                                 std::chrono::seconds tolerance,
                                 Logger* logger)
    : authenticator_(authenticator)
    , local_mac_(canonical_mac(local_mac))
    , tolerance_(tolerance)
    , logger_(logger) {}

Result<HostMetadata, DropReason> PacketValidator::validate(
    std::span<const uint8_t> datagram,
    std::string_view sender,
    Timestamp now) const {

    auto reject = [&](DropReason reason, std::string_view detail) {
        if (logger_ && logger_->enabled(LogLevel::Debug)) {
            logger_->debug("Dropped datagram from " + std::string(sender) + " ("
                           + std::string(to_string(reason)) + "): " + std::string(detail));
        }
        return Result<HostMetadata, DropReason>(reason);
    };

    if (datagram.size() <= SIGNATURE_SIZE) {
        return reject(DropReason::TooShort,
                      std::to_string(datagram.size()) + " bytes");
    }

    auto signature = datagram.first(SIGNATURE_SIZE);
    auto payload = datagram.subspan(SIGNATURE_SIZE);

    if (!authenticator_.verify(signature, payload)) {
        return reject(DropReason::BadSignature, "signature mismatch");
    }

    auto metadata = PayloadCodec::decode(payload);
    if (!metadata) {
        return reject(DropReason::Malformed, metadata.error().message);
    }

    // ts may be any i64, so compare against the bounds instead of subtracting
    const int64_t now_s = to_unix_seconds(now);
    const int64_t tolerance = tolerance_.count();
    const int64_t ts = metadata->timestamp;
    if (ts < now_s - tolerance || ts > now_s + tolerance) {
        return reject(DropReason::StaleTimestamp,
                      "timestamp " + std::to_string(ts) + " outside "
                      + std::to_string(tolerance) + "s of " + std::to_string(now_s));
    }

    if (canonical_mac(metadata->mac_address) == local_mac_) {
        return reject(DropReason::SelfOrigin, metadata->mac_address);
    }

    return std::move(*metadata);
}

}  // namespace lan_beacon
