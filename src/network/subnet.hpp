/**
 * @file subnet.hpp
 * @brief IPv4 address and CIDR helpers.
 *
 * Addresses are held as host-order uint32_t. The broadcast address of a
 * network is its network address with every host bit set.
 */

#pragma once

#include "core/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace lan_beacon {

struct Ipv4Network {
    uint32_t address{0};      ///< Network address (host bits cleared)
    uint8_t prefix_length{0};

    [[nodiscard]] constexpr uint32_t mask() const noexcept {
        return prefix_length == 0 ? 0u : (~0u << (32 - prefix_length));
    }

    [[nodiscard]] constexpr uint32_t broadcast() const noexcept {
        return address | ~mask();
    }

    [[nodiscard]] constexpr bool contains(uint32_t ip) const noexcept {
        return (ip & mask()) == address;
    }
};

/// Parse a dotted-quad IPv4 address.
Result<uint32_t> parse_ipv4(std::string_view text);

/// Format a host-order IPv4 address as a dotted quad.
std::string format_ipv4(uint32_t address);

/**
 * @brief Parse "a.b.c.d/n". Host bits in the address are cleared, so
 *        "192.168.1.77/24" yields network 192.168.1.0/24.
 */
Result<Ipv4Network> parse_cidr(std::string_view text);

[[nodiscard]] constexpr bool is_multicast(uint32_t address) noexcept {
    return (address >> 28) == 0xE;
}

}  // namespace lan_beacon
