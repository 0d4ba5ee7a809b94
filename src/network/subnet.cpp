/**
 * @file subnet.cpp
 * @brief IPv4 / CIDR parsing via inet_pton.
 */

#include "network/subnet.hpp"

#include <arpa/inet.h>
#include <charconv>
#include <netinet/in.h>

namespace lan_beacon {

Result<uint32_t> parse_ipv4(std::string_view text) {
    std::string buf(text);
    in_addr addr{};
    if (::inet_pton(AF_INET, buf.c_str(), &addr) != 1) {
        return Error{ErrorCode::InvalidArgument, "Invalid IPv4 address: " + buf};
    }
    return static_cast<uint32_t>(ntohl(addr.s_addr));
}

std::string format_ipv4(uint32_t address) {
    in_addr addr{};
    addr.s_addr = htonl(address);
    char buf[INET_ADDRSTRLEN];
    if (::inet_ntop(AF_INET, &addr, buf, sizeof(buf)) == nullptr) {
        return {};
    }
    return buf;
}

Result<Ipv4Network> parse_cidr(std::string_view text) {
    auto slash = text.find('/');
    if (slash == std::string_view::npos) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid CIDR (missing prefix length): " + std::string(text)};
    }

    auto ip = parse_ipv4(text.substr(0, slash));
    if (!ip) {
        return Error{ErrorCode::InvalidArgument, "Invalid CIDR: " + std::string(text)};
    }

    auto prefix_text = text.substr(slash + 1);
    unsigned prefix = 0;
    auto [ptr, ec] = std::from_chars(prefix_text.data(),
                                     prefix_text.data() + prefix_text.size(), prefix);
    if (ec != std::errc{} || ptr != prefix_text.data() + prefix_text.size()
        || prefix_text.empty() || prefix > 32) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid CIDR prefix length: " + std::string(text)};
    }

    Ipv4Network network;
    network.prefix_length = static_cast<uint8_t>(prefix);
    network.address = *ip & network.mask();
    return network;
}

}  // namespace lan_beacon
