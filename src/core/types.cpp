/**
 * @file types.cpp
 * @brief Out-of-line helpers for the shared vocabulary types.
 */

#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace lan_beacon {

std::string canonical_mac(std::string_view mac) {
    std::string out(mac);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

}  // namespace lan_beacon
