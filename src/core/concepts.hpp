/**
 * @file concepts.hpp
 * @brief C++20 concept definitions for LanBeacon interfaces.
 *
 * Compile-time interface constraints for the pluggable pieces of the
 * announce path.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <concepts>
#include <cstdint>
#include <span>
#include <vector>

namespace lan_beacon {

// ─────────────────────────────────────────────
// MetadataSourceLike
// ─────────────────────────────────────────────

/**
 * @concept MetadataSourceLike
 * @brief Constrains types that can produce the local HostMetadata.
 *
 * Called once per announce tick. The engine holds the source behind a
 * std::function, so any type satisfying this concept can be wired in.
 */
template <typename T>
concept MetadataSourceLike = requires(T source) {
    { source.read() } -> std::same_as<Result<HostMetadata>>;
};

// ─────────────────────────────────────────────
// CodecLike
// ─────────────────────────────────────────────

/**
 * @concept CodecLike
 * @brief Constrains types that can serialize/deserialize a message.
 */
template <typename T, typename MessageT>
concept CodecLike = requires(const MessageT& msg, std::span<const uint8_t> data) {
    { T::encode(msg) } -> std::same_as<std::vector<uint8_t>>;
    { T::decode(data) } -> std::same_as<Result<MessageT>>;
};

}  // namespace lan_beacon
