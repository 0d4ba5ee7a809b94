/**
 * @file payload_codec.hpp
 * @brief Deterministic binary codec for HostMetadata and HostRecord.
 *
 * The Authenticator signs the exact bytes produced here, so encoding is
 * field-for-field with a fixed order and fixed-width integers.
 *
 * HostMetadata wire format (all multi-byte values are big-endian):
 *   [1B version][8B timestamp]
 *   [str mac][str ip][str hostname]
 *   [str os.name][str os.kernel][str os.arch]
 *   [str cpu_model][4B cpu_cores][8B memory_gb (IEEE-754)][4B disk_count]
 *
 * where str = [4B length][bytes].
 *
 * HostRecord format:
 *   [4B metadata_len][metadata][8B first_seen_ms][8B last_seen_ms]
 *   [8B packet_count][1B flags][8B key_pushed_at_ms]
 *
 * flags: bit 0 active, bit 1 ssh_key_pushed, bit 2 key_pushed_at present.
 */

#pragma once

#include "core/concepts.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace lan_beacon {

class PayloadCodec {
public:
    static std::vector<uint8_t> encode(const HostMetadata& metadata);

    /**
     * @brief Decode a HostMetadata.
     *
     * Truncated input, an oversized string length, an unsupported version
     * or trailing bytes all yield an Error with ErrorCode::Protocol.
     */
    static Result<HostMetadata> decode(std::span<const uint8_t> data);

    static std::vector<uint8_t> encode_record(const HostRecord& record);
    static void append_record(std::vector<uint8_t>& buf, const HostRecord& record);
    static Result<HostRecord> decode_record(std::span<const uint8_t> data);

    // ── Primitive helpers (shared with the query protocol) ──
    static void put_u8(std::vector<uint8_t>& buf, uint8_t val);
    static void put_u32(std::vector<uint8_t>& buf, uint32_t val);
    static void put_u64(std::vector<uint8_t>& buf, uint64_t val);
    static void put_string(std::vector<uint8_t>& buf, std::string_view val);

    static uint32_t get_u32(const uint8_t* p);
    static uint64_t get_u64(const uint8_t* p);
};

/**
 * @brief Bounds-checked sequential reader over a byte span.
 *
 * Every getter returns false instead of reading past the end.
 */
class ByteReader {
public:
    explicit ByteReader(std::span<const uint8_t> data) : data_(data) {}

    bool read_u8(uint8_t& out);
    bool read_u32(uint32_t& out);
    bool read_u64(uint64_t& out);
    bool read_i64(int64_t& out);
    bool read_f64(double& out);
    bool read_string(std::string& out);
    bool read_bytes(size_t count, std::span<const uint8_t>& out);

    [[nodiscard]] size_t remaining() const noexcept { return data_.size() - offset_; }
    [[nodiscard]] bool at_end() const noexcept { return offset_ == data_.size(); }

private:
    std::span<const uint8_t> data_;
    size_t offset_{0};
};

static_assert(CodecLike<PayloadCodec, HostMetadata>);

}  // namespace lan_beacon
