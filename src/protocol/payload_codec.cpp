/**
 * @file payload_codec.cpp
 * @brief PayloadCodec binary serialization for announce payloads.
 */

#include "protocol/payload_codec.hpp"

#include <bit>
#include <cstring>

namespace lan_beacon {

// ─────────────────────────────────────────────
// Helper: big-endian encode/decode
// ─────────────────────────────────────────────

void PayloadCodec::put_u8(std::vector<uint8_t>& buf, uint8_t val) {
    buf.push_back(val);
}

void PayloadCodec::put_u32(std::vector<uint8_t>& buf, uint32_t val) {
    buf.push_back(static_cast<uint8_t>((val >> 24) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 16) & 0xFF));
    buf.push_back(static_cast<uint8_t>((val >> 8) & 0xFF));
    buf.push_back(static_cast<uint8_t>(val & 0xFF));
}

void PayloadCodec::put_u64(std::vector<uint8_t>& buf, uint64_t val) {
    for (int i = 7; i >= 0; --i) {
        buf.push_back(static_cast<uint8_t>((val >> (i * 8)) & 0xFF));
    }
}

void PayloadCodec::put_string(std::vector<uint8_t>& buf, std::string_view val) {
    put_u32(buf, static_cast<uint32_t>(val.size()));
    buf.insert(buf.end(), val.begin(), val.end());
}

uint32_t PayloadCodec::get_u32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24)
         | (static_cast<uint32_t>(p[1]) << 16)
         | (static_cast<uint32_t>(p[2]) << 8)
         | static_cast<uint32_t>(p[3]);
}

uint64_t PayloadCodec::get_u64(const uint8_t* p) {
    uint64_t val = 0;
    for (int i = 0; i < 8; ++i) {
        val = (val << 8) | p[i];
    }
    return val;
}

// ─────────────────────────────────────────────
// ByteReader
// ─────────────────────────────────────────────

bool ByteReader::read_u8(uint8_t& out) {
    if (remaining() < 1) return false;
    out = data_[offset_++];
    return true;
}

bool ByteReader::read_u32(uint32_t& out) {
    if (remaining() < 4) return false;
    out = PayloadCodec::get_u32(data_.data() + offset_);
    offset_ += 4;
    return true;
}

bool ByteReader::read_u64(uint64_t& out) {
    if (remaining() < 8) return false;
    out = PayloadCodec::get_u64(data_.data() + offset_);
    offset_ += 8;
    return true;
}

bool ByteReader::read_i64(int64_t& out) {
    uint64_t raw = 0;
    if (!read_u64(raw)) return false;
    out = static_cast<int64_t>(raw);
    return true;
}

bool ByteReader::read_f64(double& out) {
    uint64_t raw = 0;
    if (!read_u64(raw)) return false;
    out = std::bit_cast<double>(raw);
    return true;
}

bool ByteReader::read_string(std::string& out) {
    uint32_t len = 0;
    if (!read_u32(len)) return false;
    if (len > remaining()) return false;
    out.assign(reinterpret_cast<const char*>(data_.data() + offset_), len);
    offset_ += len;
    return true;
}

bool ByteReader::read_bytes(size_t count, std::span<const uint8_t>& out) {
    if (count > remaining()) return false;
    out = data_.subspan(offset_, count);
    offset_ += count;
    return true;
}

// ─────────────────────────────────────────────
// HostMetadata
// ─────────────────────────────────────────────

std::vector<uint8_t> PayloadCodec::encode(const HostMetadata& m) {
    std::vector<uint8_t> buf;
    buf.reserve(1 + 8 + 7 * 4 + 16
                + m.mac_address.size() + m.ip_address.size() + m.hostname.size()
                + m.os.name.size() + m.os.kernel.size() + m.os.arch.size()
                + m.hardware.cpu_model.size());

    put_u8(buf, m.version);
    put_u64(buf, static_cast<uint64_t>(m.timestamp));

    put_string(buf, m.mac_address);
    put_string(buf, m.ip_address);
    put_string(buf, m.hostname);

    put_string(buf, m.os.name);
    put_string(buf, m.os.kernel);
    put_string(buf, m.os.arch);

    put_string(buf, m.hardware.cpu_model);
    put_u32(buf, m.hardware.cpu_cores);
    put_u64(buf, std::bit_cast<uint64_t>(m.hardware.memory_gb));
    put_u32(buf, m.hardware.disk_count);

    return buf;
}

Result<HostMetadata> PayloadCodec::decode(std::span<const uint8_t> data) {
    ByteReader reader(data);
    HostMetadata m;

    if (!reader.read_u8(m.version)) {
        return Error{ErrorCode::Protocol, "Truncated payload: missing version"};
    }
    if (m.version != PROTOCOL_VERSION) {
        return Error{ErrorCode::Protocol,
                     "Unsupported protocol version " + std::to_string(m.version)};
    }

    bool ok = reader.read_i64(m.timestamp)
           && reader.read_string(m.mac_address)
           && reader.read_string(m.ip_address)
           && reader.read_string(m.hostname)
           && reader.read_string(m.os.name)
           && reader.read_string(m.os.kernel)
           && reader.read_string(m.os.arch)
           && reader.read_string(m.hardware.cpu_model)
           && reader.read_u32(m.hardware.cpu_cores)
           && reader.read_f64(m.hardware.memory_gb)
           && reader.read_u32(m.hardware.disk_count);

    if (!ok) {
        return Error{ErrorCode::Protocol, "Truncated or malformed payload"};
    }
    if (!reader.at_end()) {
        return Error{ErrorCode::Protocol,
                     "Trailing bytes after payload: " + std::to_string(reader.remaining())};
    }

    return m;
}

// ─────────────────────────────────────────────
// HostRecord
// ─────────────────────────────────────────────

namespace {

constexpr uint8_t FLAG_ACTIVE = 0x01;
constexpr uint8_t FLAG_KEY_PUSHED = 0x02;
constexpr uint8_t FLAG_PUSHED_AT = 0x04;

}  // anonymous namespace

void PayloadCodec::append_record(std::vector<uint8_t>& buf, const HostRecord& record) {
    auto metadata = encode(record.metadata);
    put_u32(buf, static_cast<uint32_t>(metadata.size()));
    buf.insert(buf.end(), metadata.begin(), metadata.end());

    put_u64(buf, static_cast<uint64_t>(to_unix_millis(record.first_seen)));
    put_u64(buf, static_cast<uint64_t>(to_unix_millis(record.last_seen)));
    put_u64(buf, record.packet_count);

    uint8_t flags = 0;
    if (record.active) flags |= FLAG_ACTIVE;
    if (record.ssh_key_pushed) flags |= FLAG_KEY_PUSHED;
    if (record.key_pushed_at) flags |= FLAG_PUSHED_AT;
    put_u8(buf, flags);

    put_u64(buf, record.key_pushed_at
                     ? static_cast<uint64_t>(to_unix_millis(*record.key_pushed_at))
                     : 0);
}

std::vector<uint8_t> PayloadCodec::encode_record(const HostRecord& record) {
    std::vector<uint8_t> buf;
    append_record(buf, record);
    return buf;
}

Result<HostRecord> PayloadCodec::decode_record(std::span<const uint8_t> data) {
    ByteReader reader(data);

    uint32_t metadata_len = 0;
    std::span<const uint8_t> metadata_bytes;
    if (!reader.read_u32(metadata_len) || !reader.read_bytes(metadata_len, metadata_bytes)) {
        return Error{ErrorCode::Protocol, "Truncated host record"};
    }

    auto metadata = decode(metadata_bytes);
    if (!metadata) return metadata.error();

    HostRecord record;
    record.metadata = std::move(*metadata);

    int64_t first_seen_ms = 0;
    int64_t last_seen_ms = 0;
    int64_t pushed_at_ms = 0;
    uint8_t flags = 0;

    bool ok = reader.read_i64(first_seen_ms)
           && reader.read_i64(last_seen_ms)
           && reader.read_u64(record.packet_count)
           && reader.read_u8(flags)
           && reader.read_i64(pushed_at_ms);
    if (!ok || !reader.at_end()) {
        return Error{ErrorCode::Protocol, "Malformed host record"};
    }

    record.first_seen = from_unix_millis(first_seen_ms);
    record.last_seen = from_unix_millis(last_seen_ms);
    record.active = (flags & FLAG_ACTIVE) != 0;
    record.ssh_key_pushed = (flags & FLAG_KEY_PUSHED) != 0;
    if (flags & FLAG_PUSHED_AT) {
        record.key_pushed_at = from_unix_millis(pushed_at_ms);
    }

    return record;
}

}  // namespace lan_beacon
