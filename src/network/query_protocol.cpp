/**
 * @file query_protocol.cpp
 * @brief QueryCodec and poll()-driven stream framing.
 */

#include "network/query_protocol.hpp"

#include "protocol/payload_codec.hpp"

#include <cerrno>
#include <poll.h>
#include <sys/socket.h>

namespace lan_beacon {

namespace {

bool is_list(QueryOp op) {
    return op == QueryOp::ListActiveHosts || op == QueryOp::ListHosts;
}

bool send_all(int fd, const uint8_t* ptr, size_t len, uint32_t timeout_ms) {
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) return false;

        auto sent = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return false;
        }

        ptr += sent;
        remaining -= static_cast<size_t>(sent);
    }

    return true;
}

bool recv_all(int fd, uint8_t* ptr, size_t len, uint32_t timeout_ms) {
    size_t remaining = len;

    while (remaining > 0) {
        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(timeout_ms));
        if (ready <= 0) return false;

        auto received = ::recv(fd, ptr, remaining, 0);
        if (received <= 0) {
            if (received < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) continue;
            return false;  // Connection closed or error
        }

        ptr += received;
        remaining -= static_cast<size_t>(received);
    }

    return true;
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────

std::vector<uint8_t> QueryCodec::encode_request(const QueryRequest& request) {
    std::vector<uint8_t> buf;
    PayloadCodec::put_u8(buf, static_cast<uint8_t>(request.op));
    if (request.op == QueryOp::MarkKeyPushed) {
        PayloadCodec::put_string(buf, request.mac);
    }
    return buf;
}

Result<QueryRequest> QueryCodec::decode_request(std::span<const uint8_t> data) {
    ByteReader reader(data);
    uint8_t opcode = 0;
    if (!reader.read_u8(opcode)) {
        return Error{ErrorCode::Protocol, "Empty request"};
    }

    QueryRequest request;
    switch (opcode) {
        case static_cast<uint8_t>(QueryOp::ListActiveHosts):
        case static_cast<uint8_t>(QueryOp::ListHosts):
            request.op = static_cast<QueryOp>(opcode);
            break;
        case static_cast<uint8_t>(QueryOp::MarkKeyPushed):
            request.op = QueryOp::MarkKeyPushed;
            if (!reader.read_string(request.mac)) {
                return Error{ErrorCode::Protocol, "MarkKeyPushed request without MAC"};
            }
            break;
        default:
            return Error{ErrorCode::Protocol, "Unknown opcode " + std::to_string(opcode)};
    }

    if (!reader.at_end()) {
        return Error{ErrorCode::Protocol, "Trailing bytes in request"};
    }
    return request;
}

// ─────────────────────────────────────────────
// Responses
// ─────────────────────────────────────────────

std::vector<uint8_t> QueryCodec::encode_response(const QueryResponse& response, QueryOp op) {
    std::vector<uint8_t> buf;
    PayloadCodec::put_u8(buf, static_cast<uint8_t>(response.status));

    if (response.status != QueryStatus::Ok) {
        PayloadCodec::put_string(buf, response.message);
        return buf;
    }

    if (is_list(op)) {
        PayloadCodec::put_u32(buf, static_cast<uint32_t>(response.hosts.size()));
        for (const auto& record : response.hosts) {
            auto encoded = PayloadCodec::encode_record(record);
            PayloadCodec::put_u32(buf, static_cast<uint32_t>(encoded.size()));
            buf.insert(buf.end(), encoded.begin(), encoded.end());
        }
    }
    return buf;
}

Result<QueryResponse> QueryCodec::decode_response(std::span<const uint8_t> data, QueryOp op) {
    ByteReader reader(data);
    uint8_t status = 0;
    if (!reader.read_u8(status) || status > static_cast<uint8_t>(QueryStatus::Error)) {
        return Error{ErrorCode::Protocol, "Invalid response status"};
    }

    QueryResponse response;
    response.status = static_cast<QueryStatus>(status);

    if (response.status != QueryStatus::Ok) {
        if (!reader.read_string(response.message)) {
            return Error{ErrorCode::Protocol, "Truncated error response"};
        }
    } else if (is_list(op)) {
        uint32_t count = 0;
        if (!reader.read_u32(count)) {
            return Error{ErrorCode::Protocol, "Truncated host list"};
        }
        for (uint32_t i = 0; i < count; ++i) {
            uint32_t len = 0;
            std::span<const uint8_t> bytes;
            if (!reader.read_u32(len) || !reader.read_bytes(len, bytes)) {
                return Error{ErrorCode::Protocol, "Truncated host record " + std::to_string(i)};
            }
            auto record = PayloadCodec::decode_record(bytes);
            if (!record) return record.error();
            response.hosts.push_back(std::move(*record));
        }
    }

    if (!reader.at_end()) {
        return Error{ErrorCode::Protocol, "Trailing bytes in response"};
    }
    return response;
}

// ─────────────────────────────────────────────
// Stream framing
// ─────────────────────────────────────────────

Result<void> write_frame(int fd, std::span<const uint8_t> payload, uint32_t timeout_ms) {
    if (payload.size() > MAX_QUERY_FRAME) {
        return Error{ErrorCode::Protocol, "Message too large"};
    }

    std::vector<uint8_t> header;
    PayloadCodec::put_u32(header, static_cast<uint32_t>(payload.size()));
    if (!send_all(fd, header.data(), header.size(), timeout_ms)) {
        return Error{ErrorCode::Io, "Failed to send header"};
    }

    if (!payload.empty() && !send_all(fd, payload.data(), payload.size(), timeout_ms)) {
        return Error{ErrorCode::Io, "Failed to send payload"};
    }
    return Result<void>{};
}

Result<std::vector<uint8_t>> read_frame(int fd, uint32_t timeout_ms) {
    uint8_t header[4];
    if (!recv_all(fd, header, sizeof(header), timeout_ms)) {
        return Error{ErrorCode::Io, "Failed to receive header"};
    }

    uint32_t length = PayloadCodec::get_u32(header);
    if (length > MAX_QUERY_FRAME) {
        return Error{ErrorCode::Protocol,
                     "Message too large: " + std::to_string(length) + " bytes"};
    }

    std::vector<uint8_t> payload(length);
    if (length > 0 && !recv_all(fd, payload.data(), length, timeout_ms)) {
        return Error{ErrorCode::Io, "Failed to receive payload"};
    }
    return payload;
}

}  // namespace lan_beacon
