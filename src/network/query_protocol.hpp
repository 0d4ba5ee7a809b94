/**
 * @file query_protocol.hpp
 * @brief Request/response messages of the local registry query surface.
 *
 * Frames on the stream: [uint32_t big-endian length][payload]. One request
 * and one response per connection.
 *
 * Request payload:  [1B opcode][args]
 *   1 ListActiveHosts
 *   2 MarkKeyPushed   [str mac]
 *   3 ListHosts
 *
 * Response payload: [1B status][body]
 *   Ok + list call    [4B count] count x ([4B len][HostRecord])
 *   Ok + mark         (empty)
 *   NotFound / Error  [str message]
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace lan_beacon {

enum class QueryOp : uint8_t {
    ListActiveHosts = 1,
    MarkKeyPushed = 2,
    ListHosts = 3
};

enum class QueryStatus : uint8_t {
    Ok = 0,
    NotFound = 1,
    Error = 2
};

struct QueryRequest {
    QueryOp op{QueryOp::ListActiveHosts};
    MacAddress mac;                   ///< MarkKeyPushed only
};

struct QueryResponse {
    QueryStatus status{QueryStatus::Ok};
    std::vector<HostRecord> hosts;
    std::string message;
};

class QueryCodec {
public:
    static std::vector<uint8_t> encode_request(const QueryRequest& request);
    static Result<QueryRequest> decode_request(std::span<const uint8_t> data);

    static std::vector<uint8_t> encode_response(const QueryResponse& response, QueryOp op);
    static Result<QueryResponse> decode_response(std::span<const uint8_t> data, QueryOp op);
};

// ── Stream framing ───────────────────────────

inline constexpr uint32_t MAX_QUERY_FRAME = 16 * 1024 * 1024;

Result<void> write_frame(int fd, std::span<const uint8_t> payload, uint32_t timeout_ms = 5000);
Result<std::vector<uint8_t>> read_frame(int fd, uint32_t timeout_ms = 10000);

}  // namespace lan_beacon
