/**
 * @file query_server.hpp
 * @brief Unix-domain query server over the host registry, and its client.
 *
 * The server accepts one connection at a time, reads a single framed
 * request, answers it and closes the connection. The socket file is
 * created with mode 0660 so access follows the owning group.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "network/query_protocol.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

namespace lan_beacon {

class HostRegistry;
class Logger;

class QueryServer {
public:
    static constexpr int DEFAULT_BACKLOG = 16;
    /// Per-connection read/write limit. An idle client holds the serve loop at most this long.
    static constexpr uint32_t DEFAULT_IO_TIMEOUT_MS = 500;

    QueryServer(HostRegistry& registry, Logger& logger,
                uint32_t io_timeout_ms = DEFAULT_IO_TIMEOUT_MS);
    ~QueryServer();

    // Non-copyable
    QueryServer(const QueryServer&) = delete;
    QueryServer& operator=(const QueryServer&) = delete;

    /**
     * @brief Bind the socket file, replacing a stale one left by a crash.
     */
    Result<void> listen(const std::filesystem::path& socket_path, int backlog = DEFAULT_BACKLOG);

    /// Start the accept loop on a background thread.
    void serve();
    void stop();

    /// Answer one decoded request against the registry.
    QueryResponse handle(const QueryRequest& request);

    [[nodiscard]] bool is_listening() const noexcept { return server_fd_ >= 0; }
    [[nodiscard]] const std::filesystem::path& socket_path() const noexcept { return socket_path_; }

private:
    void serve_loop(std::stop_token stop);
    void handle_connection(int client_fd);

    HostRegistry& registry_;
    Logger& logger_;
    uint32_t io_timeout_ms_;
    std::filesystem::path socket_path_;
    int server_fd_ = -1;
    std::jthread serve_thread_;
};

/**
 * @brief Blocking client for the query surface, one connection per call.
 *
 * A NotFound reply surfaces as ErrorCode::NotFound.
 */
class QueryClient {
public:
    explicit QueryClient(std::filesystem::path socket_path, uint32_t timeout_ms = 5000);

    Result<std::vector<HostRecord>> list_active_hosts();
    Result<std::vector<HostRecord>> list_hosts();
    Result<void> mark_key_pushed(const MacAddress& mac);

private:
    Result<QueryResponse> call(const QueryRequest& request);

    std::filesystem::path socket_path_;
    uint32_t timeout_ms_;
};

}  // namespace lan_beacon
