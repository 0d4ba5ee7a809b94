/**
 * @file query_server.cpp
 * @brief QueryServer and QueryClient over AF_UNIX stream sockets.
 */

#include "network/query_server.hpp"

#include "core/logger.hpp"
#include "registry/host_registry.hpp"

#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace lan_beacon {

namespace {

std::string errno_text() {
    return std::strerror(errno);
}

Result<sockaddr_un> make_address(const std::filesystem::path& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    const auto& native = path.native();
    if (native.empty() || native.size() >= sizeof(addr.sun_path)) {
        return Error{ErrorCode::InvalidArgument, "Invalid socket path: " + path.string()};
    }
    std::memcpy(addr.sun_path, native.c_str(), native.size() + 1);
    return addr;
}

/// Closes the wrapped descriptor on scope exit.
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) ::close(fd_); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
    [[nodiscard]] int get() const noexcept { return fd_; }

private:
    int fd_;
};

}  // anonymous namespace

// ─────────────────────────────────────────────
// QueryServer
// ─────────────────────────────────────────────

QueryServer::QueryServer(HostRegistry& registry, Logger& logger, uint32_t io_timeout_ms)
    : registry_(registry), logger_(logger), io_timeout_ms_(io_timeout_ms) {}

QueryServer::~QueryServer() {
    stop();
}

Result<void> QueryServer::listen(const std::filesystem::path& socket_path, int backlog) {
    if (server_fd_ >= 0) {
        return Error{ErrorCode::InvalidArgument, "Already listening"};
    }

    auto addr = make_address(socket_path);
    if (!addr) return addr.error();

    std::error_code ec;
    if (socket_path.has_parent_path()) {
        std::filesystem::create_directories(socket_path.parent_path(), ec);
    }
    std::filesystem::remove(socket_path, ec);

    server_fd_ = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        return Error{ErrorCode::Io, "Failed to create query socket: " + errno_text()};
    }

    if (::bind(server_fd_, reinterpret_cast<const sockaddr*>(&*addr), sizeof(sockaddr_un)) < 0) {
        auto message = "Bind " + socket_path.string() + " failed: " + errno_text();
        ::close(server_fd_);
        server_fd_ = -1;
        return Error{ErrorCode::Io, message};
    }

    if (::chmod(socket_path.c_str(), 0660) < 0) {
        logger_.warn("chmod " + socket_path.string() + " failed: " + errno_text());
    }

    if (::listen(server_fd_, backlog) < 0) {
        auto message = "Listen on " + socket_path.string() + " failed: " + errno_text();
        ::close(server_fd_);
        server_fd_ = -1;
        std::filesystem::remove(socket_path, ec);
        return Error{ErrorCode::Io, message};
    }

    socket_path_ = socket_path;
    return Result<void>{};
}

void QueryServer::serve() {
    if (server_fd_ < 0 || serve_thread_.joinable()) return;

    serve_thread_ = std::jthread([this](std::stop_token stop) {
        serve_loop(stop);
    });
    logger_.info("Query server listening on " + socket_path_.string());
}

void QueryServer::stop() {
    if (serve_thread_.joinable()) {
        serve_thread_.request_stop();
        serve_thread_.join();
    }
    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        std::error_code ec;
        std::filesystem::remove(socket_path_, ec);
    }
}

void QueryServer::serve_loop(std::stop_token stop) {
    while (!stop.stop_requested()) {
        pollfd pfd{};
        pfd.fd = server_fd_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, 100);  // 100ms timeout for stop check
        if (ready <= 0) continue;

        int client_fd = ::accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client_fd < 0) continue;

        handle_connection(client_fd);
    }
}

void QueryServer::handle_connection(int client_fd) {
    FdGuard guard(client_fd);

    auto frame = read_frame(client_fd, io_timeout_ms_);
    if (!frame) {
        logger_.debug("Query connection dropped: " + frame.error().message);
        return;
    }

    QueryResponse response;
    QueryOp op = QueryOp::ListActiveHosts;

    auto request = QueryCodec::decode_request(*frame);
    if (!request) {
        response.status = QueryStatus::Error;
        response.message = request.error().message;
    } else {
        op = request->op;
        response = handle(*request);
    }

    auto payload = QueryCodec::encode_response(response, op);
    if (auto sent = write_frame(client_fd, payload, io_timeout_ms_); !sent) {
        logger_.debug("Query response not delivered: " + sent.error().message);
    }
    ::shutdown(client_fd, SHUT_RDWR);
}

QueryResponse QueryServer::handle(const QueryRequest& request) {
    QueryResponse response;

    auto fail = [&](const Error& error) {
        response.status = error.is(ErrorCode::NotFound) ? QueryStatus::NotFound
                                                        : QueryStatus::Error;
        response.message = error.message;
    };

    switch (request.op) {
        case QueryOp::ListActiveHosts: {
            auto hosts = registry_.get_active();
            if (hosts) response.hosts = std::move(*hosts);
            else fail(hosts.error());
            break;
        }
        case QueryOp::ListHosts: {
            auto hosts = registry_.get_all();
            if (hosts) response.hosts = std::move(*hosts);
            else fail(hosts.error());
            break;
        }
        case QueryOp::MarkKeyPushed: {
            auto marked = registry_.mark_key_pushed(request.mac);
            if (!marked) {
                fail(marked.error());
            } else {
                logger_.info("SSH key marked as pushed for " + request.mac);
            }
            break;
        }
    }

    if (response.status == QueryStatus::Error) {
        logger_.error("Query failed: " + response.message);
    }
    return response;
}

// ─────────────────────────────────────────────
// QueryClient
// ─────────────────────────────────────────────

QueryClient::QueryClient(std::filesystem::path socket_path, uint32_t timeout_ms)
    : socket_path_(std::move(socket_path)), timeout_ms_(timeout_ms) {}

Result<QueryResponse> QueryClient::call(const QueryRequest& request) {
    auto addr = make_address(socket_path_);
    if (!addr) return addr.error();

    FdGuard fd(::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0));
    if (fd.get() < 0) {
        return Error{ErrorCode::Io, "Failed to create socket: " + errno_text()};
    }

    if (::connect(fd.get(), reinterpret_cast<const sockaddr*>(&*addr), sizeof(sockaddr_un)) < 0) {
        return Error{ErrorCode::Io, "Cannot connect to " + socket_path_.string() + ": "
                                    + errno_text()};
    }

    auto payload = QueryCodec::encode_request(request);
    if (auto sent = write_frame(fd.get(), payload, timeout_ms_); !sent) {
        return sent.error();
    }

    auto frame = read_frame(fd.get(), timeout_ms_);
    if (!frame) return frame.error();

    auto response = QueryCodec::decode_response(*frame, request.op);
    if (!response) return response.error();

    switch (response->status) {
        case QueryStatus::Ok:
            return response;
        case QueryStatus::NotFound:
            return Error{ErrorCode::NotFound, response->message};
        case QueryStatus::Error:
            break;
    }
    return Error{ErrorCode::Generic, response->message};
}

Result<std::vector<HostRecord>> QueryClient::list_active_hosts() {
    auto response = call(QueryRequest{QueryOp::ListActiveHosts, {}});
    if (!response) return response.error();
    return std::move(response->hosts);
}

Result<std::vector<HostRecord>> QueryClient::list_hosts() {
    auto response = call(QueryRequest{QueryOp::ListHosts, {}});
    if (!response) return response.error();
    return std::move(response->hosts);
}

Result<void> QueryClient::mark_key_pushed(const MacAddress& mac) {
    auto response = call(QueryRequest{QueryOp::MarkKeyPushed, mac});
    if (!response) return response.error();
    return Result<void>{};
}

}  // namespace lan_beacon
