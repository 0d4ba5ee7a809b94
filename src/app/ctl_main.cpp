/**
 * @file ctl_main.cpp
 * @brief lanbeacon_ctl: command-line client for the registry query socket.
 */

#include "core/types.hpp"
#include "network/query_server.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace lan_beacon;

namespace {

constexpr const char* DEFAULT_SOCKET = "/run/lanbeacon/server.sock";

void print_usage() {
    std::cout << "Usage: lanbeacon_ctl [--socket PATH] COMMAND\n"
              << "Commands:\n"
              << "  list              Show active hosts\n"
              << "  list-all          Show every known host\n"
              << "  mark-pushed MAC   Record that an SSH key was pushed to MAC\n"
              << "Options:\n"
              << "  --socket PATH     Query socket (default: " << DEFAULT_SOCKET << ")\n"
              << "  --help, -h        Show this help message\n";
}

std::string format_time(Timestamp ts) {
    auto t = std::chrono::system_clock::to_time_t(ts);
    std::tm local{};
    ::localtime_r(&t, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

void print_hosts(const std::vector<HostRecord>& hosts) {
    if (hosts.empty()) {
        std::cout << "No hosts found.\n";
        return;
    }

    std::cout << std::left
              << std::setw(19) << "MAC"
              << std::setw(17) << "IP"
              << std::setw(22) << "HOSTNAME"
              << std::setw(9) << "STATE"
              << std::setw(8) << "PKTS"
              << std::setw(5) << "KEY"
              << "LAST SEEN\n";

    for (const auto& host : hosts) {
        const auto& m = host.metadata;
        std::cout << std::left
                  << std::setw(19) << m.mac_address
                  << std::setw(17) << m.ip_address
                  << std::setw(22) << m.hostname
                  << std::setw(9) << (host.active ? "active" : "inactive")
                  << std::setw(8) << host.packet_count
                  << std::setw(5) << (host.ssh_key_pushed ? "yes" : "no")
                  << format_time(host.last_seen) << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::filesystem::path socket_path = DEFAULT_SOCKET;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--socket" && i + 1 < argc) {
            socket_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else {
            positional.push_back(std::move(arg));
        }
    }

    if (positional.empty()) {
        print_usage();
        return 1;
    }

    QueryClient client(socket_path);
    const auto& command = positional[0];

    if (command == "list" || command == "list-all") {
        auto hosts = command == "list" ? client.list_active_hosts() : client.list_hosts();
        if (!hosts) {
            std::cerr << "Error: " << hosts.error().message << "\n";
            return 1;
        }
        print_hosts(*hosts);
        return 0;
    }

    if (command == "mark-pushed") {
        if (positional.size() != 2) {
            std::cerr << "Usage: lanbeacon_ctl mark-pushed MAC\n";
            return 1;
        }
        auto marked = client.mark_key_pushed(positional[1]);
        if (!marked) {
            std::cerr << "Error: " << marked.error().message << "\n";
            return marked.error().is(ErrorCode::NotFound) ? 2 : 1;
        }
        std::cout << "Marked " << positional[1] << " as key pushed.\n";
        return 0;
    }

    std::cerr << "Unknown command: " << command << "\n";
    print_usage();
    return 1;
}
