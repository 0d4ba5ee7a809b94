/**
 * @file test_discovery_pipeline.cpp
 * @brief Integration tests exercising announce, registry, expiry and query end to end.
 */

#include "core/logger.hpp"
#include "network/discovery_engine.hpp"
#include "network/query_server.hpp"
#include "protocol/authenticator.hpp"
#include "protocol/payload_codec.hpp"
#include "registry/expiry_sweeper.hpp"
#include "registry/host_registry.hpp"
#include "registry/hosts_file.hpp"
#include "sysinfo/metadata_source.hpp"
#include "telemetry/json_sink.hpp"
#include "telemetry/metrics_collector.hpp"

#include <gtest/gtest.h>
#include <arpa/inet.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>
#include <thread>
#include <unistd.h>

using namespace lan_beacon;
using namespace std::chrono_literals;

namespace {

constexpr const char* SECRET = "0123456789abcdef0123456789abcdef";
constexpr const char* MAC_A = "aa:bb:cc:dd:ee:01";

HostMetadata host_a() {
    HostMetadata m;
    m.mac_address = MAC_A;
    m.ip_address = "192.168.1.10";
    m.hostname = "host-a";
    m.os = OsInfo{"Debian GNU/Linux 12", "6.1.0-18-amd64", "x86_64"};
    m.hardware = HardwareInfo{"AMD EPYC 7302", 16, 62.8, 3};
    return m;
}

bool send_to_loopback(uint16_t port, const std::vector<uint8_t>& bytes) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd < 0) return false;
    sockaddr_in dest{};
    dest.sin_family = AF_INET;
    dest.sin_port = htons(port);
    dest.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    auto sent = ::sendto(fd, bytes.data(), bytes.size(), 0,
                         reinterpret_cast<const sockaddr*>(&dest), sizeof(dest));
    ::close(fd);
    return sent == static_cast<ssize_t>(bytes.size());
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

}  // namespace

// ═══════════════════════════════════════════════
// Announce → Registry → Expiry
// ═══════════════════════════════════════════════

class DiscoveryPipelineTest : public ::testing::Test {
protected:
    std::filesystem::path temp_dir_;
    std::shared_ptr<std::atomic<int64_t>> now_ms_ = std::make_shared<std::atomic<int64_t>>(
        to_unix_millis(std::chrono::system_clock::now()));
    Logger logger_{std::make_unique<NullSink>()};
    DiscoveryMetrics metrics_;
    std::unique_ptr<HostRegistry> registry_;
    std::unique_ptr<DiscoveryEngine> listener_;
    StaticMetadataSource source_{host_a()};

    void SetUp() override {
        temp_dir_ = std::filesystem::temp_directory_path()
                    / ("lb_test_pipeline_" + std::to_string(::getpid()));
        std::filesystem::remove_all(temp_dir_);
        std::filesystem::create_directories(temp_dir_);

        open_registry();

        EngineOptions options;
        options.role = Role::Listen;
        options.port = 0;
        options.target_mode = TargetMode::Unicast;
        options.local_mac = "aa:bb:cc:dd:ee:ff";

        listener_ = std::make_unique<DiscoveryEngine>(
            options, Authenticator(SECRET),
            [] { return make_error<HostMetadata>(ErrorCode::Generic, "listen only"); },
            *registry_, logger_, &metrics_);
        auto started = listener_->start();
        ASSERT_TRUE(started.has_value()) << started.error().message;
    }

    void TearDown() override {
        listener_.reset();
        registry_.reset();
        std::filesystem::remove_all(temp_dir_);
    }

    void open_registry() {
        auto now = now_ms_;
        auto opened = HostRegistry::open(temp_dir_ / "registry.db", &logger_,
                                         [now] { return from_unix_millis(now->load()); });
        ASSERT_TRUE(opened.has_value()) << opened.error().message;
        registry_ = std::move(*opened);
    }

    Result<void> announce_once(std::string_view secret = SECRET) {
        EngineOptions options;
        options.role = Role::Announce;
        options.target_mode = TargetMode::Unicast;
        options.unicast_targets = {"127.0.0.1:" + std::to_string(listener_->bound_port())};
        options.announce_interval = 1h;
        DiscoveryEngine announcer(options, Authenticator(secret),
                                  [this] { return source_.read(); }, *registry_, logger_);
        // start() sends the first announce immediately
        return announcer.start();
    }

    bool wait_accepted(uint64_t count) {
        auto deadline = std::chrono::steady_clock::now() + 5s;
        while (metrics_.summary().accepted < count) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            std::this_thread::sleep_for(10ms);
        }
        return true;
    }

    void advance(std::chrono::milliseconds delta) {
        now_ms_->fetch_add(delta.count());
    }
};

TEST_F(DiscoveryPipelineTest, AnnouncedHostBecomesActiveThenExpires) {
    ASSERT_TRUE(announce_once().has_value());
    ASSERT_TRUE(wait_accepted(1));

    auto active = registry_->get_active();
    ASSERT_TRUE(active.has_value()) << active.error().message;
    ASSERT_EQ(active->size(), 1u);
    const auto discovered = active->front();
    EXPECT_EQ(discovered.metadata.hostname, "host-a");
    EXPECT_EQ(discovered.metadata.ip_address, "192.168.1.10");
    EXPECT_EQ(discovered.metadata.hardware.cpu_cores, 16u);
    EXPECT_EQ(discovered.packet_count, 1u);
    EXPECT_FALSE(discovered.ssh_key_pushed);

    ExpirySweeper sweeper(*registry_, logger_, 30s, 90s);
    advance(60s);
    EXPECT_EQ(sweeper.sweep_once(), 0u);

    advance(31s);
    EXPECT_EQ(sweeper.sweep_once(), 1u);

    active = registry_->get_active();
    ASSERT_TRUE(active.has_value());
    EXPECT_TRUE(active->empty());

    auto found = registry_->find(MAC_A);
    ASSERT_TRUE(found.has_value() && found->has_value());
    EXPECT_FALSE((*found)->active);
    EXPECT_EQ((*found)->packet_count, 1u);
    EXPECT_EQ((*found)->first_seen, discovered.first_seen);
    EXPECT_EQ((*found)->metadata, discovered.metadata);
}

TEST_F(DiscoveryPipelineTest, ExpiredHostReturnsOnNextAnnounce) {
    ASSERT_TRUE(announce_once().has_value());
    ASSERT_TRUE(wait_accepted(1));

    advance(120s);
    ExpirySweeper sweeper(*registry_, logger_, 30s, 90s);
    ASSERT_EQ(sweeper.sweep_once(), 1u);

    ASSERT_TRUE(announce_once().has_value());
    ASSERT_TRUE(wait_accepted(2));

    auto found = registry_->find(MAC_A);
    ASSERT_TRUE(found.has_value() && found->has_value());
    EXPECT_TRUE((*found)->active);
    EXPECT_EQ((*found)->packet_count, 2u);
    EXPECT_LT((*found)->first_seen, (*found)->last_seen);
}

TEST_F(DiscoveryPipelineTest, TamperedPacketNeverReachesRegistry) {
    auto metadata = host_a();
    metadata.timestamp = to_unix_seconds(std::chrono::system_clock::now());
    auto packet = *Authenticator(SECRET).seal(PayloadCodec::encode(metadata));
    packet[SIGNATURE_SIZE + 12] ^= 0x01;

    ASSERT_TRUE(send_to_loopback(listener_->bound_port(), packet));

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (metrics_.summary().drops_for(DropReason::BadSignature) == 0
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(metrics_.summary().drops_for(DropReason::BadSignature), 1u);
    EXPECT_EQ(metrics_.summary().accepted, 0u);
    EXPECT_EQ(*registry_->size(), 0u);
}

TEST_F(DiscoveryPipelineTest, ForeignNetworkSecretIgnored) {
    ASSERT_TRUE(announce_once("another-cluster-secret").has_value());

    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (metrics_.summary().total_drops() == 0
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_EQ(metrics_.summary().drops_for(DropReason::BadSignature), 1u);
    EXPECT_EQ(*registry_->size(), 0u);
}

// ═══════════════════════════════════════════════
// Persistence and Outer Surfaces
// ═══════════════════════════════════════════════

TEST_F(DiscoveryPipelineTest, RegistrySurvivesRestart) {
    ASSERT_TRUE(announce_once().has_value());
    ASSERT_TRUE(wait_accepted(1));

    listener_.reset();
    registry_.reset();
    open_registry();

    auto all = registry_->get_all();
    ASSERT_TRUE(all.has_value()) << all.error().message;
    ASSERT_EQ(all->size(), 1u);
    EXPECT_EQ(all->front().metadata.hostname, "host-a");
    EXPECT_EQ(all->front().packet_count, 1u);
}

TEST_F(DiscoveryPipelineTest, QueryAndHostsFileReflectDiscovery) {
    ASSERT_TRUE(announce_once().has_value());
    ASSERT_TRUE(wait_accepted(1));

    QueryServer server(*registry_, logger_);
    auto socket_path = temp_dir_ / "lanbeacon.sock";
    ASSERT_TRUE(server.listen(socket_path).has_value());
    server.serve();

    QueryClient client(socket_path);
    auto hosts = client.list_active_hosts();
    ASSERT_TRUE(hosts.has_value()) << hosts.error().message;
    ASSERT_EQ(hosts->size(), 1u);
    EXPECT_EQ(hosts->front().metadata.mac_address, MAC_A);

    ASSERT_TRUE(client.mark_key_pushed(MAC_A).has_value());
    auto found = registry_->find(MAC_A);
    ASSERT_TRUE(found.has_value() && found->has_value());
    EXPECT_TRUE((*found)->ssh_key_pushed);

    auto hosts_path = temp_dir_ / "hosts";
    {
        std::ofstream out(hosts_path);
        out << "127.0.0.1       localhost\n";
    }
    HostsFileSync sync(hosts_path);
    auto all = registry_->get_all();
    ASSERT_TRUE(all.has_value());
    ASSERT_TRUE(sync.sync(*all).has_value());

    auto content = read_file(hosts_path);
    EXPECT_TRUE(content.starts_with("127.0.0.1       localhost\n"));
    EXPECT_NE(content.find(HOSTS_BEGIN_MARKER), std::string::npos);
    EXPECT_NE(content.find("192.168.1.10     host-a"), std::string::npos);
    EXPECT_NE(content.find(HOSTS_END_MARKER), std::string::npos);
}
