/**
 * @file test_metadata_source.cpp
 * @brief Unit tests for local metadata collection and its parsers.
 */

#include "sysinfo/metadata_source.hpp"

#include <gtest/gtest.h>
#include <chrono>

using namespace lan_beacon;

// ═══════════════════════════════════════════════
// Parsers
// ═══════════════════════════════════════════════

TEST(MetadataParseTest, OsPrettyNameQuoted) {
    constexpr std::string_view os_release =
        "NAME=\"Debian GNU/Linux\"\n"
        "PRETTY_NAME=\"Debian GNU/Linux 12 (bookworm)\"\n"
        "VERSION_ID=\"12\"\n";
    EXPECT_EQ(parse_os_pretty_name(os_release), "Debian GNU/Linux 12 (bookworm)");
}

TEST(MetadataParseTest, OsPrettyNameUnquotedOrMissing) {
    EXPECT_EQ(parse_os_pretty_name("PRETTY_NAME=Alpine\n"), "Alpine");
    EXPECT_EQ(parse_os_pretty_name("NAME=Foo\n"), "");
    EXPECT_EQ(parse_os_pretty_name(""), "");
}

TEST(MetadataParseTest, CpuModelX86) {
    constexpr std::string_view cpuinfo =
        "processor\t: 0\n"
        "vendor_id\t: GenuineIntel\n"
        "model\t\t: 142\n"
        "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n"
        "processor\t: 1\n"
        "model name\t: Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz\n";
    EXPECT_EQ(parse_cpu_model(cpuinfo), "Intel(R) Core(TM) i5-8250U CPU @ 1.60GHz");
}

TEST(MetadataParseTest, CpuModelArmFallback) {
    constexpr std::string_view cpuinfo =
        "processor\t: 0\n"
        "BogoMIPS\t: 108.00\n"
        "Model\t\t: Raspberry Pi 4 Model B Rev 1.4\n";
    EXPECT_EQ(parse_cpu_model(cpuinfo), "Raspberry Pi 4 Model B Rev 1.4");
}

TEST(MetadataParseTest, MemoryRoundedToTwoDecimals) {
    EXPECT_DOUBLE_EQ(parse_memory_gb("MemTotal:       16273472 kB\nMemFree: 1 kB\n"), 15.52);
    EXPECT_DOUBLE_EQ(parse_memory_gb("MemTotal:        1048576 kB\n"), 1.0);
    EXPECT_DOUBLE_EQ(parse_memory_gb("MemFree: 1 kB\n"), 0.0);
}

TEST(MetadataParseTest, CountsDistinctDeviceMounts) {
    constexpr std::string_view mounts =
        "sysfs /sys sysfs rw 0 0\n"
        "/dev/nvme0n1p2 / ext4 rw 0 0\n"
        "/dev/nvme0n1p1 /boot/efi vfat rw 0 0\n"
        "/dev/nvme0n1p2 /var/lib/docker ext4 rw 0 0\n"
        "/dev/loop0 /snap/core/1 squashfs ro 0 0\n"
        "tmpfs /run tmpfs rw 0 0\n";
    EXPECT_EQ(count_mounted_disks(mounts), 2u);
    EXPECT_EQ(count_mounted_disks(""), 0u);
}

// ═══════════════════════════════════════════════
// StaticMetadataSource
// ═══════════════════════════════════════════════

TEST(StaticMetadataSourceTest, StampsCurrentTime) {
    HostMetadata snapshot;
    snapshot.mac_address = "aa:bb:cc:dd:ee:01";
    snapshot.hostname = "host-a";
    snapshot.timestamp = 1;

    StaticMetadataSource source(snapshot);
    auto before = to_unix_seconds(std::chrono::system_clock::now());
    auto read = source.read();
    auto after = to_unix_seconds(std::chrono::system_clock::now());

    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->hostname, "host-a");
    EXPECT_GE(read->timestamp, before);
    EXPECT_LE(read->timestamp, after);
}

TEST(StaticMetadataSourceTest, FailureAndReplacement) {
    HostMetadata snapshot;
    snapshot.hostname = "old";
    StaticMetadataSource source(snapshot);

    source.set_failure("interface down");
    auto failed = source.read();
    ASSERT_FALSE(failed.has_value());
    EXPECT_TRUE(failed.error().is(ErrorCode::Io));

    source.set_failure("");
    snapshot.hostname = "new";
    source.set_snapshot(snapshot);
    auto read = source.read();
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(read->hostname, "new");
}

// ═══════════════════════════════════════════════
// LinuxMetadataSource
// ═══════════════════════════════════════════════

TEST(LinuxMetadataSourceTest, InvalidRangeIsError) {
    LinuxMetadataSource source("not-a-cidr");
    EXPECT_FALSE(source.read().has_value());
}

TEST(LinuxMetadataSourceTest, UnmatchedRangeIsNotFound) {
    // TEST-NET-2, never assigned to a local interface
    LinuxMetadataSource source("198.51.100.0/24");
    auto read = source.read();
    ASSERT_FALSE(read.has_value());
    EXPECT_TRUE(read.error().is(ErrorCode::NotFound));
}

TEST(LinuxMetadataSourceTest, CollectsHostFacts) {
    LinuxMetadataSource source;
    auto read = source.read();
    if (!read) GTEST_SKIP() << "No usable interface: " << read.error().message;

    EXPECT_FALSE(read->mac_address.empty());
    EXPECT_FALSE(read->ip_address.empty());
    EXPECT_FALSE(read->os.kernel.empty());
    EXPECT_GT(read->timestamp, 0);
}
