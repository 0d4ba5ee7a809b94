/**
 * @file test_validator.cpp
 * @brief Unit tests for the inbound datagram acceptance pipeline.
 */

#include "protocol/packet_validator.hpp"
#include "protocol/payload_codec.hpp"

#include <gtest/gtest.h>
#include <chrono>
#include <limits>

using namespace lan_beacon;

class PacketValidatorTest : public ::testing::Test {
protected:
    static constexpr int64_t NOW_S = 1718000000;
    static constexpr const char* LOCAL_MAC = "11:22:33:44:55:66";

    Authenticator auth_{"0123456789abcdef0123456789abcdef"};
    PacketValidator validator_{auth_, LOCAL_MAC, std::chrono::seconds(60)};

    static Timestamp now() {
        return Timestamp{std::chrono::seconds(NOW_S)};
    }

    static HostMetadata metadata(int64_t timestamp = NOW_S,
                                 const std::string& mac = "aa:bb:cc:dd:ee:01") {
        HostMetadata m;
        m.timestamp = timestamp;
        m.mac_address = mac;
        m.ip_address = "192.168.1.10";
        m.hostname = "host-a";
        return m;
    }

    std::vector<uint8_t> sealed(const HostMetadata& m) const {
        return *auth_.seal(PayloadCodec::encode(m));
    }
};

TEST_F(PacketValidatorTest, AcceptsFreshSignedPacket) {
    auto result = validator_.validate(sealed(metadata()), "192.168.1.10", now());
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->hostname, "host-a");
    EXPECT_EQ(result->mac_address, "aa:bb:cc:dd:ee:01");
}

TEST_F(PacketValidatorTest, RejectsSignatureOnlyDatagram) {
    std::vector<uint8_t> datagram(SIGNATURE_SIZE, 0xAB);
    auto result = validator_.validate(datagram, "192.168.1.10", now());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), DropReason::TooShort);

    EXPECT_EQ(validator_.validate({}, "192.168.1.10", now()).error(), DropReason::TooShort);
}

TEST_F(PacketValidatorTest, RejectsTamperedPayload) {
    auto datagram = sealed(metadata());
    datagram.back() ^= 0x01;
    auto result = validator_.validate(datagram, "192.168.1.10", now());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), DropReason::BadSignature);
}

TEST_F(PacketValidatorTest, RejectsForeignSecret) {
    Authenticator other("a-different-secret");
    auto datagram = *other.seal(PayloadCodec::encode(metadata()));
    EXPECT_EQ(validator_.validate(datagram, "192.168.1.10", now()).error(),
              DropReason::BadSignature);
}

TEST_F(PacketValidatorTest, RejectsUndecodablePayload) {
    std::vector<uint8_t> garbage{0x01, 0x02, 0x03};
    auto datagram = *auth_.seal(garbage);
    EXPECT_EQ(validator_.validate(datagram, "192.168.1.10", now()).error(),
              DropReason::Malformed);
}

TEST_F(PacketValidatorTest, ToleranceBoundaryIsInclusive) {
    EXPECT_TRUE(validator_.validate(sealed(metadata(NOW_S - 60)), "s", now()).has_value());
    EXPECT_TRUE(validator_.validate(sealed(metadata(NOW_S + 60)), "s", now()).has_value());

    EXPECT_EQ(validator_.validate(sealed(metadata(NOW_S - 61)), "s", now()).error(),
              DropReason::StaleTimestamp);
    EXPECT_EQ(validator_.validate(sealed(metadata(NOW_S + 61)), "s", now()).error(),
              DropReason::StaleTimestamp);
}

TEST_F(PacketValidatorTest, RejectsExtremeTimestamps) {
    constexpr auto lowest = std::numeric_limits<int64_t>::min();
    constexpr auto highest = std::numeric_limits<int64_t>::max();

    EXPECT_EQ(validator_.validate(sealed(metadata(lowest)), "s", now()).error(),
              DropReason::StaleTimestamp);
    EXPECT_EQ(validator_.validate(sealed(metadata(highest)), "s", now()).error(),
              DropReason::StaleTimestamp);
    EXPECT_EQ(validator_.validate(sealed(metadata(0)), "s", now()).error(),
              DropReason::StaleTimestamp);
}

TEST_F(PacketValidatorTest, RejectsOwnAnnounce) {
    auto result = validator_.validate(sealed(metadata(NOW_S, LOCAL_MAC)), "127.0.0.1", now());
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), DropReason::SelfOrigin);
}

TEST_F(PacketValidatorTest, SelfOriginIgnoresMacCase) {
    PacketValidator upper(auth_, "11:22:33:44:55:AA");
    auto mixed = upper.validate(sealed(metadata(NOW_S, "11:22:33:44:55:aa")), "s", now());
    ASSERT_FALSE(mixed.has_value());
    EXPECT_EQ(mixed.error(), DropReason::SelfOrigin);
}

TEST_F(PacketValidatorTest, SignatureCheckedBeforeTimestamp) {
    auto datagram = sealed(metadata(NOW_S - 3600));
    datagram[0] ^= 0xFF;
    EXPECT_EQ(validator_.validate(datagram, "s", now()).error(), DropReason::BadSignature);
}
