#include <gtest/gtest.h>
#include "kklink/packet.hpp"
#include <cstdint>

TEST(PacketTest, LengthPrefixIsBigEndian) {
    auto prefix = KKLink::encode_length_prefix(0x1234);

    ASSERT_EQ(prefix[0], 0x12);
    ASSERT_EQ(prefix[1], 0x34);
    ASSERT_EQ(KKLink::decode_length_prefix(prefix.data()), 0x1234);
}

TEST(PacketTest, LengthPrefixBounds) {
    auto max_body = KKLink::encode_length_prefix(static_cast<uint16_t>(KKLink::NOISE_PLAINTEXT_MAX_SIZE + KKLink::MAC_SIZE));
    ASSERT_EQ(KKLink::decode_length_prefix(max_body.data()), 65517);

    auto empty_body = KKLink::encode_length_prefix(static_cast<uint16_t>(KKLink::MAC_SIZE));
    ASSERT_EQ(empty_body[0], 0x00);
    ASSERT_EQ(empty_body[1], 0x10);
}
