#include <gtest/gtest.h>
#include "protocol/serializer.hpp"
#include <algorithm>
#include <vector>

namespace {

std::vector<uint8_t> make_payload(size_t len) {
    std::vector<uint8_t> payload(len);
    for (size_t i = 0; i < len; ++i) {
        // Never zero so padding is distinguishable
        payload[i] = static_cast<uint8_t>(i % 251 + 1);
    }
    return payload;
}

} // namespace

TEST(SerializerTest, ChunksIntoOrderedPackets) {
    for (size_t len : {1u, 1023u, 1025u, 4096u, 5000u}) {
        auto packets = protocol::serialize(make_payload(len));
        size_t count = (len + 1023) / 1024;
        ASSERT_EQ(packets.size(), count) << "len " << len;
        for (size_t i = 0; i < packets.size(); ++i) {
            EXPECT_EQ(packets[i].get_size(), count);
            EXPECT_EQ(packets[i].get_sequence(), i);
        }
    }
}

TEST(SerializerTest, ReassemblyKeepsZeroPadding) {
    for (size_t len : {1u, 100u, 1024u, 3000u}) {
        auto payload = make_payload(len);
        auto buffer = protocol::deserialize(protocol::serialize(payload));

        size_t padded = (len + 1023) / 1024 * 1024;
        ASSERT_EQ(buffer.size(), padded) << "len " << len;
        EXPECT_TRUE(std::equal(payload.begin(), payload.end(), buffer.begin()));
        EXPECT_TRUE(std::all_of(buffer.begin() + len, buffer.end(), [](uint8_t b) { return b == 0; }));
    }
}

TEST(SerializerTest, ThreePacketMessage) {
    auto payload = make_payload(2500);
    auto packets = protocol::serialize(payload);

    ASSERT_EQ(packets.size(), 3u);
    for (uint32_t i = 0; i < 3; ++i) {
        EXPECT_EQ(packets[i].get_sequence(), i);
        EXPECT_EQ(packets[i].get_size(), 3u);
    }

    auto buffer = protocol::deserialize(packets);
    ASSERT_EQ(buffer.size(), 3072u);
    EXPECT_TRUE(std::equal(payload.begin(), payload.end(), buffer.begin()));
    EXPECT_EQ(std::count(buffer.begin() + 2500, buffer.end(), 0), 572);
}

TEST(SerializerTest, ExactlyOnePacketNeedsNoPadding) {
    auto payload = make_payload(1024);
    auto packets = protocol::serialize(payload);

    ASSERT_EQ(packets.size(), 1u);
    EXPECT_EQ(packets[0].get_size(), 1u);
    EXPECT_EQ(packets[0].get_sequence(), 0u);
    EXPECT_TRUE(std::equal(payload.begin(), payload.end(), packets[0].data().begin()));
    EXPECT_EQ(protocol::deserialize(packets), payload);
}

TEST(SerializerTest, EmptyPayloadYieldsNoPackets) {
    EXPECT_TRUE(protocol::serialize(std::vector<uint8_t>{}).empty());
    EXPECT_TRUE(protocol::deserialize({}).empty());
}

TEST(SerializerTest, StringOverloadMatchesBytes) {
    std::string text(1500, 'x');
    auto from_text = protocol::serialize(text);
    auto from_bytes = protocol::serialize(std::vector<uint8_t>(text.begin(), text.end()));
    EXPECT_EQ(from_text, from_bytes);
}

TEST(SerializerTest, DeserializeKeepsCallerOrder) {
    auto packets = protocol::serialize(make_payload(2048));
    std::swap(packets[0], packets[1]);
    auto buffer = protocol::deserialize(packets);
    EXPECT_TRUE(std::equal(packets[0].data().begin(), packets[0].data().end(), buffer.begin()));
}
