/**
 * @file packet_test.cpp
 * @brief Unit tests for OpenPGP packet framing
 */

#include "openpgp/packet.h"

#include <gtest/gtest.h>

using namespace hkpdb::openpgp;
using hkp::utils::ErrorCode;

namespace {

constexpr uint8_t kUserIdTag = 13;
constexpr uint8_t kSignatureTag = 2;
constexpr uint8_t kPublicKeyTag = 6;

}  // namespace

TEST(PacketTest, ReadNewFormatLengths) {
  // One-octet length
  std::string one = std::string("\xCD\x05", 2) + "Alice";
  size_t offset = 0;
  auto packet = ReadPacket(one, &offset);
  ASSERT_TRUE(packet);
  EXPECT_EQ(packet->tag, kUserIdTag);
  EXPECT_EQ(packet->body, "Alice");
  EXPECT_EQ(offset, one.size());

  // Two-octet length: 1000 - 192 = 0x0328 -> 0xC3 0x28
  std::string two = std::string("\xC2\xC3\x28", 3) + std::string(1000, 's');
  offset = 0;
  packet = ReadPacket(two, &offset);
  ASSERT_TRUE(packet);
  EXPECT_EQ(packet->tag, kSignatureTag);
  EXPECT_EQ(packet->body.size(), 1000U);

  // Five-octet length
  std::string five = std::string("\xC2\xFF\x00\x00\x27\x10", 6) + std::string(10000, 'u');
  offset = 0;
  packet = ReadPacket(five, &offset);
  ASSERT_TRUE(packet);
  EXPECT_EQ(packet->body.size(), 10000U);
  EXPECT_EQ(offset, five.size());
}

TEST(PacketTest, ReadOldFormatHeaders) {
  // Old format, tag 13, one-octet length
  std::string one = std::string("\xB4\x03", 2) + "Bob";
  size_t offset = 0;
  auto packet = ReadPacket(one, &offset);
  ASSERT_TRUE(packet);
  EXPECT_EQ(packet->tag, kUserIdTag);
  EXPECT_EQ(packet->body, "Bob");

  // Old format, tag 6, two-octet length
  std::string two = std::string("\x99\x00\x02", 3) + "pk";
  offset = 0;
  packet = ReadPacket(two, &offset);
  ASSERT_TRUE(packet);
  EXPECT_EQ(packet->tag, kPublicKeyTag);
  EXPECT_EQ(packet->body, "pk");
  EXPECT_EQ(offset, 5U);
}

TEST(PacketTest, ReadSequentialPackets) {
  std::string data = std::string("\xCD\x01", 2) + "a" + std::string("\xC2\x02", 2) + "bb";
  size_t offset = 0;
  auto first = ReadPacket(data, &offset);
  auto second = ReadPacket(data, &offset);
  ASSERT_TRUE(first);
  ASSERT_TRUE(second);
  EXPECT_EQ(first->body, "a");
  EXPECT_EQ(second->body, "bb");
  EXPECT_EQ(offset, data.size());
}

TEST(PacketTest, RejectsInvalidHeaderByte) {
  std::string data("\x13\x01x", 3);
  size_t offset = 0;
  auto packet = ReadPacket(data, &offset);
  ASSERT_FALSE(packet);
  EXPECT_EQ(packet.error().code(), ErrorCode::kPacketMalformed);
  EXPECT_EQ(offset, 0U);
}

TEST(PacketTest, RejectsTruncatedBody) {
  std::string data = std::string("\xCD\x09", 2) + "trunc";
  size_t offset = 0;
  auto packet = ReadPacket(data, &offset);
  ASSERT_FALSE(packet);
  EXPECT_EQ(packet.error().code(), ErrorCode::kPacketTruncated);
}

TEST(PacketTest, RejectsPartialAndIndeterminateLengths) {
  // New format with partial body length octet (224..254)
  std::string partial("\xCD\xE1xx", 4);
  size_t offset = 0;
  auto packet = ReadPacket(partial, &offset);
  ASSERT_FALSE(packet);
  EXPECT_EQ(packet.error().code(), ErrorCode::kPacketUnsupported);

  // Old format with indeterminate length type 3
  std::string indeterminate("\xB7xx", 3);
  offset = 0;
  packet = ReadPacket(indeterminate, &offset);
  ASSERT_FALSE(packet);
  EXPECT_EQ(packet.error().code(), ErrorCode::kPacketUnsupported);
}

TEST(PacketTest, ReadAtEndIsTruncated) {
  std::string data;
  size_t offset = 0;
  auto packet = ReadPacket(data, &offset);
  ASSERT_FALSE(packet);
  EXPECT_EQ(packet.error().code(), ErrorCode::kPacketTruncated);
}

TEST(PacketTest, Ordering) {
  Packet uid{kUserIdTag, "b"};
  Packet sig{kSignatureTag, "z"};
  Packet uid2{kUserIdTag, "a"};
  EXPECT_LT(sig, uid);
  EXPECT_LT(uid2, uid);
  EXPECT_NE(uid, uid2);
}
