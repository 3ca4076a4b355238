/**
 * @file packet.cpp
 * @brief OpenPGP packet framing implementation
 */

#include "openpgp/packet.h"

namespace hkpdb::openpgp {

namespace {

constexpr uint8_t kPacketMarkerBit = 0x80;
constexpr uint8_t kNewFormatBit = 0x40;
constexpr uint8_t kNewFormatTagMask = 0x3F;
constexpr uint8_t kOldFormatTagMask = 0x0F;
constexpr uint8_t kOldFormatLengthTypeMask = 0x03;

// New-format length octet boundaries
constexpr uint32_t kOneOctetMax = 192;
constexpr uint32_t kTwoOctetLimit = 224;
constexpr uint8_t kFiveOctetMarker = 255;

uint32_t ReadBigEndian(std::string_view data, size_t pos, size_t width) {
  uint32_t value = 0;
  for (size_t i = 0; i < width; ++i) {
    value = (value << 8) | static_cast<uint8_t>(data[pos + i]);
  }
  return value;
}

Error Truncated(size_t offset) {
  return MakeError(ErrorCode::kPacketTruncated, "Packet truncated", "offset " + std::to_string(offset));
}

}  // namespace

Expected<Packet, Error> ReadPacket(std::string_view data, size_t* offset) {
  size_t pos = *offset;
  const size_t start = pos;
  if (pos >= data.size()) {
    return MakeUnexpected(Truncated(start));
  }

  const auto header = static_cast<uint8_t>(data[pos++]);
  if ((header & kPacketMarkerBit) == 0) {
    return MakeUnexpected(
        MakeError(ErrorCode::kPacketMalformed, "Invalid packet header byte", "offset " + std::to_string(start)));
  }

  Packet packet;
  uint32_t length = 0;

  if ((header & kNewFormatBit) != 0) {
    packet.tag = header & kNewFormatTagMask;
    if (pos >= data.size()) {
      return MakeUnexpected(Truncated(start));
    }
    const auto first = static_cast<uint8_t>(data[pos++]);
    if (first < kOneOctetMax) {
      length = first;
    } else if (first < kTwoOctetLimit) {
      if (pos >= data.size()) {
        return MakeUnexpected(Truncated(start));
      }
      length = ((first - kOneOctetMax) << 8) + static_cast<uint8_t>(data[pos++]) + kOneOctetMax;
    } else if (first == kFiveOctetMarker) {
      if (pos + 4 > data.size()) {
        return MakeUnexpected(Truncated(start));
      }
      length = ReadBigEndian(data, pos, 4);
      pos += 4;
    } else {
      return MakeUnexpected(MakeError(ErrorCode::kPacketUnsupported, "Partial body length not supported",
                                      "offset " + std::to_string(start)));
    }
  } else {
    packet.tag = (header >> 2) & kOldFormatTagMask;
    const uint8_t length_type = header & kOldFormatLengthTypeMask;
    if (length_type == kOldFormatLengthTypeMask) {
      return MakeUnexpected(MakeError(ErrorCode::kPacketUnsupported, "Indeterminate packet length not supported",
                                      "offset " + std::to_string(start)));
    }
    const size_t width = size_t{1} << length_type;  // 1, 2 or 4 octets
    if (pos + width > data.size()) {
      return MakeUnexpected(Truncated(start));
    }
    length = ReadBigEndian(data, pos, width);
    pos += width;
  }

  if (data.size() - pos < length) {
    return MakeUnexpected(Truncated(start));
  }

  packet.body.assign(data.substr(pos, length));
  *offset = pos + length;
  return packet;
}

}  // namespace hkpdb::openpgp
