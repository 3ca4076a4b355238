/**
 * @file packet.h
 * @brief OpenPGP packet framing (RFC 4880 section 4.2), read side only
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::openpgp {

using hkp::utils::Error;
using hkp::utils::ErrorCode;
using hkp::utils::Expected;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

/**
 * @brief One OpenPGP packet: tag and raw body
 */
struct Packet {
  uint8_t tag = 0;
  std::string body;

  bool operator==(const Packet& other) const { return tag == other.tag && body == other.body; }
  bool operator!=(const Packet& other) const { return !(*this == other); }
  bool operator<(const Packet& other) const { return tag != other.tag ? tag < other.tag : body < other.body; }
};

/**
 * @brief Read one packet starting at *offset
 *
 * Accepts old-format and new-format headers with definite lengths.
 * Partial and indeterminate lengths are rejected (key exports never use
 * them). On success *offset points past the packet.
 *
 * @param data Binary packet stream
 * @param offset In/out read position
 * @return Packet or kPacketMalformed / kPacketTruncated / kPacketUnsupported
 */
Expected<Packet, Error> ReadPacket(std::string_view data, size_t* offset);

}  // namespace hkpdb::openpgp
