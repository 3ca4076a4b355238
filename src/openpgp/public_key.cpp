/**
 * @file public_key.cpp
 * @brief OpenPGP transferable public key implementation
 */

#include "openpgp/public_key.h"

#include <algorithm>

#include "openpgp/hash.h"
#include "openpgp/packet.h"
#include "openpgp/rnp_handle.h"
#include "utils/string_utils.h"

namespace hkpdb::openpgp {

namespace {

void AppendBigEndian32(std::string& out, uint32_t value) {
  out += static_cast<char>((value >> 24) & 0xFF);
  out += static_cast<char>((value >> 16) & 0xFF);
  out += static_cast<char>((value >> 8) & 0xFF);
  out += static_cast<char>(value & 0xFF);
}

Expected<std::vector<std::string>, Error> ReadUserIds(rnp_key_handle_t handle) {
  size_t count = 0;
  rnp_result_t result = rnp_key_get_uid_count(handle, &count);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_key_get_uid_count"));
  }

  std::vector<std::string> user_ids;
  for (size_t i = 0; i < count; ++i) {
    rnp_uid_handle_t raw = nullptr;
    result = rnp_key_get_uid_handle_at(handle, i, &raw);
    UidHandlePtr uid(raw);
    if (result != RNP_SUCCESS) {
      return MakeUnexpected(RnpError(result, "rnp_key_get_uid_handle_at"));
    }

    uint32_t type = 0;
    result = rnp_uid_get_type(uid.get(), &type);
    if (result != RNP_SUCCESS) {
      return MakeUnexpected(RnpError(result, "rnp_uid_get_type"));
    }
    if (type != RNP_USER_ID) {
      continue;
    }

    auto text = ReadRnpString([&](char** out) { return rnp_key_get_uid_at(handle, i, out); }, "rnp_key_get_uid_at");
    if (!text) {
      return MakeUnexpected(text.error());
    }
    user_ids.push_back(std::move(*text));
  }
  return user_ids;
}

}  // namespace

Expected<PublicKey, Error> PublicKey::FromHandle(rnp_key_handle_t handle) {
  bool primary = false;
  rnp_result_t result = rnp_key_is_primary(handle, &primary);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_key_is_primary"));
  }
  if (!primary) {
    return MakeUnexpected(MakeError(ErrorCode::kPacketMalformed, "Key does not start with a public key packet"));
  }

  PublicKey key;
  auto fingerprint = ReadRnpString([&](char** out) { return rnp_key_get_fprint(handle, out); }, "rnp_key_get_fprint");
  if (!fingerprint) {
    return MakeUnexpected(fingerprint.error());
  }
  key.fingerprint_ = utils::ToLowerAscii(*fingerprint);
  if (key.fingerprint_.size() != kFingerprintHexLength) {
    return MakeUnexpected(
        MakeError(ErrorCode::kPacketUnsupported, "Unsupported key version", "fingerprint=" + key.fingerprint_));
  }
  key.rfingerprint_ = utils::Reverse(key.fingerprint_);

  auto key_id = ReadRnpString([&](char** out) { return rnp_key_get_keyid(handle, out); }, "rnp_key_get_keyid");
  if (!key_id) {
    return MakeUnexpected(key_id.error());
  }
  key.key_id_ = utils::ToLowerAscii(*key_id);

  result = rnp_key_get_creation(handle, &key.creation_time_);
  if (result != RNP_SUCCESS) {
    return MakeUnexpected(RnpError(result, "rnp_key_get_creation"));
  }

  auto user_ids = ReadUserIds(handle);
  if (!user_ids) {
    return MakeUnexpected(user_ids.error());
  }
  key.user_ids_ = std::move(*user_ids);

  auto packets = ExportPublicKey(handle);
  if (!packets) {
    return MakeUnexpected(packets.error());
  }
  key.packets_ = std::move(*packets);

  auto md5 = ContentDigest(key.packets_);
  if (!md5) {
    return MakeUnexpected(md5.error());
  }
  key.md5_ = std::move(*md5);
  return key;
}

Expected<bool, Error> PublicKey::Merge(const PublicKey& other) {
  if (other.fingerprint_ != fingerprint_) {
    return MakeUnexpected(MakeError(ErrorCode::kKeyringFingerprintMismatch,
                                    "Cannot merge different keys: " + fingerprint_ + ", " + other.fingerprint_));
  }

  auto ffi = CreateFfi();
  if (!ffi) {
    return MakeUnexpected(ffi.error());
  }
  for (std::string_view packets : {std::string_view(packets_), std::string_view(other.packets_)}) {
    auto imported = ImportPublicKeys(ffi->get(), packets);
    if (!imported) {
      return MakeUnexpected(imported.error());
    }
  }

  auto handle = LocateKey(ffi->get(), fingerprint_);
  if (!handle) {
    return MakeUnexpected(handle.error());
  }
  auto merged = FromHandle(handle->get());
  if (!merged) {
    return MakeUnexpected(merged.error());
  }

  if (merged->md5_ == md5_) {
    return false;
  }
  *this = std::move(*merged);
  return true;
}

Expected<std::string, Error> ContentDigest(std::string_view packets) {
  std::vector<Packet> sorted;
  size_t offset = 0;
  while (offset < packets.size()) {
    auto packet = ReadPacket(packets, &offset);
    if (!packet) {
      return MakeUnexpected(packet.error());
    }
    sorted.push_back(std::move(*packet));
  }
  std::sort(sorted.begin(), sorted.end());

  auto hasher = Md5Hasher::Create();
  if (!hasher) {
    return MakeUnexpected(hasher.error());
  }
  for (const auto& packet : sorted) {
    std::string header;
    AppendBigEndian32(header, packet.tag);
    AppendBigEndian32(header, static_cast<uint32_t>(packet.body.size()));
    hasher->Update(header);
    hasher->Update(packet.body);
  }
  return hasher->FinalHex();
}

}  // namespace hkpdb::openpgp
