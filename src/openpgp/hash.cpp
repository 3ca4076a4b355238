/**
 * @file hash.cpp
 * @brief OpenSSL EVP backed MD5 hasher
 */

#include "openpgp/hash.h"

#include <openssl/evp.h>

#include "utils/string_utils.h"

namespace hkpdb::openpgp {

using hkp::utils::ErrorCode;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

void Md5Hasher::ContextDeleter::operator()(EVP_MD_CTX* ctx) const {
  if (ctx != nullptr) {
    EVP_MD_CTX_free(ctx);
  }
}

hkp::utils::Expected<Md5Hasher, hkp::utils::Error> Md5Hasher::Create() {
  std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx(EVP_MD_CTX_new());
  if (ctx == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kInternalError, "EVP_MD_CTX_new failed"));
  }

  if (EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1) {
    return MakeUnexpected(MakeError(ErrorCode::kInternalError, "EVP_DigestInit_ex failed"));
  }

  return Md5Hasher(std::move(ctx));
}

void Md5Hasher::Update(std::string_view bytes) {
  if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1) {
    update_failed_ = true;
  }
}

hkp::utils::Expected<std::string, hkp::utils::Error> Md5Hasher::FinalHex() {
  if (update_failed_) {
    return MakeUnexpected(MakeError(ErrorCode::kInternalError, "EVP_DigestUpdate failed"));
  }

  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), digest, &digest_len) != 1) {
    return MakeUnexpected(MakeError(ErrorCode::kInternalError, "EVP_DigestFinal_ex failed"));
  }

  return utils::HexEncode(digest, digest_len);
}

}  // namespace hkpdb::openpgp
