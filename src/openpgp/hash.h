/**
 * @file hash.h
 * @brief MD5 digest over byte chunks (OpenSSL EVP)
 */

#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "utils/error.h"
#include "utils/expected.h"

typedef struct evp_md_ctx_st EVP_MD_CTX;  // NOLINT(modernize-use-using)

namespace hkpdb::openpgp {

/**
 * @brief Incremental MD5 hasher producing a lowercase hex digest
 *
 * @code
 * auto hasher = Md5Hasher::Create();
 * if (!hasher) { ... }
 * hasher->Update(header);
 * hasher->Update(body);
 * auto hex = hasher->FinalHex();
 * @endcode
 */
class Md5Hasher {
 public:
  static hkp::utils::Expected<Md5Hasher, hkp::utils::Error> Create();

  void Update(std::string_view bytes);

  /**
   * @brief Finish the digest; the hasher cannot be reused afterwards
   */
  hkp::utils::Expected<std::string, hkp::utils::Error> FinalHex();

 private:
  struct ContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const;
  };

  explicit Md5Hasher(std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx) : ctx_(std::move(ctx)) {}

  std::unique_ptr<EVP_MD_CTX, ContextDeleter> ctx_;
  bool update_failed_ = false;
};

}  // namespace hkpdb::openpgp
