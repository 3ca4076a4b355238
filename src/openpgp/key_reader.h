/**
 * @file key_reader.h
 * @brief Keyring parsing
 */

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "openpgp/public_key.h"
#include "openpgp/rnp_handle.h"

namespace hkpdb::openpgp {

/**
 * @brief Lazy reader splitting a binary keyring into public keys
 *
 * Each call to Next() imports one transferable key from the input into a
 * fresh rnp keyring and yields it, or yields the decode error. The sequence
 * is finite and not restartable: after the first error, or once the input is
 * exhausted, Next() returns std::nullopt.
 *
 * The rnp input reads data_ in place, so the reader is neither copyable nor
 * movable.
 */
class KeyReader {
 public:
  explicit KeyReader(std::string data) : data_(std::move(data)) {}

  KeyReader(const KeyReader&) = delete;
  KeyReader& operator=(const KeyReader&) = delete;
  KeyReader(KeyReader&&) = delete;
  KeyReader& operator=(KeyReader&&) = delete;

  /**
   * @brief Read the next key
   * @return Key, decode error, or std::nullopt at end of input
   */
  std::optional<Expected<PublicKey, Error>> Next();

 private:
  std::optional<Expected<PublicKey, Error>> ImportNext();

  std::string data_;
  InputPtr input_;
  bool done_ = false;
};

/**
 * @brief Read every key from a keyring, stopping at the first error
 */
Expected<std::vector<PublicKey>, Error> ReadKeys(std::string data);

}  // namespace hkpdb::openpgp
