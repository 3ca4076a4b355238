/**
 * @file key_commands.h
 * @brief CLI commands running against a key store
 */

#ifndef HKPDB_APP_KEY_COMMANDS_H_
#define HKPDB_APP_KEY_COMMANDS_H_

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "storage/key_storage.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::app {

using hkp::utils::Error;
using hkp::utils::Expected;

/**
 * @brief Per-file outcome of a load
 */
struct LoadSummary {
  size_t added = 0;
  size_t replaced = 0;
  size_t unchanged = 0;
};

/**
 * @brief Executes one command and writes its result to an output stream
 *
 * Identifiers on the command line use the usual forward hex form (optionally
 * prefixed with 0x): full fingerprints, 64-bit key IDs or 32-bit short IDs.
 * They are reversed into the stored form before resolution, and printed
 * fingerprints are forward again.
 */
class KeyCommands {
 public:
  KeyCommands(storage::KeyStorage& storage, std::ostream& out) : storage_(storage), out_(out) {}

  /**
   * @brief Run command with its operands
   * @return kInvalidArgument for an unknown command or malformed operand,
   *         otherwise the first storage or file error
   */
  Expected<void, Error> Execute(const std::string& command, const std::vector<std::string>& operands);

  /**
   * @brief Upsert every key of a binary keyring file
   *
   * Keys before a decode error are kept; the error is returned.
   */
  Expected<LoadSummary, Error> LoadFile(const std::string& path);

 private:
  Expected<void, Error> Load(const std::vector<std::string>& paths);
  Expected<void, Error> Get(const std::vector<std::string>& ids);
  Expected<void, Error> Search(const std::vector<std::string>& words);
  Expected<void, Error> Since(const std::string& timestamp);
  Expected<void, Error> ResolveIds(const std::vector<std::string>& ids);
  Expected<void, Error> Digest(const std::vector<std::string>& digests);

  Expected<void, Error> PrintKeys(std::vector<std::string> rfingerprints);

  storage::KeyStorage& storage_;
  std::ostream& out_;
};

/**
 * @brief Convert a forward key identifier into the stored (reversed) form
 *
 * Strips an optional 0x prefix and lowercases.
 */
std::string ToStoredId(const std::string& id);

}  // namespace hkpdb::app

#endif  // HKPDB_APP_KEY_COMMANDS_H_
