/**
 * @file key_commands.cpp
 * @brief CLI commands running against a key store
 */

#include "app/key_commands.h"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <ostream>
#include <sstream>
#include <variant>

#include "openpgp/key_reader.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace hkpdb::app {

using hkp::utils::ErrorCode;
using hkp::utils::MakeError;
using hkp::utils::MakeUnexpected;

namespace {

Expected<std::string, Error> ReadFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return MakeUnexpected(MakeError(ErrorCode::kNotFound, "Cannot open keyring file", path));
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return MakeUnexpected(MakeError(ErrorCode::kIOError, "Failed to read keyring file", path));
  }
  return buffer.str();
}

std::string ForwardFingerprint(const std::string& rfingerprint) { return utils::Reverse(rfingerprint); }

}  // namespace

std::string ToStoredId(const std::string& id) {
  std::string lowered = utils::ToLowerAscii(id);
  if (lowered.size() > 2 && lowered.compare(0, 2, "0x") == 0) {
    lowered.erase(0, 2);
  }
  return utils::Reverse(lowered);
}

Expected<void, Error> KeyCommands::Execute(const std::string& command, const std::vector<std::string>& operands) {
  if (command == "load") {
    return Load(operands);
  }
  if (command == "get") {
    return Get(operands);
  }
  if (command == "search") {
    return Search(operands);
  }
  if (command == "since") {
    if (operands.size() != 1) {
      return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "since takes exactly one timestamp"));
    }
    return Since(operands.front());
  }
  if (command == "resolve") {
    return ResolveIds(operands);
  }
  if (command == "digest") {
    return Digest(operands);
  }
  return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Unknown command: " + command));
}

Expected<LoadSummary, Error> KeyCommands::LoadFile(const std::string& path) {
  auto data = ReadFile(path);
  if (!data) {
    return MakeUnexpected(data.error());
  }

  LoadSummary summary;
  openpgp::KeyReader reader(std::move(*data));
  while (auto next = reader.Next()) {
    if (!*next) {
      hkp::utils::StructuredLog()
          .Event("keyring_decode_error")
          .Field("file", path)
          .Field("keys_loaded", static_cast<uint64_t>(summary.added + summary.replaced + summary.unchanged))
          .Field("error", next->error().to_string())
          .Error();
      return MakeUnexpected(next->error());
    }

    auto change = storage::UpsertKey(storage_, **next);
    if (!change) {
      return MakeUnexpected(change.error());
    }
    spdlog::debug("{}", storage::ToString(*change));

    if (std::holds_alternative<storage::KeyAdded>(*change)) {
      ++summary.added;
    } else if (std::holds_alternative<storage::KeyReplaced>(*change)) {
      ++summary.replaced;
    } else {
      ++summary.unchanged;
    }
  }
  return summary;
}

Expected<void, Error> KeyCommands::Load(const std::vector<std::string>& paths) {
  for (const auto& path : paths) {
    auto summary = LoadFile(path);
    if (!summary) {
      return MakeUnexpected(summary.error());
    }
    out_ << path << ": " << summary->added << " added, " << summary->replaced << " updated, " << summary->unchanged
         << " unchanged\n";
  }
  return {};
}

Expected<void, Error> KeyCommands::Get(const std::vector<std::string>& ids) {
  std::vector<std::string> stored_ids;
  stored_ids.reserve(ids.size());
  for (const auto& id : ids) {
    stored_ids.push_back(ToStoredId(id));
  }

  auto resolved = storage_.Resolve(std::move(stored_ids));
  if (!resolved) {
    return MakeUnexpected(resolved.error());
  }
  return PrintKeys(std::move(*resolved));
}

Expected<void, Error> KeyCommands::Search(const std::vector<std::string>& words) {
  auto matched = storage_.MatchKeyword(words);
  if (!matched) {
    return MakeUnexpected(matched.error());
  }
  return PrintKeys(std::move(*matched));
}

Expected<void, Error> KeyCommands::Since(const std::string& timestamp) {
  errno = 0;
  char* end = nullptr;
  long long seconds = std::strtoll(timestamp.c_str(), &end, 10);
  if (timestamp.empty() || end == nullptr || *end != '\0' || errno == ERANGE) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Invalid unix timestamp: " + timestamp));
  }

  auto since = std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
  auto modified = storage_.ModifiedSince(since);
  if (!modified) {
    return MakeUnexpected(modified.error());
  }
  return PrintKeys(std::move(*modified));
}

Expected<void, Error> KeyCommands::ResolveIds(const std::vector<std::string>& ids) {
  std::vector<std::string> stored_ids;
  stored_ids.reserve(ids.size());
  for (const auto& id : ids) {
    stored_ids.push_back(ToStoredId(id));
  }

  auto resolved = storage_.Resolve(std::move(stored_ids));
  if (!resolved) {
    return MakeUnexpected(resolved.error());
  }
  for (const auto& rfingerprint : *resolved) {
    out_ << ForwardFingerprint(rfingerprint) << "\n";
  }
  return {};
}

Expected<void, Error> KeyCommands::Digest(const std::vector<std::string>& digests) {
  auto matched = storage_.MatchMD5(digests);
  if (!matched) {
    return MakeUnexpected(matched.error());
  }
  for (const auto& rfingerprint : *matched) {
    out_ << ForwardFingerprint(rfingerprint) << "\n";
  }
  return {};
}

Expected<void, Error> KeyCommands::PrintKeys(std::vector<std::string> rfingerprints) {
  if (rfingerprints.empty()) {
    return {};
  }

  auto keyrings = storage_.FetchKeyrings(std::move(rfingerprints));
  if (!keyrings) {
    return MakeUnexpected(keyrings.error());
  }

  for (const auto& keyring : *keyrings) {
    const auto mtime = std::chrono::duration_cast<std::chrono::seconds>(keyring.mtime.time_since_epoch()).count();
    out_ << "pub " << keyring.key.Fingerprint() << " keyid=" << keyring.key.KeyId() << " md5=" << keyring.key.MD5()
         << " mtime=" << mtime << "\n";
    for (const auto& uid : keyring.key.UserIds()) {
      out_ << "uid " << uid << "\n";
    }
  }
  return {};
}

}  // namespace hkpdb::app
