/**
 * @file index_manager.cpp
 * @brief Secondary indexes required by the key store
 */

#include "storage/index_manager.h"

#include <spdlog/spdlog.h>

#include "utils/structured_log.h"

namespace hkpdb::storage {

const std::vector<IndexSpec>& IndexManager::RequiredIndexes() {
  static const std::vector<IndexSpec> kIndexes = {
      {field::kRFingerprint, true, false},
      {field::kMD5, true, false},
      {field::kMTime, false, false},
      {field::kKeywords, false, true},
  };
  return kIndexes;
}

Expected<void, Error> IndexManager::EnsureIndexes(const StorageHandle& handle) {
  auto scope = handle.Acquire();
  if (!scope) {
    return MakeUnexpected(scope.error());
  }

  for (const auto& spec : RequiredIndexes()) {
    auto result = (*scope)->EnsureIndex(spec);
    if (!result) {
      hkp::utils::StructuredLog()
          .Event("storage_index_failed")
          .Field("collection", handle.Database() + "." + handle.CollectionName())
          .Field("field", spec.field)
          .Field("error", result.error().message())
          .Error();
      return result;
    }
  }

  spdlog::info("Indexes ensured on {}.{}", handle.Database(), handle.CollectionName());
  return {};
}

}  // namespace hkpdb::storage
