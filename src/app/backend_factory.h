/**
 * @file backend_factory.h
 * @brief Builds the configured document backend and key store
 */

#ifndef HKPDB_APP_BACKEND_FACTORY_H_
#define HKPDB_APP_BACKEND_FACTORY_H_

#include <memory>

#include "config/config.h"
#include "storage/document_backend.h"
#include "storage/key_storage.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::app {

using hkp::utils::Error;
using hkp::utils::Expected;

/**
 * @brief Create the backend named by config.storage.backend
 *
 * "mysql" requires a build with USE_MYSQL; otherwise kInvalidArgument.
 */
Expected<std::shared_ptr<storage::DocumentBackend>, Error> CreateBackend(const config::Config& config);

/**
 * @brief Storage options (database, collection, result cap) from config
 */
storage::StorageOptions MakeStorageOptions(const config::Config& config);

/**
 * @brief Create backend and open the key store on it (indexes ensured)
 */
Expected<std::unique_ptr<storage::KeyStorage>, Error> OpenKeyStorage(const config::Config& config);

}  // namespace hkpdb::app

#endif  // HKPDB_APP_BACKEND_FACTORY_H_
