/**
 * @file change_notifier.h
 * @brief Key change events and the listener bus
 */

#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <variant>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace hkpdb::storage {

using hkp::utils::Error;
using hkp::utils::Expected;

/**
 * @brief A new key was stored
 */
struct KeyAdded {
  std::string rfingerprint;
  std::string digest;
};

/**
 * @brief A stored key's content was replaced
 */
struct KeyReplaced {
  std::string rfingerprint;
  std::string old_digest;
  std::string new_digest;
};

/**
 * @brief An upsert found nothing new to store
 */
struct KeyNotChanged {
  std::string rfingerprint;
  std::string digest;
};

using KeyChange = std::variant<KeyAdded, KeyReplaced, KeyNotChanged>;

/**
 * @brief Human-readable one-line description of a change
 */
std::string ToString(const KeyChange& change);

using KeyChangeListener = std::function<Expected<void, Error>(const KeyChange&)>;

/**
 * @brief Synchronous fan-out of key changes to registered listeners
 *
 * Listeners are invoked in registration order while the internal mutex is
 * held, so deliveries never interleave. A listener must not call Subscribe()
 * or Notify() on the same notifier. Listener failures (error results and
 * anything thrown) are logged and never reach the caller.
 */
class ChangeNotifier {
 public:
  ChangeNotifier() = default;

  void Subscribe(KeyChangeListener listener);

  /**
   * @brief Deliver change to every listener
   */
  void Notify(const KeyChange& change);

  [[nodiscard]] size_t ListenerCount() const;

 private:
  mutable std::mutex mutex_;
  std::vector<KeyChangeListener> listeners_;
};

}  // namespace hkpdb::storage
