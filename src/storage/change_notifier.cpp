/**
 * @file change_notifier.cpp
 * @brief Key change events and the listener bus
 */

#include "storage/change_notifier.h"

#include <exception>
#include <type_traits>

#include "utils/structured_log.h"

namespace hkpdb::storage {

std::string ToString(const KeyChange& change) {
  return std::visit(
      [](const auto& event) -> std::string {
        using T = std::decay_t<decltype(event)>;
        if constexpr (std::is_same_v<T, KeyAdded>) {
          return "key added: rfingerprint=" + event.rfingerprint + " digest=" + event.digest;
        } else if constexpr (std::is_same_v<T, KeyReplaced>) {
          return "key replaced: rfingerprint=" + event.rfingerprint + " digest=" + event.old_digest + " -> " +
                 event.new_digest;
        } else {
          return "key not changed: rfingerprint=" + event.rfingerprint + " digest=" + event.digest;
        }
      },
      change);
}

void ChangeNotifier::Subscribe(KeyChangeListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  listeners_.push_back(std::move(listener));
}

void ChangeNotifier::Notify(const KeyChange& change) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (size_t i = 0; i < listeners_.size(); ++i) {
    try {
      auto result = listeners_[i](change);
      if (!result) {
        hkp::utils::LogListenerError(ToString(change), i, result.error().to_string());
      }
    } catch (const std::exception& e) {
      hkp::utils::LogListenerError(ToString(change), i, e.what());
    } catch (...) {
      hkp::utils::LogListenerError(ToString(change), i, "unknown exception");
    }
  }
}

size_t ChangeNotifier::ListenerCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return listeners_.size();
}

}  // namespace hkpdb::storage
