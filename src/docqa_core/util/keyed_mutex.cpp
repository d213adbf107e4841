#include "docqa_core/util/keyed_mutex.hpp"

namespace docqa_core {

KeyedMutex::Guard KeyedMutex::acquire(const std::string &key) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto &slot = entries_[key];
    if (!slot) {
      slot = std::make_shared<Entry>();
    }
    slot->users++;
    entry = slot;
  }
  entry->mutex.lock();
  return Guard(this, key, entry);
}

void KeyedMutex::release(const std::string &key, const std::shared_ptr<Entry> &entry) {
  entry->mutex.unlock();
  std::lock_guard<std::mutex> lock(registry_mutex_);
  if (--entry->users == 0) {
    entries_.erase(key);
  }
}

size_t KeyedMutex::active_keys() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return entries_.size();
}

}  // namespace docqa_core
