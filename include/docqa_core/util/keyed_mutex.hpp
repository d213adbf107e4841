#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace docqa_core {

// A mutex per string key. Entries are dropped once nobody holds or waits on them.
class KeyedMutex {
  struct Entry {
    std::mutex mutex;
    int users = 0;
  };

 public:
  class Guard {
   public:
    Guard(KeyedMutex *owner, std::string key, std::shared_ptr<Entry> entry)
        : owner_(owner), key_(std::move(key)), entry_(std::move(entry)) {}
    Guard(Guard &&other) noexcept
        : owner_(other.owner_), key_(std::move(other.key_)), entry_(std::move(other.entry_)) {
      other.owner_ = nullptr;
    }
    Guard(const Guard &) = delete;
    Guard &operator=(const Guard &) = delete;
    Guard &operator=(Guard &&) = delete;

    ~Guard() {
      if (owner_ && entry_) {
        owner_->release(key_, entry_);
      }
    }

   private:
    KeyedMutex *owner_;
    std::string key_;
    std::shared_ptr<Entry> entry_;
  };

  KeyedMutex() = default;
  KeyedMutex(const KeyedMutex &) = delete;
  KeyedMutex &operator=(const KeyedMutex &) = delete;

  // Blocks until the key is free
  Guard acquire(const std::string &key);

  size_t active_keys() const;

 private:
  void release(const std::string &key, const std::shared_ptr<Entry> &entry);

  mutable std::mutex registry_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Entry>> entries_;
};

}  // namespace docqa_core
