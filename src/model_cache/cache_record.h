#pragma once
#include <c10/core/Device.h>

#include <cstdint>
#include <memory>
#include <string>

#include "cached_model.h"

namespace mcache {

// A model held by the cache together with its size and lock count.
// The record owns the model: destroying the record releases the model.
// It is not thread safe.
class CacheRecord final {
 public:
  CacheRecord(std::string key,
              std::unique_ptr<CachedModel> model,
              int64_t size,
              const c10::Device& storage_device);

  // disable copy, move and assign
  CacheRecord(const CacheRecord&) = delete;
  CacheRecord(CacheRecord&&) = delete;
  CacheRecord& operator=(const CacheRecord&) = delete;
  CacheRecord& operator=(CacheRecord&&) = delete;

  const std::string& key() const { return key_; }

  int64_t size() const { return size_; }

  CachedModel* model() const { return model_.get(); }

  // a locked record is in use and can neither be evicted nor offloaded
  void lock();

  void unlock();

  bool locked() const { return locks_ > 0; }

  int32_t lock_count() const { return locks_; }

  // whether the model lives outside of the storage device, asked from the
  // model itself every time
  bool loaded() const;

 private:
  std::string key_;

  std::unique_ptr<CachedModel> model_;

  // bytes occupied by the model in the storage tier
  int64_t size_ = 0;

  c10::Device storage_device_;

  int32_t locks_ = 0;
};

}  // namespace mcache
