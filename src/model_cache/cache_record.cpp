#include "cache_record.h"

#include <glog/logging.h>

namespace mcache {

CacheRecord::CacheRecord(std::string key,
                         std::unique_ptr<CachedModel> model,
                         int64_t size,
                         const c10::Device& storage_device)
    : key_(std::move(key)),
      model_(std::move(model)),
      size_(size),
      storage_device_(storage_device) {
  CHECK(model_ != nullptr) << "No model for " << key_;
  CHECK_GE(size_, 0) << "Negative size for " << key_;
}

void CacheRecord::lock() { ++locks_; }

void CacheRecord::unlock() {
  CHECK_GT(locks_, 0) << "Unlocking " << key_ << " which is not locked";
  --locks_;
}

bool CacheRecord::loaded() const {
  return model_->movable() &&
         !is_same_device(model_->device(), storage_device_);
}

}  // namespace mcache
