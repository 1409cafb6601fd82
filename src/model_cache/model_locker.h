#pragma once

#include <memory>
#include <string>

#include "cache_record.h"
#include "cached_model.h"
#include "common/status.h"
#include "residency_manager.h"

namespace mcache {

// ModelLocker hands out a cached model for the duration of its scope.
//
// With gpu_load, acquire() locks the record and moves the model onto the
// execution device; the lock is dropped by release() or, at the latest, by the
// destructor, on every exit path. Without gpu_load no lock is taken and an idle
// model is moved back to the storage device on a best effort basis.
//
// The locker keeps the record alive, so the model stays valid while the locker
// lives even if it gets untracked. It locks and unlocks the record it holds
// rather than going through CacheRegistry::lock(key), which would fail once the
// key is untracked. It must not outlive the cache it came from.
class ModelLocker final {
 public:
  ModelLocker(std::shared_ptr<CacheRecord> record,
              ResidencyManager* residency_manager,
              bool gpu_load);

  ~ModelLocker();

  // disable copy, move and assign
  ModelLocker(const ModelLocker&) = delete;
  ModelLocker(ModelLocker&&) = delete;
  ModelLocker& operator=(const ModelLocker&) = delete;
  ModelLocker& operator=(ModelLocker&&) = delete;

  // make the model ready for use. on failure the locker holds no lock.
  Status acquire();

  // drop the lock taken by acquire(), offloading unlocked models right away
  // unless lazy offloading. no-op if nothing is held.
  Status release();

  CachedModel* model() const { return record_->model(); }

  const std::string& key() const { return record_->key(); }

  bool gpu_load() const { return gpu_load_; }

  bool acquired() const { return acquired_; }

  // whether the locker holds a lock on the record
  bool locked() const { return locked_; }

 private:
  std::shared_ptr<CacheRecord> record_;

  ResidencyManager* residency_manager_ = nullptr;

  bool gpu_load_ = true;

  bool acquired_ = false;

  bool locked_ = false;
};

}  // namespace mcache
