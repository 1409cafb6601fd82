#include "model_locker.h"

#include <glog/logging.h>

#include "common/scope_guard.h"

namespace mcache {

ModelLocker::ModelLocker(std::shared_ptr<CacheRecord> record,
                         ResidencyManager* residency_manager,
                         bool gpu_load)
    : record_(std::move(record)),
      residency_manager_(residency_manager),
      gpu_load_(gpu_load) {
  CHECK(record_ != nullptr);
  CHECK(residency_manager_ != nullptr);
}

ModelLocker::~ModelLocker() {
  const Status status = release();
  LOG_IF(ERROR, !status.ok())
      << "Failed to release " << record_->key() << ": " << status.message();
}

Status ModelLocker::acquire() {
  CHECK(!acquired_) << "Model " << record_->key() << " is already acquired";

  // nothing to place for models that can't move between devices
  if (!record_->model()->movable()) {
    acquired_ = true;
    return {};
  }

  if (gpu_load_) {
    record_->lock();
    ScopeGuard unlock_on_failure([this]() { record_->unlock(); });

    Status status = residency_manager_->promote(record_.get());
    if (!status.ok()) {
      return status;
    }
    unlock_on_failure.dismiss();
    locked_ = true;
    VLOG(1) << "Locking " << record_->key() << " in "
            << residency_manager_->options().execution_device();
    residency_manager_->log_memory_stats();
  } else if (record_->loaded() && !record_->locked()) {
    // the caller wants the model in RAM, move it out of the execution device
    // if nobody else is using it
    const Status status = residency_manager_->demote_if_idle(record_.get());
    LOG_IF(WARNING, !status.ok())
        << "Failed to offload idle " << record_->key() << ": "
        << status.message();
  }
  acquired_ = true;
  return {};
}

Status ModelLocker::release() {
  if (!acquired_) {
    return {};
  }
  acquired_ = false;
  if (!locked_) {
    return {};
  }
  locked_ = false;
  record_->unlock();

  if (residency_manager_->lazy_offloading()) {
    return {};
  }
  Status status = residency_manager_->offload_unlocked(/*target_headroom=*/0);
  residency_manager_->log_memory_stats();
  return status;
}

}  // namespace mcache
