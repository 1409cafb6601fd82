#include "residency_manager.h"

#include <glog/logging.h>

#include <algorithm>
#include <exception>
#include <memory>
#include <vector>

#include "cache_metrics.h"
#include "common/pretty_print.h"

namespace mcache {

ResidencyManager::ResidencyManager(const Options& options,
                                   const CacheRegistry* registry,
                                   DeviceMemory* device_memory)
    : options_(options),
      registry_(registry),
      device_memory_(device_memory),
      lazy_offloading_(options.lazy_offloading() &&
                       options.max_vram_cache_bytes() > 0) {
  CHECK(registry_ != nullptr);
  CHECK(device_memory_ != nullptr);
}

int64_t ResidencyManager::vram_in_use() const {
  return device_memory_->allocated_bytes(options_.execution_device());
}

Status ResidencyManager::transfer(CacheRecord* record,
                                  const c10::Device& device,
                                  int64_t* delta) {
  const int64_t before = vram_in_use();
  try {
    AUTO_COUNTER(model_transfer_latency_seconds);
    record->model()->to(device);
  } catch (const std::exception& e) {
    COUNTER_INC(model_cache_transfer_failures_total);
    LOG(ERROR) << "Failed to move " << record->key() << " to " << device
               << ": " << e.what();
    return {StatusCode::TRANSFER_FAILED,
            "Failed to move " + record->key() + " to " + device.str() + ": " +
                e.what()};
  }
  *delta = vram_in_use() - before;
  return {};
}

Status ResidencyManager::promote(CacheRecord* record) {
  CHECK(record != nullptr);
  const auto& execution_device = options_.execution_device();
  if (is_same_device(record->model()->device(), execution_device)) {
    return {};
  }

  if (lazy_offloading_) {
    Status status = offload_unlocked(record->size());
    if (!status.ok()) {
      return status;
    }
  }

  VLOG(1) << "Moving " << record->key() << " into " << execution_device;
  int64_t delta = 0;
  Status status = transfer(record, execution_device, &delta);
  if (!status.ok()) {
    return status;
  }
  VLOG(1) << "GPU VRAM used for load: " << readable_size_delta(delta);
  return {};
}

Status ResidencyManager::offload_unlocked(int64_t target_headroom) {
  const int64_t reserved = options_.max_vram_cache_bytes();
  int64_t vram_used = vram_in_use();
  VLOG(1) << readable_size_delta(vram_used)
          << " VRAM used for models; max allowed="
          << readable_size_delta(reserved)
          << ", headroom requested=" << readable_size_delta(target_headroom);

  auto candidates = registry_->records();
  if (options_.offload_order() == OffloadOrder::kAscendingSize) {
    std::stable_sort(candidates.begin(),
                     candidates.end(),
                     [](const auto& lhs, const auto& rhs) {
                       return lhs->size() < rhs->size();
                     });
  } else {
    std::stable_sort(candidates.begin(),
                     candidates.end(),
                     [](const auto& lhs, const auto& rhs) {
                       return lhs->size() > rhs->size();
                     });
  }

  Status status;
  int64_t freed = 0;
  for (const auto& record : candidates) {
    if (vram_used <= reserved) {
      break;
    }
    if (record->locked() || !record->loaded()) {
      continue;
    }
    VLOG(1) << "Offloading " << record->key() << " from "
            << options_.execution_device() << " into "
            << options_.storage_device();
    int64_t delta = 0;
    status = transfer(record.get(), options_.storage_device(), &delta);
    if (!status.ok()) {
      break;
    }
    COUNTER_INC(model_cache_offloads_total);
    // delta is negative when memory was freed
    vram_used += delta;
    freed -= delta;
    VLOG(1) << "GPU VRAM freed: " << readable_size_delta(-delta) << ", "
            << readable_size_delta(vram_used)
            << " VRAM used for models; max allowed="
            << readable_size_delta(reserved);
  }
  VLOG_IF(1, freed > 0) << "Offloading freed " << readable_size_delta(freed);

  device_memory_->empty_cache(options_.execution_device());
  return status;
}

Status ResidencyManager::demote_if_idle(CacheRecord* record) {
  CHECK(record != nullptr);
  if (!record->loaded() || record->locked()) {
    return {};
  }
  VLOG(1) << "Moving idle " << record->key() << " into "
          << options_.storage_device();
  int64_t delta = 0;
  Status status = transfer(record, options_.storage_device(), &delta);
  if (status.ok()) {
    COUNTER_INC(model_cache_offloads_total);
  }
  device_memory_->empty_cache(options_.execution_device());
  return status;
}

void ResidencyManager::log_memory_stats() const {
  if (!VLOG_IS_ON(2)) {
    return;
  }
  size_t cached_models = 0;
  size_t loaded_models = 0;
  size_t locked_models = 0;
  for (const auto& record : registry_->records()) {
    ++cached_models;
    if (record->loaded()) {
      ++loaded_models;
    }
    if (record->locked()) {
      ++locked_models;
    }
  }
  VLOG(2) << "Current VRAM/RAM usage: " << readable_size_delta(vram_in_use())
          << "/" << readable_size_delta(registry_->cache_size())
          << "; cached_models/loaded_models/locked_models = " << cached_models
          << "/" << loaded_models << "/" << locked_models;
}

}  // namespace mcache
