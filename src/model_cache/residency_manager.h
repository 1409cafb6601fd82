#pragma once
#include <c10/core/Device.h>

#include <cstdint>

#include "cache_record.h"
#include "cache_registry.h"
#include "common/macros.h"
#include "common/status.h"
#include "memory/device_memory.h"

namespace mcache {

// order in which unlocked models are moved off the execution device
enum class OffloadOrder : uint8_t {
  // free many small models before a large one
  kAscendingSize = 0,
  kDescendingSize = 1,
};

// ResidencyManager moves cached models between the storage device and the
// execution device, keeping the memory used by idle models on the execution
// device within a reserve. It never changes lock counts.
class ResidencyManager final {
 public:
  struct Options {
    // bytes of idle models allowed to stay on the execution device
    DEFINE_ARG(int64_t, max_vram_cache_bytes) = 0;

    DEFINE_ARG(c10::Device, execution_device) = c10::Device(c10::kCUDA);

    DEFINE_ARG(c10::Device, storage_device) = c10::Device(c10::kCPU);

    // offload only when room is needed for a new model, instead of after
    // every release. forced off when max_vram_cache_bytes <= 0.
    DEFINE_ARG(bool, lazy_offloading) = true;

    DEFINE_ARG(OffloadOrder, offload_order) = OffloadOrder::kAscendingSize;
  };

  // registry and device_memory must outlive the manager
  ResidencyManager(const Options& options,
                   const CacheRegistry* registry,
                   DeviceMemory* device_memory);

  // disable copy, move and assign
  ResidencyManager(const ResidencyManager&) = delete;
  ResidencyManager(ResidencyManager&&) = delete;
  ResidencyManager& operator=(const ResidencyManager&) = delete;
  ResidencyManager& operator=(ResidencyManager&&) = delete;

  // move the model onto the execution device, making room first when lazy
  // offloading. no-op if it is already there.
  Status promote(CacheRecord* record);

  // move unlocked models off the execution device until its usage falls
  // within the reserve. target_headroom is the size of the model about to be
  // promoted, for logging only.
  Status offload_unlocked(int64_t target_headroom);

  // move the model back to the storage device if it is loaded and unlocked
  Status demote_if_idle(CacheRecord* record);

  bool lazy_offloading() const { return lazy_offloading_; }

  // bytes currently allocated on the execution device
  int64_t vram_in_use() const;

  // log device memory and cache usage
  void log_memory_stats() const;

  const Options& options() const { return options_; }

 private:
  // move the model to the device, delta receives the change of bytes
  // allocated on the execution device
  Status transfer(CacheRecord* record,
                  const c10::Device& device,
                  int64_t* delta);

  Options options_;

  const CacheRegistry* registry_ = nullptr;

  DeviceMemory* device_memory_ = nullptr;

  bool lazy_offloading_ = true;
};

}  // namespace mcache
