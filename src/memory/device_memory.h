#pragma once
#include <c10/core/Device.h>

#include <cstdint>
#include <memory>

namespace mcache {

// Accounting of the memory held by tensors on a device. Used to measure the
// execution tier usage and to hand cached allocator blocks back to the driver.
class DeviceMemory {
 public:
  virtual ~DeviceMemory() = default;

  // bytes currently allocated by tensors on the device.
  virtual int64_t allocated_bytes(const c10::Device& device) const = 0;

  // release cached but unused blocks of the device allocator.
  virtual void empty_cache(const c10::Device& device) = 0;
};

// DeviceMemory backed by the CUDA caching allocator.
// Other device types report no usage and have nothing to release.
class CudaDeviceMemory final : public DeviceMemory {
 public:
  int64_t allocated_bytes(const c10::Device& device) const override;

  void empty_cache(const c10::Device& device) override;
};

namespace memory {

// returns the peak allocated memory in bytes since the beginning of the
// program. Only support CUDA device for now.
int64_t max_memory_allocated(const c10::Device& device);

// returns the total memory in bytes of the device.
// Only support CUDA device for now.
int64_t total_memory(const c10::Device& device);

}  // namespace memory

}  // namespace mcache
