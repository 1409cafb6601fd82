#include "device_memory.h"

#include <c10/cuda/CUDACachingAllocator.h>
#include <c10/cuda/CUDAFunctions.h>
#include <cuda_runtime_api.h>
#include <glog/logging.h>
#include <torch/cuda.h>

namespace mcache {

namespace {
c10::DeviceIndex cuda_device_index(const c10::Device& device) {
  return device.has_index() ? device.index() : c10::cuda::current_device();
}
}  // namespace

int64_t CudaDeviceMemory::allocated_bytes(const c10::Device& device) const {
  if (!device.is_cuda() || !torch::cuda::is_available()) {
    return 0;
  }
  using namespace c10::cuda;
  const auto stats =
      CUDACachingAllocator::getDeviceStats(cuda_device_index(device));
  // StatType::AGGREGATE
  return stats.allocated_bytes[0].current;
}

void CudaDeviceMemory::empty_cache(const c10::Device& device) {
  if (!device.is_cuda() || !torch::cuda::is_available()) {
    return;
  }
  c10::cuda::CUDACachingAllocator::emptyCache();
}

namespace memory {

int64_t max_memory_allocated(const c10::Device& device) {
  CHECK(device.is_cuda()) << "Only support CUDA device for now.";
  using namespace c10::cuda;
  const auto stats =
      CUDACachingAllocator::getDeviceStats(cuda_device_index(device));
  // StatType::AGGREGATE
  return stats.allocated_bytes[0].peak;
}

int64_t total_memory(const c10::Device& device) {
  CHECK(device.is_cuda()) << "Only support CUDA device for now.";
  cudaDeviceProp prop{};
  const auto err = cudaGetDeviceProperties(&prop, cuda_device_index(device));
  CHECK(err == cudaSuccess) << "Failed to get properties for " << device
                            << ", error: " << cudaGetErrorString(err);
  return static_cast<int64_t>(prop.totalGlobalMem);
}

}  // namespace memory

}  // namespace mcache
