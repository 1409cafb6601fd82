#include "model_cache.h"

#include <glog/logging.h>

#include "common/pretty_print.h"

namespace mcache {

namespace {
constexpr int64_t GB = int64_t(1024) * 1024 * 1024;

int64_t to_bytes(double size_in_gb) {
  return static_cast<int64_t>(size_in_gb * static_cast<double>(GB));
}

CacheRegistry::Options registry_options(const ModelCache::Options& options) {
  CacheRegistry::Options registry_options;
  registry_options.max_cache_bytes(to_bytes(options.max_cache_size()))
      .storage_device(options.storage_device())
      .execution_device(options.execution_device())
      .precision(options.precision());
  return registry_options;
}

ResidencyManager::Options residency_options(
    const ModelCache::Options& options) {
  ResidencyManager::Options residency_options;
  residency_options
      .max_vram_cache_bytes(to_bytes(options.max_vram_cache_size()))
      .execution_device(options.execution_device())
      .storage_device(options.storage_device())
      .lazy_offloading(options.lazy_offloading())
      .offload_order(options.offload_order());
  return residency_options;
}
}  // namespace

ModelCache::ModelCache(const Options& options)
    : ModelCache(options, std::make_unique<CudaDeviceMemory>()) {}

ModelCache::ModelCache(const Options& options,
                       std::unique_ptr<DeviceMemory> device_memory)
    : options_(options),
      device_memory_(std::move(device_memory)),
      stats_(options.enable_stats() ? std::make_unique<CacheStats>() : nullptr),
      registry_(registry_options(options), device_memory_.get(), stats_.get()),
      residency_manager_(residency_options(options),
                         &registry_,
                         device_memory_.get()) {
  LOG(INFO) << "Model cache: max size " << readable_size(to_bytes(
                                               options_.max_cache_size()))
            << ", vram reserve "
            << readable_size_delta(to_bytes(options_.max_vram_cache_size()))
            << ", " << options_.storage_device() << " -> "
            << options_.execution_device() << ", lazy offloading "
            << residency_manager_.lazy_offloading();
}

Status ModelCache::get(const ModelRequest& request,
                       const ModelProviderFactory& factory,
                       bool gpu_load,
                       std::unique_ptr<ModelLocker>* locker) {
  CHECK(locker != nullptr);
  std::shared_ptr<CacheRecord> record;
  Status status = registry_.get_or_load(request, factory, &record);
  if (!status.ok()) {
    return status;
  }
  *locker = std::make_unique<ModelLocker>(
      std::move(record), &residency_manager_, gpu_load);
  return {};
}

void ModelCache::untrack(const std::string& key) { registry_.untrack(key); }

double ModelCache::cache_size() const {
  return static_cast<double>(registry_.cache_size()) / GB;
}

}  // namespace mcache
