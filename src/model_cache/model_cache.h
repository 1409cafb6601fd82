#pragma once
#include <c10/core/Device.h>
#include <c10/core/ScalarType.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "cache_registry.h"
#include "cache_stats.h"
#include "common/macros.h"
#include "common/status.h"
#include "memory/device_memory.h"
#include "model_locker.h"
#include "model_provider.h"
#include "residency_manager.h"

namespace mcache {

// ModelCache keeps recently used models in RAM and moves them into accelerator
// memory while they are in use:
//
//   std::unique_ptr<ModelLocker> locker;
//   Status status = cache.get(request, factory, /*gpu_load=*/true, &locker);
//   if (status.ok()) status = locker->acquire();
//   ... use locker->model() on the execution device ...
//   // the locker releases the model when it goes out of scope
//
// When the RAM cache grows over max_cache_size, the least recently used
// unlocked models are dropped and reloaded from storage when next needed.
// Unlocked models are moved off the accelerator when the memory they use
// there exceeds max_vram_cache_size.
//
// It is not thread safe.
class ModelCache final {
 public:
  struct Options {
    // maximum size of the RAM cache in GB
    DEFINE_ARG(double, max_cache_size) = 6.0;

    // GB of accelerator memory idle models may keep
    DEFINE_ARG(double, max_vram_cache_size) = 2.75;

    // device to load active models into
    DEFINE_ARG(c10::Device, execution_device) = c10::Device(c10::kCUDA);

    // device to keep inactive models in
    DEFINE_ARG(c10::Device, storage_device) = c10::Device(c10::kCPU);

    // precision of loaded models
    DEFINE_ARG(c10::ScalarType, precision) = c10::kHalf;

    // keep models on the accelerator until another model needs the room
    DEFINE_ARG(bool, lazy_offloading) = true;

    // load and unload each stage of a pipeline one by one, used by providers
    DEFINE_ARG(bool, sequential_offload) = false;

    // chunk size used when hashing model files, used by providers
    DEFINE_ARG(int64_t, sha_chunksize) = 16 * 1024 * 1024;

    // collect CacheStats
    DEFINE_ARG(bool, enable_stats) = true;

    DEFINE_ARG(OffloadOrder, offload_order) = OffloadOrder::kAscendingSize;
  };

  explicit ModelCache(const Options& options);

  ModelCache(const Options& options,
             std::unique_ptr<DeviceMemory> device_memory);

  // disable copy, move and assign
  ModelCache(const ModelCache&) = delete;
  ModelCache(ModelCache&&) = delete;
  ModelCache& operator=(const ModelCache&) = delete;
  ModelCache& operator=(ModelCache&&) = delete;

  // get a locker for the requested model, loading it from storage if needed.
  // the model is placed on its device by ModelLocker::acquire().
  Status get(const ModelRequest& request,
             const ModelProviderFactory& factory,
             bool gpu_load,
             std::unique_ptr<ModelLocker>* locker);

  // the key of a model in the cache
  static std::string get_key(
      const std::string& model_path,
      const std::optional<std::string>& submodel = std::nullopt) {
    return CacheRegistry::get_key(model_path, submodel);
  }

  // remove the model from the cache even if it is locked
  void untrack(const std::string& key);

  // current size of the cache in GB
  double cache_size() const;

  // nullptr when stats are disabled
  const CacheStats* stats() const { return stats_.get(); }

  const Options& options() const { return options_; }

  CacheRegistry& registry() { return registry_; }

  ResidencyManager& residency_manager() { return residency_manager_; }

 private:
  Options options_;

  std::unique_ptr<DeviceMemory> device_memory_;

  std::unique_ptr<CacheStats> stats_;

  CacheRegistry registry_;

  ResidencyManager residency_manager_;
};

}  // namespace mcache
