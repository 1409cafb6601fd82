#pragma once
#include <c10/core/Device.h>
#include <c10/core/ScalarType.h>

#include <cstdint>
#include <list>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "cache_record.h"
#include "cache_stats.h"
#include "common/macros.h"
#include "common/status.h"
#include "memory/device_memory.h"
#include "model_provider.h"

namespace mcache {

// CacheRegistry owns the cached models and keeps them in least recently used
// order. When loading a new model would exceed the storage budget, unlocked
// models are evicted from the least recently used end.
//
// It is not thread safe. Two callers asking for the same missing key at the
// same time would both load it, callers sharing a registry between threads
// must serialize all calls.
class CacheRegistry final {
 public:
  struct Options {
    // storage tier budget in bytes, an eviction target rather than a hard cap
    DEFINE_ARG(int64_t, max_cache_bytes) = 0;

    // where models are loaded and kept while idle
    DEFINE_ARG(c10::Device, storage_device) = c10::Device(c10::kCPU);

    // whose allocator cache is emptied after evictions
    DEFINE_ARG(c10::Device, execution_device) = c10::Device(c10::kCUDA);

    // passed through to the providers
    DEFINE_ARG(c10::ScalarType, precision) = c10::kHalf;
  };

  // device_memory must outlive the registry, stats is optional
  CacheRegistry(const Options& options,
                DeviceMemory* device_memory,
                CacheStats* stats);

  // disable copy, move and assign
  CacheRegistry(const CacheRegistry&) = delete;
  CacheRegistry(CacheRegistry&&) = delete;
  CacheRegistry& operator=(const CacheRegistry&) = delete;
  CacheRegistry& operator=(CacheRegistry&&) = delete;

  // the cache key of a model: its path, followed by ":<submodel>" if any
  static std::string get_key(const std::string& model_path,
                             const std::optional<std::string>& submodel);

  // return the cached record for the request, loading it on a miss.
  // NOT_FOUND if the model path does not exist, LOAD_FAILED if the provider
  // could not load the model. nothing is registered on failure.
  Status get_or_load(const ModelRequest& request,
                     const ModelProviderFactory& factory,
                     std::shared_ptr<CacheRecord>* record);

  // evict unlocked models, least recently used first, until bytes_needed more
  // bytes fit in the budget or no candidate is left.
  // return the number of evicted models.
  size_t make_room(int64_t bytes_needed);

  // lock and unlock the record of a cached key. unlocking an unlocked record
  // is a fatal error.
  void lock(const std::string& key);
  void unlock(const std::string& key);

  // drop the model regardless of its lock count. no-op for unknown keys.
  void untrack(const std::string& key);

  // total size of the cached models in bytes
  int64_t cache_size() const;

  size_t num_models() const { return entries_.size(); }

  bool contains(const std::string& key) const {
    return entries_.count(key) > 0;
  }

  // return nullptr if not cached
  std::shared_ptr<CacheRecord> find(const std::string& key) const;

  // cached records, least recently used first
  std::vector<std::shared_ptr<CacheRecord>> records() const;

  // cached keys, least recently used first
  std::vector<std::string> lru_keys() const {
    return std::vector<std::string>(lru_list_.begin(), lru_list_.end());
  }

  const Options& options() const { return options_; }

 private:
  struct Entry {
    std::shared_ptr<CacheRecord> record;
    // position in lru_list_
    std::list<std::string>::iterator lru_pos;
  };

  // get or create the provider shared by all submodels of a model path
  Status get_model_info(const ModelRequest& request,
                        const ModelProviderFactory& factory,
                        ModelProvider** provider);

  // move the key to the most recently used end
  void touch(Entry& entry);

  void update_stats(const std::string& key, int64_t size);

  Options options_;

  DeviceMemory* device_memory_ = nullptr;

  // optional, owned by the caller
  CacheStats* stats_ = nullptr;

  std::unordered_map<std::string, Entry> entries_;

  // keys ordered by last access, the front is the least recently used
  std::list<std::string> lru_list_;

  // providers keyed by model path, never evicted
  std::unordered_map<std::string, std::unique_ptr<ModelProvider>>
      model_infos_;
};

}  // namespace mcache
