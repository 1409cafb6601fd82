#include "cache_registry.h"

#include <glog/logging.h>

#include <algorithm>
#include <exception>
#include <filesystem>
#include <iterator>

#include "cache_metrics.h"
#include "common/pretty_print.h"

namespace mcache {

CacheRegistry::CacheRegistry(const Options& options,
                             DeviceMemory* device_memory,
                             CacheStats* stats)
    : options_(options), device_memory_(device_memory), stats_(stats) {
  CHECK(device_memory_ != nullptr);
  CHECK_GE(options_.max_cache_bytes(), 0) << "Negative cache size";
  if (stats_ != nullptr) {
    stats_->cache_size = options_.max_cache_bytes();
  }
}

std::string CacheRegistry::get_key(const std::string& model_path,
                                   const std::optional<std::string>& submodel) {
  std::string key = std::filesystem::path(model_path).generic_string();
  if (submodel.has_value() && !submodel->empty()) {
    key += ":" + submodel.value();
  }
  return key;
}

Status CacheRegistry::get_model_info(const ModelRequest& request,
                                     const ModelProviderFactory& factory,
                                     ModelProvider** provider) {
  const std::string info_key = get_key(request.model_path(), std::nullopt);
  auto it = model_infos_.find(info_key);
  if (it == model_infos_.end()) {
    std::unique_ptr<ModelProvider> info;
    try {
      info = factory(request);
    } catch (const std::exception& e) {
      return {StatusCode::LOAD_FAILED,
              "Failed to create provider for " + info_key + ": " + e.what()};
    }
    if (info == nullptr) {
      return {StatusCode::LOAD_FAILED, "No provider for " + info_key};
    }
    it = model_infos_.emplace(info_key, std::move(info)).first;
  }
  *provider = it->second.get();
  return {};
}

Status CacheRegistry::get_or_load(const ModelRequest& request,
                                  const ModelProviderFactory& factory,
                                  std::shared_ptr<CacheRecord>* record) {
  CHECK(record != nullptr);
  const std::string& model_path = request.model_path();
  if (!std::filesystem::exists(model_path)) {
    return {StatusCode::NOT_FOUND, "Model not found: " + model_path};
  }

  ModelProvider* model_info = nullptr;
  Status status = get_model_info(request, factory, &model_info);
  if (!status.ok()) {
    COUNTER_INC(model_cache_load_failures_total);
    return status;
  }

  const std::string key = get_key(model_path, request.submodel());
  auto it = entries_.find(key);
  if (it != entries_.end()) {
    if (stats_ != nullptr) {
      ++stats_->hits;
    }
    COUNTER_INC(model_cache_hits_total);
    touch(it->second);
    update_stats(key, it->second.record->size());
    *record = it->second.record;
    return {};
  }

  LOG(INFO) << "Loading model " << model_path << ", type "
            << request.base_model() << ":" << request.model_type()
            << (request.submodel() ? ":" + request.submodel().value() : "");
  if (stats_ != nullptr) {
    ++stats_->misses;
  }
  COUNTER_INC(model_cache_misses_total);

  std::unique_ptr<CachedModel> model;
  int64_t estimated_size = 0;
  try {
    // remove older cached models until there is room for the requested one
    estimated_size = model_info->get_size(request.submodel());
    make_room(estimated_size);

    AUTO_COUNTER(model_load_latency_seconds);
    model = model_info->get_model(
        request.submodel(), options_.precision(), options_.storage_device());
  } catch (const std::exception& e) {
    COUNTER_INC(model_cache_load_failures_total);
    return {StatusCode::LOAD_FAILED,
            "Failed to load " + key + ": " + e.what()};
  }
  if (model == nullptr) {
    COUNTER_INC(model_cache_load_failures_total);
    return {StatusCode::LOAD_FAILED, "Provider returned no model for " + key};
  }

  const int64_t size = model->size_in_bytes();
  VLOG(1) << "RAM used for load of " << key << ": " << readable_size(size);
  if (size > estimated_size) {
    // e.g. weights converted to a wider dtype on load
    VLOG(1) << "Model " << key << " is larger than estimated: "
            << readable_size(size) << " > " << readable_size(estimated_size);
    make_room(size);
  }

  lru_list_.push_back(key);
  auto new_record = std::make_shared<CacheRecord>(
      key, std::move(model), size, options_.storage_device());
  const bool inserted =
      entries_.emplace(key, Entry{new_record, std::prev(lru_list_.end())})
          .second;
  CHECK(inserted) << "Duplicate cache key " << key;

  GAUGE_SET(model_cache_num_models, static_cast<double>(entries_.size()));
  GAUGE_SET(model_cache_size_bytes, static_cast<double>(cache_size()));
  update_stats(key, size);
  *record = std::move(new_record);
  return {};
}

size_t CacheRegistry::make_room(int64_t bytes_needed) {
  const int64_t maximum_size = options_.max_cache_bytes();
  int64_t current_size = cache_size();

  if (current_size + bytes_needed > maximum_size) {
    VLOG(1) << "Max cache size exceeded: " << readable_size(current_size)
            << "/" << readable_size(maximum_size) << ", need an additional "
            << readable_size(bytes_needed);
  }
  VLOG(2) << "Before unloading: cached_models=" << entries_.size();

  size_t num_evicted = 0;
  auto lru_it = lru_list_.begin();
  while (current_size + bytes_needed > maximum_size &&
         lru_it != lru_list_.end()) {
    auto entry_it = entries_.find(*lru_it);
    CHECK(entry_it != entries_.end()) << "LRU key not cached: " << *lru_it;
    const auto& record = entry_it->second.record;
    VLOG(2) << "Model: " << record->key() << ", locks: " << record->lock_count()
            << ", device: " << record->model()->device()
            << ", loaded: " << record->loaded();

    // a model handed out by a live locker is still referenced by its caller
    if (record->locked() || record.use_count() > 1) {
      ++lru_it;
      continue;
    }

    VLOG(1) << "Unloading model " << record->key() << " to free "
            << readable_size(bytes_needed) << " (-"
            << readable_size(record->size()) << ")";
    current_size -= record->size();
    if (stats_ != nullptr) {
      ++stats_->cleared;
    }
    COUNTER_INC(model_cache_evictions_total);
    lru_it = lru_list_.erase(lru_it);
    // releases the model
    entries_.erase(entry_it);
    ++num_evicted;
  }

  LOG_IF(WARNING, current_size + bytes_needed > maximum_size)
      << "All remaining models are in use, cache will grow to "
      << readable_size(current_size + bytes_needed) << " over the budget of "
      << readable_size(maximum_size);

  if (num_evicted > 0) {
    device_memory_->empty_cache(options_.execution_device());
    GAUGE_SET(model_cache_num_models, static_cast<double>(entries_.size()));
    GAUGE_SET(model_cache_size_bytes, static_cast<double>(current_size));
  }
  VLOG(2) << "After unloading: cached_models=" << entries_.size();
  return num_evicted;
}

void CacheRegistry::lock(const std::string& key) {
  auto it = entries_.find(key);
  CHECK(it != entries_.end()) << "Locking unknown model " << key;
  it->second.record->lock();
}

void CacheRegistry::unlock(const std::string& key) {
  auto it = entries_.find(key);
  CHECK(it != entries_.end()) << "Unlocking unknown model " << key;
  it->second.record->unlock();
}

void CacheRegistry::untrack(const std::string& key) {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return;
  }
  LOG_IF(WARNING, it->second.record->locked())
      << "Untracking model " << key << " which is still locked";
  lru_list_.erase(it->second.lru_pos);
  entries_.erase(it);
  GAUGE_SET(model_cache_num_models, static_cast<double>(entries_.size()));
  GAUGE_SET(model_cache_size_bytes, static_cast<double>(cache_size()));
}

int64_t CacheRegistry::cache_size() const {
  int64_t size = 0;
  for (const auto& [key, entry] : entries_) {
    size += entry.record->size();
  }
  return size;
}

std::shared_ptr<CacheRecord> CacheRegistry::find(const std::string& key) const {
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    return nullptr;
  }
  return it->second.record;
}

std::vector<std::shared_ptr<CacheRecord>> CacheRegistry::records() const {
  std::vector<std::shared_ptr<CacheRecord>> records;
  records.reserve(lru_list_.size());
  for (const auto& key : lru_list_) {
    records.push_back(entries_.at(key).record);
  }
  return records;
}

void CacheRegistry::touch(Entry& entry) {
  lru_list_.splice(lru_list_.end(), lru_list_, entry.lru_pos);
}

void CacheRegistry::update_stats(const std::string& key, int64_t size) {
  if (stats_ == nullptr) {
    return;
  }
  stats_->high_watermark = std::max(stats_->high_watermark, cache_size());
  stats_->in_cache = static_cast<int64_t>(entries_.size());
  auto& loaded_size = stats_->loaded_model_sizes[key];
  loaded_size = std::max(loaded_size, size);
}

}  // namespace mcache
