#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

namespace mcache {

// counters collected by the cache since its construction
struct CacheStats {
  // cache hits
  int64_t hits = 0;
  // cache misses
  int64_t misses = 0;
  // largest total size of the cached models seen, in bytes
  int64_t high_watermark = 0;
  // number of models in cache
  int64_t in_cache = 0;
  // number of models evicted to make space
  int64_t cleared = 0;
  // configured capacity of the cache, in bytes
  int64_t cache_size = 0;
  // largest loaded size per key, in bytes
  std::unordered_map<std::string, int64_t> loaded_model_sizes;
};

}  // namespace mcache
