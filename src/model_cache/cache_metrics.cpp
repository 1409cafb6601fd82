#include "cache_metrics.h"

DEFINE_COUNTER(model_cache_hits_total, "Total number of model cache hits");
DEFINE_COUNTER(model_cache_misses_total, "Total number of model cache misses");
DEFINE_COUNTER(model_cache_evictions_total,
               "Total number of models evicted to make room");
DEFINE_COUNTER(model_cache_offloads_total,
               "Total number of models moved back to the storage device");
DEFINE_COUNTER(model_cache_load_failures_total,
               "Total number of failed model loads");
DEFINE_COUNTER(model_cache_transfer_failures_total,
               "Total number of failed device transfers");

DEFINE_GAUGE(model_cache_size_bytes, "Total size of the cached models");
DEFINE_GAUGE(model_cache_num_models, "Number of cached models");

DEFINE_COUNTER(model_load_latency_seconds, "Latency of model loads in seconds");
DEFINE_COUNTER(model_transfer_latency_seconds,
               "Latency of model device transfers in seconds");
