#pragma once

#include "common/metrics.h"

DECLARE_COUNTER(model_cache_hits_total);
DECLARE_COUNTER(model_cache_misses_total);
DECLARE_COUNTER(model_cache_evictions_total);
DECLARE_COUNTER(model_cache_offloads_total);
DECLARE_COUNTER(model_cache_load_failures_total);
DECLARE_COUNTER(model_cache_transfer_failures_total);

DECLARE_GAUGE(model_cache_size_bytes);
DECLARE_GAUGE(model_cache_num_models);

DECLARE_COUNTER(model_load_latency_seconds);
DECLARE_COUNTER(model_transfer_latency_seconds);
