#include <absl/strings/str_split.h>
#include <gflags/gflags.h>
#include <glog/logging.h>
#include <torch/torch.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/metrics.h"
#include "common/pretty_print.h"
#include "common/torch_utils.h"
#include "memory/device_memory.h"
#include "model_cache/model_cache.h"
#include "model_cache/state_dict_model_provider.h"

DEFINE_string(model_paths,
              "",
              "Comma separated list of torch state dict files or model "
              "directories to load through the cache.");

DEFINE_string(submodel, "", "Submodel to load from each model directory.");

DEFINE_double(max_cache_size, 6.0, "Maximum size of the RAM cache in GB.");

DEFINE_double(max_vram_cache_size,
              2.75,
              "GB of accelerator memory idle models may keep.");

DEFINE_string(execution_device,
              "auto",
              "Device to load active models into, e.g. cpu, cuda:0, or auto "
              "to use the first gpu if there is one.");

DEFINE_string(storage_device, "cpu", "Device to keep inactive models in.");

DEFINE_string(precision,
              "auto",
              "Precision of loaded models: half, bfloat16, float or auto.");

DEFINE_bool(lazy_offloading,
            true,
            "Keep models on the accelerator until another model needs room.");

DEFINE_bool(sequential_offload,
            false,
            "Load and unload each pipeline stage one by one.");

DEFINE_bool(print_metrics, false, "Print prometheus metrics before exiting.");

using namespace mcache;

namespace {
static constexpr int64_t GB = int64_t(1024) * 1024 * 1024;

// load the model, acquire it on the execution device and release it.
bool run_model(ModelCache& cache, const ModelRequest& request) {
  std::unique_ptr<ModelLocker> locker;
  Status status = cache.get(
      request, StateDictModelProvider::create, /*gpu_load=*/true, &locker);
  if (!status.ok()) {
    LOG(ERROR) << "Failed to get " << request.model_path() << ": " << status;
    return false;
  }
  status = locker->acquire();
  if (!status.ok()) {
    LOG(ERROR) << "Failed to acquire " << locker->key() << ": " << status;
    return false;
  }
  CachedModel* model = locker->model();
  std::cout << locker->key() << ": " << readable_size(model->size_in_bytes())
            << " on " << model->device() << std::endl;
  return true;
}
}  // namespace

int main(int argc, char** argv) {
  // initialize gflags
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);

  const std::vector<std::string> model_paths =
      absl::StrSplit(FLAGS_model_paths, ',', absl::SkipEmpty());
  if (model_paths.empty()) {
    LOG(ERROR) << "No models given, use --model_paths";
    return 1;
  }

  const torch::Device execution_device = parse_device(FLAGS_execution_device);
  const torch::Device storage_device = parse_device(FLAGS_storage_device);

  ModelCache::Options options;
  options.max_cache_size(FLAGS_max_cache_size)
      .max_vram_cache_size(FLAGS_max_vram_cache_size)
      .execution_device(execution_device)
      .storage_device(storage_device)
      .precision(parse_dtype(FLAGS_precision, execution_device))
      .lazy_offloading(FLAGS_lazy_offloading)
      .sequential_offload(FLAGS_sequential_offload);
  ModelCache cache(options);

  std::optional<std::string> submodel;
  if (!FLAGS_submodel.empty()) {
    submodel = FLAGS_submodel;
  }

  // the second round is served from the cache as long as everything fits
  bool ok = true;
  for (int round = 0; round < 2; ++round) {
    for (const auto& model_path : model_paths) {
      ModelRequest request;
      request.model_path(model_path)
          .base_model("any")
          .model_type("state_dict")
          .submodel(submodel);
      ok = run_model(cache, request) && ok;
    }
  }

  if (execution_device.is_cuda()) {
    std::cout << "peak " << execution_device << " memory: "
              << readable_size(memory::max_memory_allocated(execution_device))
              << " of "
              << readable_size(memory::total_memory(execution_device))
              << std::endl;
  }
  std::cout << "cache size: " << cache.cache_size() << " GB" << std::endl;
  if (const CacheStats* stats = cache.stats()) {
    std::cout << "hits: " << stats->hits << ", misses: " << stats->misses
              << ", cleared: " << stats->cleared << ", high watermark: "
              << static_cast<double>(stats->high_watermark) / GB << " GB"
              << std::endl;
  }
  if (FLAGS_print_metrics) {
    std::cout << Metrics::Instance().GetString();
  }
  return ok ? 0 : 1;
}
