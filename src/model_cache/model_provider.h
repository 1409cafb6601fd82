#pragma once
#include <c10/core/Device.h>
#include <c10/core/ScalarType.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "cached_model.h"
#include "common/macros.h"

namespace mcache {

// identifies the model requested from the cache
struct ModelRequest {
  // path of the model on storage, file or directory
  DEFINE_ARG(std::string, model_path);

  // model family and kind, passed through to the provider factory
  DEFINE_ARG(std::string, base_model);
  DEFINE_ARG(std::string, model_type);

  // optional component of a multi-part model, e.g. "unet" or "vae"
  DEFINE_ARG(std::optional<std::string>, submodel);
};

// Knows how to load the (sub)models stored under one model path.
// One provider is created per model path and kept for the process lifetime.
class ModelProvider {
 public:
  virtual ~ModelProvider() = default;

  // estimated number of bytes the (sub)model occupies once loaded
  virtual int64_t get_size(
      const std::optional<std::string>& submodel) const = 0;

  // load the (sub)model onto the given device with the given precision.
  // throws or returns nullptr on failure.
  virtual std::unique_ptr<CachedModel> get_model(
      const std::optional<std::string>& submodel,
      c10::ScalarType dtype,
      const c10::Device& device) = 0;
};

using ModelProviderFactory =
    std::function<std::unique_ptr<ModelProvider>(const ModelRequest& request)>;

}  // namespace mcache
