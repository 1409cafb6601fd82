#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "model_provider.h"

namespace mcache {

// Provider for models saved as pickled torch state dicts.
// A model path is either a weights file, or a directory holding "model.pt"
// and one sub directory per submodel: <path>/<submodel>/model.pt
class StateDictModelProvider final : public ModelProvider {
 public:
  explicit StateDictModelProvider(std::string model_path);

  // factory usable with ModelCache::get
  static std::unique_ptr<ModelProvider> create(const ModelRequest& request);

  // size of the weights file on storage
  int64_t get_size(const std::optional<std::string>& submodel) const override;

  // floating point tensors are converted to dtype, others are kept as is
  std::unique_ptr<CachedModel> get_model(
      const std::optional<std::string>& submodel,
      c10::ScalarType dtype,
      const c10::Device& device) override;

  // path of the weights file for the (sub)model
  std::filesystem::path weights_file(
      const std::optional<std::string>& submodel) const;

 private:
  std::filesystem::path model_path_;
};

}  // namespace mcache
