#include "state_dict_model_provider.h"

#include <glog/logging.h>
#include <torch/torch.h>

#include <filesystem>

#include "common/torch_utils.h"
#include "state_dict_model.h"

namespace mcache {

namespace {
constexpr char kWeightsFileName[] = "model.pt";
}  // namespace

StateDictModelProvider::StateDictModelProvider(std::string model_path)
    : model_path_(std::move(model_path)) {}

std::unique_ptr<ModelProvider> StateDictModelProvider::create(
    const ModelRequest& request) {
  return std::make_unique<StateDictModelProvider>(request.model_path());
}

std::filesystem::path StateDictModelProvider::weights_file(
    const std::optional<std::string>& submodel) const {
  if (submodel.has_value() && !submodel->empty()) {
    return model_path_ / submodel.value() / kWeightsFileName;
  }
  if (std::filesystem::is_directory(model_path_)) {
    return model_path_ / kWeightsFileName;
  }
  return model_path_;
}

int64_t StateDictModelProvider::get_size(
    const std::optional<std::string>& submodel) const {
  std::error_code ec;
  const auto size = std::filesystem::file_size(weights_file(submodel), ec);
  if (ec) {
    // nothing to estimate, the load will report the error
    return 0;
  }
  return static_cast<int64_t>(size);
}

std::unique_ptr<CachedModel> StateDictModelProvider::get_model(
    const std::optional<std::string>& submodel,
    c10::ScalarType dtype,
    const c10::Device& device) {
  const auto file = weights_file(submodel);
  auto dict = load_state_dict_tensors(file.string(), torch::kCPU);

  torch::NoGradGuard no_grad;
  for (auto& [name, tensor] : dict) {
    if (tensor.is_floating_point()) {
      tensor = tensor.to(dtype);
    }
    tensor = tensor.to(device);
  }
  VLOG(1) << "Loaded " << dict.size() << " tensors from " << file;
  return std::make_unique<StateDictModel>(std::move(dict), device);
}

}  // namespace mcache
