#include "state_dict_model.h"

#include <glog/logging.h>
#include <torch/torch.h>

#include <utility>

namespace mcache {

StateDictModel::StateDictModel(
    std::unordered_map<std::string, torch::Tensor> dict,
    const torch::Device& device)
    : dict_(std::move(dict)), device_(device) {
  for (const auto& [name, tensor] : dict_) {
    CHECK(tensor.defined()) << "Undefined tensor " << name;
    CHECK(tensor.device() == device_)
        << "Tensor " << name << " is on " << tensor.device() << ", expected "
        << device_;
  }
}

c10::Device StateDictModel::device() const {
  if (dict_.empty()) {
    return device_;
  }
  return dict_.begin()->second.device();
}

void StateDictModel::to(const c10::Device& device) {
  torch::NoGradGuard no_grad;
  // the model stays where it was if any tensor fails to move, e.g. on OOM
  std::unordered_map<std::string, torch::Tensor> moved;
  moved.reserve(dict_.size());
  for (const auto& [name, tensor] : dict_) {
    moved.emplace(name, tensor.to(device));
  }
  dict_ = std::move(moved);
  device_ = device;
}

int64_t StateDictModel::size_in_bytes() const {
  int64_t size = 0;
  for (const auto& [name, tensor] : dict_) {
    size += static_cast<int64_t>(tensor.nbytes());
  }
  return size;
}

torch::Tensor StateDictModel::get_tensor(const std::string& tensor_name) const {
  const auto it = dict_.find(tensor_name);
  if (it == dict_.end()) {
    return torch::Tensor{nullptr};
  }
  return it->second;
}

}  // namespace mcache
