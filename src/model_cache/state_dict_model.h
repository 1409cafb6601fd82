#pragma once
#include <torch/torch.h>

#include <string>
#include <unordered_map>

#include "cached_model.h"

namespace mcache {

// A model made of named tensors, e.g. the weights of a torch state dict.
// All tensors are kept on the same device.
class StateDictModel final : public CachedModel {
 public:
  StateDictModel(std::unordered_map<std::string, torch::Tensor> dict,
                 const torch::Device& device);

  // device of the tensors, falls back to the construction device when empty
  c10::Device device() const override;

  // move all tensors to the given device. throws if any tensor fails to move,
  // leaving every tensor on its previous device.
  void to(const c10::Device& device) override;

  // sum of nbytes of all tensors
  int64_t size_in_bytes() const override;

  // get the tensor with the given name. return undefined tensor if not found.
  torch::Tensor get_tensor(const std::string& tensor_name) const;

  size_t num_tensors() const { return dict_.size(); }

  // support range-based for loop
  auto begin() const { return dict_.begin(); }
  auto end() const { return dict_.end(); }

 private:
  std::unordered_map<std::string, torch::Tensor> dict_;

  torch::Device device_;
};

}  // namespace mcache
