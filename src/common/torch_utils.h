#pragma once
#include <torch/torch.h>

#include <string>
#include <unordered_map>

namespace mcache {

// read the tensors of a pickled state dict, i.e. torch.save(model.state_dict())
// throws c10::Error if the file is missing or not a zip archive of tensors.
std::unordered_map<std::string, torch::Tensor> load_state_dict_tensors(
    const std::string& weights_file,
    const torch::Device& device = torch::kCPU);

// "auto" or "" picks cuda:0 when available, cpu otherwise
torch::Device parse_device(const std::string& device_str);

// half, float16, bfloat16, float, float32, or "auto"/"" for half.
// cpu always uses float32, other precisions are overridden with a warning.
torch::ScalarType parse_dtype(const std::string& dtype_str,
                              const torch::Device& device);

}  // namespace mcache
