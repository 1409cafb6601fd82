#include "torch_utils.h"

#include <caffe2/serialize/inline_container.h>
#include <glog/logging.h>
#include <torch/csrc/jit/serialization/import_read.h>
#include <torch/cuda.h>
#include <torch/torch.h>

#include <boost/algorithm/string.hpp>

namespace mcache {

std::unordered_map<std::string, torch::Tensor> load_state_dict_tensors(
    const std::string& weights_file,
    const torch::Device& device) {
  caffe2::serialize::PyTorchStreamReader reader(weights_file);
  const auto archive =
      torch::jit::readArchiveAndTensors("data",
                                        /*pickle_prefix=*/"",
                                        /*tensor_prefix=*/"",
                                        /*type_resolver=*/c10::nullopt,
                                        /*obj_loader=*/c10::nullopt,
                                        device,
                                        reader);
  TORCH_CHECK(archive.isGenericDict(),
              weights_file,
              " does not hold a state dict");

  std::unordered_map<std::string, torch::Tensor> tensors;
  for (const auto& item : archive.toGenericDict()) {
    if (!item.key().isString() || !item.value().isTensor()) {
      VLOG(2) << "Skipping non tensor entry in " << weights_file;
      continue;
    }
    tensors.emplace(item.key().toStringRef(), item.value().toTensor());
  }
  return tensors;
}

torch::Device parse_device(const std::string& device_str) {
  if (device_str.empty() || boost::iequals(device_str, "auto")) {
    return torch::cuda::is_available() ? torch::Device(torch::kCUDA, 0)
                                       : torch::Device(torch::kCPU);
  }
  return torch::Device(device_str);
}

torch::ScalarType parse_dtype(const std::string& dtype_str,
                              const torch::Device& device) {
  if (device.is_cpu()) {
    // half precision kernels are missing on cpu
    LOG_IF(WARNING,
           !dtype_str.empty() && !boost::iequals(dtype_str, "auto") &&
               !boost::iequals(dtype_str, "float") &&
               !boost::iequals(dtype_str, "float32"))
        << "Precision " << dtype_str << " is not supported on " << device
        << ", using float32 instead";
    return torch::kFloat32;
  }
  if (boost::iequals(dtype_str, "half") ||
      boost::iequals(dtype_str, "float16")) {
    return torch::kHalf;
  }
  if (boost::iequals(dtype_str, "bfloat16")) {
    return torch::kBFloat16;
  }
  if (boost::iequals(dtype_str, "float") ||
      boost::iequals(dtype_str, "float32")) {
    return torch::kFloat32;
  }
  if (dtype_str.empty() || boost::iequals(dtype_str, "auto")) {
    return torch::kHalf;
  }
  LOG(FATAL) << "Unsupported dtype: " << dtype_str << " on device " << device;
  __builtin_unreachable();
}

}  // namespace mcache
