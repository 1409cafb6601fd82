#include "state_dict_model.h"

#include <gtest/gtest.h>
#include <torch/torch.h>

#include <filesystem>
#include <string>
#include <utility>

#include "state_dict_model_provider.h"

namespace mcache {

namespace {
std::unordered_map<std::string, torch::Tensor> make_weights() {
  return {{"linear.weight", torch::ones({4, 8}, torch::kFloat32)},
          {"linear.bias", torch::zeros({4}, torch::kFloat32)},
          {"embedding.weight", torch::ones({16, 8}, torch::kFloat16)}};
}
}  // namespace

TEST(StateDictModelTest, SizeAndDevice) {
  StateDictModel model(make_weights(), torch::kCPU);
  EXPECT_EQ(model.num_tensors(), 3);
  // 4*8*4 + 4*4 + 16*8*2
  EXPECT_EQ(model.size_in_bytes(), 128 + 16 + 256);
  EXPECT_TRUE(model.device().is_cpu());
  EXPECT_TRUE(model.movable());

  const auto bias = model.get_tensor("linear.bias");
  ASSERT_TRUE(bias.defined());
  EXPECT_EQ(bias.numel(), 4);
  EXPECT_FALSE(model.get_tensor("missing").defined());
}

TEST(StateDictModelTest, MoveToSameDevice) {
  StateDictModel model(make_weights(), torch::kCPU);
  model.to(torch::kCPU);
  EXPECT_TRUE(model.device().is_cpu());
  for (const auto& [name, tensor] : model) {
    EXPECT_TRUE(tensor.device().is_cpu()) << name;
  }
  EXPECT_EQ(model.size_in_bytes(), 400);
}

TEST(StateDictModelTest, EmptyModel) {
  StateDictModel model({}, torch::kCPU);
  EXPECT_EQ(model.size_in_bytes(), 0);
  EXPECT_TRUE(model.device().is_cpu());
}

TEST(StateDictModelTest, MoveToCuda) {
  if (!torch::cuda::is_available()) {
    GTEST_SKIP() << "CUDA not available";
  }
  StateDictModel model(make_weights(), torch::kCPU);
  model.to(torch::Device(torch::kCUDA, 0));
  EXPECT_TRUE(model.device().is_cuda());
  for (const auto& [name, tensor] : model) {
    EXPECT_TRUE(tensor.device().is_cuda()) << name;
  }
  model.to(torch::kCPU);
  EXPECT_TRUE(model.device().is_cpu());
}

TEST(StateDictModelTest, FailedMoveKeepsAllTensors) {
  if (!torch::cuda::is_available()) {
    GTEST_SKIP() << "CUDA not available";
  }
  auto weights = make_weights();
  for (int i = 0; i < 8; ++i) {
    weights.emplace("block." + std::to_string(i) + ".weight",
                    torch::ones({8, 8}, torch::kFloat32));
  }
  // a broadcast view that needs 16 TB once materialized on the device
  weights.emplace("huge.weight",
                  torch::ones({1}, torch::kFloat32).expand({int64_t(1) << 42}));
  StateDictModel model(std::move(weights), torch::kCPU);

  EXPECT_ANY_THROW(model.to(torch::Device(torch::kCUDA, 0)));
  EXPECT_TRUE(model.device().is_cpu());
  for (const auto& [name, tensor] : model) {
    EXPECT_TRUE(tensor.device().is_cpu()) << name;
  }

  // a later move starts from a consistent model
  EXPECT_ANY_THROW(model.to(torch::Device(torch::kCUDA, 0)));
  EXPECT_TRUE(model.device().is_cpu());
  model.to(torch::kCPU);
  EXPECT_TRUE(model.device().is_cpu());
}

TEST(StateDictModelTest, MoveToMissingDeviceKeepsModel) {
  if (torch::cuda::is_available()) {
    GTEST_SKIP() << "CUDA available";
  }
  StateDictModel model(make_weights(), torch::kCPU);
  EXPECT_ANY_THROW(model.to(torch::Device(torch::kCUDA, 0)));
  EXPECT_TRUE(model.device().is_cpu());
  EXPECT_EQ(model.num_tensors(), 3);
  for (const auto& [name, tensor] : model) {
    EXPECT_TRUE(tensor.device().is_cpu()) << name;
  }
  EXPECT_EQ(model.size_in_bytes(), 400);
}

TEST(StateDictModelProviderTest, WeightsFile) {
  const auto root = std::filesystem::temp_directory_path() /
                    "state_dict_model_provider_test";
  std::filesystem::remove_all(root);
  std::filesystem::create_directories(root / "sd" / "vae");

  StateDictModelProvider file_provider((root / "weights.pt").string());
  EXPECT_EQ(file_provider.weights_file(std::nullopt), root / "weights.pt");
  // nothing on storage yet
  EXPECT_EQ(file_provider.get_size(std::nullopt), 0);

  StateDictModelProvider dir_provider((root / "sd").string());
  EXPECT_EQ(dir_provider.weights_file(std::nullopt), root / "sd" / "model.pt");
  EXPECT_EQ(dir_provider.weights_file("vae"),
            root / "sd" / "vae" / "model.pt");

  std::filesystem::remove_all(root);
}

}  // namespace mcache
