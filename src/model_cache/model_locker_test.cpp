#include "model_locker.h"

#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "model_cache.h"
#include "test_utils.h"

namespace mcache {

using test::FakeAccelerator;
using test::FakeDeviceMemory;
using test::FakeModelFactory;
using test::GB;
using test::TempModelDir;

class ModelLockerTest : public ::testing::Test {
 protected:
  ModelLockerTest() : models_(&gpu_) {}

  void create_cache(double max_vram_cache_size, bool lazy_offloading) {
    ModelCache::Options options;
    options.max_cache_size(16)
        .max_vram_cache_size(max_vram_cache_size)
        .execution_device(torch::kCUDA)
        .storage_device(torch::kCPU)
        .lazy_offloading(lazy_offloading);
    cache_ = std::make_unique<ModelCache>(
        options, std::make_unique<FakeDeviceMemory>(&gpu_));
  }

  std::string add_model(const std::string& name, int64_t size) {
    const std::string path = dir_.add(name);
    models_.set_size(path, size);
    return path;
  }

  std::unique_ptr<ModelLocker> get(const std::string& path, bool gpu_load) {
    ModelRequest request;
    request.model_path(path).base_model("sd-1").model_type("main");
    std::unique_ptr<ModelLocker> locker;
    EXPECT_TRUE(cache_->get(request, models_.factory(), gpu_load, &locker).ok());
    return locker;
  }

  std::shared_ptr<CacheRecord> record(const std::string& path) {
    return cache_->registry().find(ModelCache::get_key(path));
  }

  FakeAccelerator gpu_;
  FakeModelFactory models_;
  TempModelDir dir_;
  std::unique_ptr<ModelCache> cache_;
};

TEST_F(ModelLockerTest, AcquireAndRelease) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);

  auto locker = get(a, /*gpu_load=*/true);
  EXPECT_FALSE(locker->acquired());
  EXPECT_EQ(record(a)->lock_count(), 0);

  ASSERT_TRUE(locker->acquire().ok());
  EXPECT_TRUE(locker->acquired());
  EXPECT_TRUE(locker->locked());
  EXPECT_TRUE(locker->model()->device().is_cuda());
  EXPECT_EQ(record(a)->lock_count(), 1);

  ASSERT_TRUE(locker->release().ok());
  EXPECT_FALSE(locker->locked());
  EXPECT_EQ(record(a)->lock_count(), 0);
  // lazy offloading keeps the model on the accelerator
  EXPECT_TRUE(locker->model()->device().is_cuda());

  // a second release is a no-op
  ASSERT_TRUE(locker->release().ok());
  EXPECT_EQ(record(a)->lock_count(), 0);
}

TEST_F(ModelLockerTest, DestructorReleases) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);
  {
    auto locker = get(a, /*gpu_load=*/true);
    ASSERT_TRUE(locker->acquire().ok());
    EXPECT_EQ(record(a)->lock_count(), 1);
  }
  EXPECT_EQ(record(a)->lock_count(), 0);
}

TEST_F(ModelLockerTest, ReleasedWhenWorkThrows) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);

  auto work = [&]() {
    auto locker = get(a, /*gpu_load=*/true);
    ASSERT_TRUE(locker->acquire().ok());
    throw std::runtime_error("out of memory in the middle of work");
  };
  EXPECT_THROW(work(), std::runtime_error);
  EXPECT_EQ(record(a)->lock_count(), 0);
}

TEST_F(ModelLockerTest, NestedLockers) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);

  auto outer = get(a, /*gpu_load=*/true);
  auto inner = get(a, /*gpu_load=*/true);
  ASSERT_TRUE(outer->acquire().ok());
  ASSERT_TRUE(inner->acquire().ok());
  EXPECT_EQ(record(a)->lock_count(), 2);
  EXPECT_EQ(outer->model(), inner->model());
  // promoted once
  EXPECT_EQ(gpu_.num_transfers, 1);

  inner.reset();
  EXPECT_EQ(record(a)->lock_count(), 1);
  outer.reset();
  EXPECT_EQ(record(a)->lock_count(), 0);
}

TEST_F(ModelLockerTest, FailedAcquireDoesNotLeakLock) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);

  auto locker = get(a, /*gpu_load=*/true);
  gpu_.fail_transfers = true;
  const Status status = locker->acquire();
  EXPECT_EQ(status.code(), StatusCode::TRANSFER_FAILED);
  EXPECT_FALSE(locker->acquired());
  EXPECT_FALSE(locker->locked());
  EXPECT_EQ(record(a)->lock_count(), 0);
  EXPECT_TRUE(cache_->registry().contains(ModelCache::get_key(a)));

  // retry from scratch
  gpu_.fail_transfers = false;
  ASSERT_TRUE(locker->acquire().ok());
  EXPECT_EQ(record(a)->lock_count(), 1);
}

TEST_F(ModelLockerTest, EagerReleaseOffloads) {
  create_cache(/*max_vram_cache_size=*/0.5, /*lazy_offloading=*/false);
  const auto a = add_model("a", GB);

  auto locker = get(a, /*gpu_load=*/true);
  ASSERT_TRUE(locker->acquire().ok());
  EXPECT_EQ(cache_->residency_manager().vram_in_use(), GB);

  ASSERT_TRUE(locker->release().ok());
  EXPECT_FALSE(locker->model()->device().is_cuda());
  EXPECT_LE(cache_->residency_manager().vram_in_use(), GB / 2);
}

TEST_F(ModelLockerTest, EagerReleaseKeepsOtherLockedModels) {
  create_cache(/*max_vram_cache_size=*/0.5, /*lazy_offloading=*/false);
  const auto a = add_model("a", GB);
  const auto b = add_model("b", GB);

  auto locker_a = get(a, /*gpu_load=*/true);
  auto locker_b = get(b, /*gpu_load=*/true);
  ASSERT_TRUE(locker_a->acquire().ok());
  ASSERT_TRUE(locker_b->acquire().ok());

  ASSERT_TRUE(locker_a->release().ok());
  EXPECT_FALSE(locker_a->model()->device().is_cuda());
  EXPECT_TRUE(locker_b->model()->device().is_cuda());
}

TEST_F(ModelLockerTest, ZeroReserveOffloadsOnRelease) {
  // lazy offloading is turned off without a reserve
  create_cache(/*max_vram_cache_size=*/0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);

  auto locker = get(a, /*gpu_load=*/true);
  ASSERT_TRUE(locker->acquire().ok());
  EXPECT_TRUE(locker->model()->device().is_cuda());
  ASSERT_TRUE(locker->release().ok());
  EXPECT_EQ(cache_->residency_manager().vram_in_use(), 0);
}

TEST_F(ModelLockerTest, CpuAccessDemotesIdleModel) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);
  {
    auto locker = get(a, /*gpu_load=*/true);
    ASSERT_TRUE(locker->acquire().ok());
  }
  EXPECT_TRUE(record(a)->loaded());

  auto locker = get(a, /*gpu_load=*/false);
  ASSERT_TRUE(locker->acquire().ok());
  EXPECT_FALSE(locker->locked());
  EXPECT_EQ(record(a)->lock_count(), 0);
  EXPECT_FALSE(record(a)->loaded());
}

TEST_F(ModelLockerTest, CpuAccessLeavesLockedModel) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);

  auto gpu_locker = get(a, /*gpu_load=*/true);
  ASSERT_TRUE(gpu_locker->acquire().ok());

  auto cpu_locker = get(a, /*gpu_load=*/false);
  ASSERT_TRUE(cpu_locker->acquire().ok());
  EXPECT_TRUE(record(a)->loaded());
  EXPECT_EQ(record(a)->lock_count(), 1);
}

TEST_F(ModelLockerTest, CpuAccessIgnoresOffloadFailure) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);
  {
    auto locker = get(a, /*gpu_load=*/true);
    ASSERT_TRUE(locker->acquire().ok());
  }

  gpu_.fail_transfers = true;
  auto locker = get(a, /*gpu_load=*/false);
  EXPECT_TRUE(locker->acquire().ok());
  EXPECT_TRUE(record(a)->loaded());
}

TEST_F(ModelLockerTest, ImmovableModel) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);
  models_.set_movable(false);

  auto locker = get(a, /*gpu_load=*/true);
  ASSERT_TRUE(locker->acquire().ok());
  EXPECT_FALSE(locker->locked());
  EXPECT_EQ(record(a)->lock_count(), 0);
  EXPECT_EQ(gpu_.num_transfers, 0);
}

TEST_F(ModelLockerTest, AcquireTwiceIsFatal) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);

  auto locker = get(a, /*gpu_load=*/true);
  ASSERT_TRUE(locker->acquire().ok());
  EXPECT_DEATH(locker->acquire(), "is already acquired");
}

TEST_F(ModelLockerTest, UntrackedWhileLocked) {
  create_cache(/*max_vram_cache_size=*/2.0, /*lazy_offloading=*/true);
  const auto a = add_model("a", GB);

  auto locker = get(a, /*gpu_load=*/true);
  ASSERT_TRUE(locker->acquire().ok());
  cache_->untrack(locker->key());
  EXPECT_FALSE(cache_->registry().contains(ModelCache::get_key(a)));

  // the model stays usable until the locker is gone
  EXPECT_EQ(locker->model()->size_in_bytes(), GB);
  EXPECT_TRUE(locker->release().ok());
}

}  // namespace mcache
