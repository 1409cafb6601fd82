#include <gflags/gflags.h>
#include <glog/logging.h>
#include <gtest/gtest.h>

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  // flags left after gtest, e.g. --v=2 for verbose cache traces
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);
  // death tests re-run the binary, keep their output on stderr
  FLAGS_logtostderr = true;
  return RUN_ALL_TESTS();
}
