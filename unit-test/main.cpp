#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <spdlog/spdlog.h>

#include <cstdlib>

class GlobalEnv : public ::testing::Environment {
 public:
  void SetUp() override {
    if (std::getenv("DEBUG")) {
      spdlog::set_level(spdlog::level::debug);
    } else {
      spdlog::set_level(spdlog::level::warn);
    }
  }
  void TearDown() override {
    //  Stub
  }
};

int main(int argc, char *argv[]) {
  ::testing::AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
