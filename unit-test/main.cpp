#include <glog/logging.h>
#include <filesystem>
#include "config.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    tci::EXEC_DIR = std::filesystem::path(TCI_SOURCE_DIR) / "exec";
    tci::SANDBOX_DIR = std::filesystem::temp_directory_path() / "tci-test-sandbox";
    std::filesystem::create_directories(tci::SANDBOX_DIR);
    tci::DEBUG = false;
  }
  virtual void TearDown() {
    std::error_code ec;
    std::filesystem::remove_all(tci::SANDBOX_DIR, ec);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
