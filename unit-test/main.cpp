#include <glog/logging.h>
#include <unistd.h>
#include <filesystem>
#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "judgecell/config.hpp"

class GlobalEnv : public ::testing::Environment {
 public:
  virtual void SetUp() {
    if (getenv("DEBUG")) judgecell::DEBUG = true;

    judgecell::RUN_DIR = std::filesystem::temp_directory_path() / ("judgecell-test-" + std::to_string(getpid()));
    std::filesystem::create_directories(judgecell::RUN_DIR / "tasks");
    std::filesystem::create_directories(judgecell::RUN_DIR / "sandboxes");
  }
  virtual void TearDown() {
    if (!judgecell::DEBUG) std::filesystem::remove_all(judgecell::RUN_DIR);
  }
};

int main(int argc, char *argv[]) {
  google::InitGoogleLogging(argv[0]);
  AddGlobalTestEnvironment(new GlobalEnv);
  ::testing::InitGoogleMock(&argc, argv);
  return RUN_ALL_TESTS();
}
