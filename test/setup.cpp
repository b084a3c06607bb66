#include <gtest/gtest.h>
#include <spdlog/spdlog.h>
#include <noj/paths.h>
#include <noj/logger.h>

#include "utils.h"

spdlog::level::level_enum log_level;

class MyEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    InitLogger(log_level);
    spdlog::set_pattern("[%P] %+");
    kDataDir = ScratchDir();
    fs::create_directories(kDataDir);
  }
  void TearDown() override {
    fs::remove_all(ScratchDir());
  }
};

testing::Environment* const my_env = testing::AddGlobalTestEnvironment(new MyEnvironment);

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  log_level = spdlog::level::warn;
  if (argc > 1) {
    if (std::string("-v") == argv[1]) log_level = spdlog::level::info;
    if (std::string("-vv") == argv[1]) log_level = spdlog::level::debug;
  }
  return RUN_ALL_TESTS();
}
