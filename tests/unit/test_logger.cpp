#include "../test_utils/TestFixtures.hpp"
#include "analog-bench/Logger.hpp"

#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

namespace analogbench {
namespace test {

class LoggerTest : public LoggedTest {
protected:
  void TearDown() override {
    BenchLogger::instance().init("test.log", spdlog::level::debug);
  }

  static std::string log_contents() {
    std::ifstream in("test.log");
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }
};

TEST_F(LoggerTest, LinesAreTaggedWithDeviceAndOperation) {
  LOG_INFO("LOGTEST", "TAG", "value {} of {}", 3, "ten");
  EXPECT_NE(log_contents().find("[LOGTEST] [TAG] value 3 of ten"),
            std::string::npos);
}

TEST_F(LoggerTest, SecondInitOnlyChangesLevel) {
  BenchLogger::instance().init("other.log", spdlog::level::warn);
  LOG_INFO("LOGTEST", "FILTERED", "below the level");
  LOG_WARN("LOGTEST", "KEPT", "at the level");

  auto contents = log_contents();
  EXPECT_EQ(contents.find("[LOGTEST] [FILTERED]"), std::string::npos);
  EXPECT_NE(contents.find("[LOGTEST] [KEPT] at the level"), std::string::npos);
  EXPECT_FALSE(std::ifstream("other.log").good());
}

} // namespace test
} // namespace analogbench
