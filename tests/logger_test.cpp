#include "../include/logger.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

#include "../include/config.hpp"
#include "../include/heap_allocator.hpp"

using namespace mapikit;

namespace {

std::string read_file(const std::filesystem::path& path) {
  spdlog::default_logger()->flush();
  std::ifstream in(path);
  std::stringstream contents;
  contents << in.rdbuf();
  return contents.str();
}

}  // namespace

class LoggerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const std::string test_name =
        ::testing::UnitTest::GetInstance()->current_test_info()->name();
    log_path = std::filesystem::temp_directory_path() /
               ("mapikit_logger_" + test_name + ".log");
    configure_logging(make_logging_config()
                          .with_level(LogLevel::DEBUG)
                          .with_log_file(log_path.string())
                          .build());
  }

  void TearDown() override {
    Logger::getInstance().setLevel(defaults::LOG_LEVEL);
    std::filesystem::remove(log_path);
  }

  std::filesystem::path log_path;
};

TEST_F(LoggerTest, ConfiguresLevel) {
  EXPECT_EQ(Logger::getInstance().getLevel(), LogLevel::DEBUG);
  EXPECT_TRUE(Logger::getInstance().isDebugEnabled());

  Logger::getInstance().setLevel(LogLevel::WARN);
  EXPECT_EQ(Logger::getInstance().getLevel(), LogLevel::WARN);
  EXPECT_FALSE(Logger::getInstance().isDebugEnabled());
}

TEST_F(LoggerTest, MessagesCarrySourceLocation) {
  log_info("allocator ready with {} roots", 0);
  const std::string contents = read_file(log_path);
  EXPECT_NE(contents.find("allocator ready with 0 roots"), std::string::npos);
  EXPECT_NE(contents.find("[logger_test.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, ContextLoggerPrefixesSubsystem) {
  HeapAllocator heap(make_heap_config().with_trace_calls(true).build());
  void* block = nullptr;
  ASSERT_EQ(heap.allocate_buffer(16, &block), foreign_status::S_OK);
  ASSERT_EQ(heap.free_buffer(block), foreign_status::S_OK);

  const std::string contents = read_file(log_path);
  EXPECT_NE(contents.find("heap: allocate_buffer(16)"), std::string::npos);
  EXPECT_NE(contents.find("[heap_allocator.cpp:"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltersMessages) {
  Logger::getInstance().setLevel(LogLevel::WARN);
  log_debug("hidden debug line");
  log_warn("visible warning line");

  const std::string contents = read_file(log_path);
  EXPECT_EQ(contents.find("hidden debug line"), std::string::npos);
  EXPECT_NE(contents.find("visible warning line"), std::string::npos);
}

TEST_F(LoggerTest, DoubleFreeIsLoggedAsError) {
  HeapAllocator heap;
  void* block = nullptr;
  ASSERT_EQ(heap.allocate_buffer(8, &block), foreign_status::S_OK);
  ASSERT_EQ(heap.free_buffer(block), foreign_status::S_OK);
  EXPECT_EQ(heap.free_buffer(block), foreign_status::E_INVALIDARG);

  const std::string contents = read_file(log_path);
  EXPECT_NE(contents.find("[error]"), std::string::npos);
  EXPECT_NE(contents.find("free_buffer on unknown or already freed root"),
            std::string::npos);
}
