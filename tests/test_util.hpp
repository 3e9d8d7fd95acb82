/**
 * @file test_util.hpp
 * @brief Scratch directories and file helpers shared by the tests
 */

#ifndef NET_STAGE_TEST_UTIL_HPP
#define NET_STAGE_TEST_UTIL_HPP

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

#include <fmt/core.h>
#include <unistd.h>

namespace net_stage {
namespace test {

namespace fs = std::filesystem;

/// Write `size` bytes of a repeating pattern to `path`.
inline void write_file(const fs::path &path, size_t size, char fill = 'x') {
  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  std::string chunk(4096, fill);
  while (size > 0) {
    size_t n = std::min(size, chunk.size());
    out.write(chunk.data(), static_cast<std::streamsize>(n));
    size -= n;
  }
}

inline std::string read_file(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::string((std::istreambuf_iterator<char>(in)),
                     std::istreambuf_iterator<char>());
}

/**
 * @class ScratchDirTest
 * @brief Fixture owning a unique directory under the system temp directory.
 */
class ScratchDirTest : public ::testing::Test {
protected:
  void SetUp() override {
    static std::atomic<int> counter{0};
    const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
    root_ = fs::temp_directory_path() /
            fmt::format("net_stage_{}_{}_{}_{}", info->test_suite_name(),
                        info->name(), ::getpid(), counter++);
    fs::remove_all(root_);
    fs::create_directories(root_);
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }

  fs::path root_;
};

} // namespace test
} // namespace net_stage

#endif // NET_STAGE_TEST_UTIL_HPP
