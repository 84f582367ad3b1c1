#pragma once

#include <gtest/gtest.h>
#include <stdlib.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace dupescan::test {

// scratch directory removed at the end of each test
class scratch_test : public ::testing::Test {
 protected:
  std::filesystem::path dir;

  void SetUp() override {
    std::string tmpl =
        (std::filesystem::temp_directory_path() / "dupescan-XXXXXX").string();
    ASSERT_NE(::mkdtemp(tmpl.data()), nullptr);
    // canonical, as the walker hands it out
    dir = std::filesystem::canonical(tmpl);
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
  }

  std::filesystem::path write(const std::filesystem::path &name,
                              std::string_view content) {
    auto path = dir / name;
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), (std::streamsize)content.size());
    return path;
  }
};

}  // namespace dupescan::test
