#include "size_classifier.hh"

#include <gtest/gtest.h>

#include <string>

#include "test_util.hh"

namespace dupescan {
namespace {

namespace fs = std::filesystem;

class SizeClassifier : public test::scratch_test {};

TEST_F(SizeClassifier, ReturnsByteSize) {
  auto path = write("a", std::string(100, 'a'));
  EXPECT_EQ(size_key(path, 25), 100U);
  EXPECT_EQ(size_key(path, 100), 100U);
}

TEST_F(SizeClassifier, SmallFilesHaveNoKey) {
  auto small = write("small", std::string(24, 'a'));
  auto empty = write("empty", "");
  EXPECT_EQ(size_key(small, 25), std::nullopt);
  EXPECT_EQ(size_key(empty, 1), std::nullopt);
  EXPECT_EQ(size_key(empty, 0), 0U);
}

TEST_F(SizeClassifier, SymlinksAreNeverClassified) {
  auto target = write("target", std::string(100, 'a'));
  auto link = dir / "link";
  fs::create_symlink(target, link);
  EXPECT_EQ(size_key(link, 0), std::nullopt);
}

TEST_F(SizeClassifier, DirectoriesHaveNoKey) {
  fs::create_directory(dir / "sub");
  EXPECT_EQ(size_key(dir / "sub", 0), std::nullopt);
}

TEST_F(SizeClassifier, VanishedFileThrows) {
  EXPECT_THROW(size_key(dir / "missing", 0), fs::filesystem_error);
}

}  // namespace
}  // namespace dupescan
