#include "ls_dir_rec.hh"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <vector>

#include "test_util.hh"
#include "types.hh"

namespace dupescan {
namespace {

namespace fs = std::filesystem;

class GetPaths : public test::scratch_test {};

TEST_F(GetPaths, WalksRecursivelySkippingSymlinks) {
  auto a = write("a", "a");
  auto b = write("x/b", "b");
  auto c = write("x/y/c", "c");
  fs::create_symlink(a, dir / "x/link");
  fs::create_directory_symlink(dir / "x", dir / "dirlink");

  auto paths = get_paths({dir}, {});
  EXPECT_EQ(paths, (std::vector<fs::path>{a, b, c}));
}

TEST_F(GetPaths, ExcludedDirectoriesAreNotEntered) {
  auto keep = write("src/keep.txt", "k");
  write(".git/objects/blob", "g");
  write("src/.git/HEAD", "h");
  write("build/out.o", "o");

  std::vector<std::string> excludes{"*/.git", "*/build/"};
  auto paths = get_paths({dir}, excludes);
  EXPECT_EQ(paths, (std::vector<fs::path>{keep}));
}

TEST_F(GetPaths, ExcludesMatchFilesByGlob) {
  auto keep = write("a.txt", "a");
  write("b.tmp", "b");
  write("sub/c.tmp", "c");
  auto paths = get_paths({dir}, {"*.tmp"});
  EXPECT_EQ(paths, (std::vector<fs::path>{keep}));
}

TEST_F(GetPaths, FileRootIgnoresExcludes) {
  auto tmp = write("b.tmp", "b");
  auto paths = get_paths({tmp}, {"*.tmp"});
  EXPECT_EQ(paths, (std::vector<fs::path>{tmp}));
}

TEST_F(GetPaths, OverlappingRootsDoNotRepeatFiles) {
  auto a = write("a", "a");
  auto b = write("sub/b", "b");
  auto paths = get_paths({dir, dir / "sub", dir / "sub/../sub", b}, {});
  EXPECT_EQ(paths, (std::vector<fs::path>{a, b}));
}

TEST_F(GetPaths, RelativeRootsBecomeAbsolute) {
  auto a = write("a", "a");
  const auto cwd = fs::current_path();
  fs::current_path(dir);
  auto paths = get_paths({"."}, {});
  fs::current_path(cwd);
  EXPECT_EQ(paths, (std::vector<fs::path>{a}));
}

TEST_F(GetPaths, MissingRootIsSkipped) {
  auto a = write("a", "a");
  auto paths = get_paths({dir / "missing", a}, {});
  EXPECT_EQ(paths, (std::vector<fs::path>{a}));
}

TEST(IsExcluded, StarMatchesAcrossSeparators) {
  EXPECT_TRUE(is_excluded("/home/u/project/.hg", {"*/.hg"}));
  EXPECT_TRUE(is_excluded("/a/b/c.o", {"*.o"}));
  EXPECT_FALSE(is_excluded("/a/b/c.oo", {"*.o"}));
  EXPECT_FALSE(is_excluded("/a/b/c", {}));
}

TEST_F(GetPaths, CancelFlagAbortsWalk) {
  write("a", "a");
  write("sub/b", "b");
  std::atomic<bool> cancel{true};
  EXPECT_THROW(get_paths({dir}, {}, 2, &cancel), cancelled_error);
}

TEST(AddExclude, DashDropsEverythingBeforeIt) {
  std::vector<std::string> excludes{"*/.git", "*/.hg"};
  add_exclude(excludes, "*.o");
  add_exclude(excludes, "-");
  EXPECT_TRUE(excludes.empty());
  add_exclude(excludes, "*.tmp");
  EXPECT_EQ(excludes, (std::vector<std::string>{"*.tmp"}));

  std::vector<std::string> defaults{"*/.git"};
  add_exclude(defaults, "-");
  EXPECT_TRUE(defaults.empty());
}

}  // namespace
}  // namespace dupescan
