#include "stream_hasher.hh"

#include <gtest/gtest.h>

#include <atomic>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

#include "test_util.hh"

namespace dupescan {
namespace {

namespace fs = std::filesystem;

std::string hex(const digest_t &md) {
  std::ostringstream ss;
  for (auto byte : md) {
    ss << std::hex << std::setw(2) << std::setfill('0') << (int)byte;
  }
  return ss.str();
}

class StreamHasher : public test::scratch_test {
 protected:
  const EVP_MD *sha1 = digest_by_name("sha1");
};

TEST_F(StreamHasher, KnownSha1Digests) {
  EXPECT_EQ(hex(hash_file(write("abc", "abc"), sha1)),
            "a9993e364706816aba3e25717850c26c9cd0d89d");
  EXPECT_EQ(hex(hash_file(write("empty", ""), sha1)),
            "da39a3ee5e6b4b0d3255bfef95601890afd80709");
}

TEST_F(StreamHasher, ChunkSizeDoesNotChangeFullDigest) {
  auto path = write("data", std::string(100000, 'q') + "tail");
  const auto whole = hash_file(path, sha1);
  EXPECT_EQ(hash_file(path, sha1, std::nullopt, 7), whole);
  EXPECT_EQ(hash_file(path, sha1, std::nullopt, 1 << 20), whole);
}

TEST_F(StreamHasher, HeaderHashIgnoresDataPastLimit) {
  std::string prefix(head_sz, '\0');
  auto lhs = write("lhs", prefix + "1");
  auto rhs = write("rhs", prefix + "2");
  EXPECT_EQ(hash_file(lhs, sha1, head_sz), hash_file(rhs, sha1, head_sz));
  EXPECT_NE(hash_file(lhs, sha1), hash_file(rhs, sha1));
}

TEST_F(StreamHasher, LimitRoundsUpToWholeRead) {
  // reads of 4 bytes, limit 10: 12 bytes are consumed
  auto base = write("base", "0123456789abcdef");
  auto diff_11 = write("diff11", "0123456789aXcdef");
  auto diff_12 = write("diff12", "0123456789abXdef");
  const auto head = hash_file(base, sha1, 10, 4);
  EXPECT_NE(hash_file(diff_11, sha1, 10, 4), head);
  EXPECT_EQ(hash_file(diff_12, sha1, 10, 4), head);
}

TEST_F(StreamHasher, DigestMustCoverOneHundredSixtyBits) {
  EXPECT_THROW(digest_by_name("md5"), std::invalid_argument);
  EXPECT_THROW(digest_by_name("no-such-digest"), std::invalid_argument);
  const EVP_MD *sha256 = digest_by_name("sha256");
  ASSERT_NE(sha256, nullptr);
  EXPECT_EQ(hash_file(write("abc", "abc"), sha256).size(), 32U);
}

TEST_F(StreamHasher, MissingFileThrows) {
  EXPECT_THROW(hash_file(dir / "missing", sha1), fs::filesystem_error);
}

TEST_F(StreamHasher, ZeroLimitIsMisuse) {
  EXPECT_THROW(hash_file(write("abc", "abc"), sha1, 0), std::invalid_argument);
}

TEST(Hasher, ResetStartsOver) {
  hasher_t hasher(digest_by_name("sha1"));
  hasher.update("xyz", 3);
  hasher.reset();
  hasher.update("abc", 3);
  const auto md = hasher.digest();
  ASSERT_EQ(md.size(), 20U);
  EXPECT_EQ(md[0], 0xa9);
  EXPECT_EQ(md[19], 0x9d);
}

TEST_F(StreamHasher, CancelFlagStopsBetweenChunks) {
  auto big = write("big", std::string(4 * chunk_sz, 'c'));
  std::atomic<bool> cancel{true};
  EXPECT_THROW(hash_file(big, sha1, std::nullopt, chunk_sz, &cancel),
               cancelled_error);
  std::atomic<bool> go{false};
  EXPECT_EQ(hash_file(big, sha1, std::nullopt, chunk_sz, &go),
            hash_file(big, sha1));
}

}  // namespace
}  // namespace dupescan
