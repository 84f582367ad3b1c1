#include "overwriter.hh"

#include <gtest/gtest.h>

#include <sstream>
#include <string>

namespace dupescan {
namespace {

TEST(Overwriter, PlainStreamGetsOneLinePerMessage) {
  std::ostringstream os;
  overwriter_t out(os, false);
  out.write("group 1 of 2");
  out.write("group 2 of 2", true);
  EXPECT_EQ(os.str(), "group 1 of 2\ngroup 2 of 2\n");
}

TEST(Overwriter, TerminalRedrawsAndPadsShorterMessages) {
  std::ostringstream os;
  overwriter_t out(os, true);
  out.write("abcdef");
  out.write("xyz");
  out.write("done", true);
  EXPECT_EQ(os.str(), "\rabcdef\rxyz   \rdone  \n");
}

TEST(Overwriter, NewlineResetsPadding) {
  std::ostringstream os;
  overwriter_t out(os, true);
  out.write("long message", true);
  out.write("ab");
  EXPECT_EQ(os.str(), "\rlong message\n\rab");
}

TEST(Overwriter, RepeatedMessageIsWrittenOnce) {
  std::ostringstream os;
  overwriter_t out(os, false);
  out.write("group 2 of 2", true);
  out.write("group 2 of 2", true);
  EXPECT_EQ(os.str(), "group 2 of 2\n");
}

}  // namespace
}  // namespace dupescan
