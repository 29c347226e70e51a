#include <gtest/gtest.h>

#include <LineAssembler.hpp>

#include <string>
#include <string_view>
#include <vector>

using Lines = std::vector<std::string>;

TEST(LineAssemblerTests, SplitsOnNewline) {
  LineAssembler assembler;
  EXPECT_EQ(assembler.feed("ok\nX:1 Y:2\n"), (Lines{"ok", "X:1 Y:2"}));
  EXPECT_EQ(assembler.pendingBytes(), 0u);
}

TEST(LineAssemblerTests, JoinsLineSplitAcrossReads) {
  LineAssembler assembler;
  EXPECT_TRUE(assembler.feed("X:1 Y").empty());
  EXPECT_EQ(assembler.pendingBytes(), 5u);
  EXPECT_EQ(assembler.feed(":2\r\n"), (Lines{"X:1 Y:2"}));
}

TEST(LineAssemblerTests, DropsBlankLinesAndTrimsWhitespace) {
  LineAssembler assembler;
  EXPECT_EQ(assembler.feed("\n\r\n   \n  ok \r\n"), (Lines{"ok"}));
}

TEST(LineAssemblerTests, StripsNulBytes) {
  LineAssembler assembler;
  constexpr std::string_view bytes{"\0ok\0\n", 5};
  EXPECT_EQ(assembler.feed(bytes), (Lines{"ok"}));
}

TEST(LineAssemblerTests, FlushesOverlongLine) {
  LineAssembler assembler(8);
  EXPECT_EQ(assembler.feed("123456789\n"), (Lines{"12345678", "9"}));
}

TEST(LineAssemblerTests, ResetDiscardsPartialLine) {
  LineAssembler assembler;
  EXPECT_TRUE(assembler.feed("garbage").empty());
  assembler.reset();
  EXPECT_EQ(assembler.pendingBytes(), 0u);
  EXPECT_EQ(assembler.feed("ok\n"), (Lines{"ok"}));
}
