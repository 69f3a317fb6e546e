#include <gtest/gtest.h>

#include "../src/parser/cursor.hpp"

TEST(CursorTest, PeekAndAdvance) {
  parser::Cursor cursor("ab");

  EXPECT_EQ(cursor.Peek(), 'a');
  cursor.Advance();
  EXPECT_EQ(cursor.Peek(), 'b');
  cursor.Advance(10);
  EXPECT_TRUE(cursor.AtEnd());
  EXPECT_EQ(cursor.Peek(), '\0');
  EXPECT_EQ(cursor.Position(), 2u);
}

TEST(CursorTest, ReadInt) {
  parser::Cursor cursor1("123abc");
  parser::Cursor cursor2("abc");
  parser::Cursor cursor3("99999999999999999999");

  auto result1 = cursor1.ReadInt();
  auto result2 = cursor2.ReadInt();
  auto result3 = cursor3.ReadInt();

  ASSERT_TRUE(result1.has_value());
  EXPECT_EQ(result1.value(), 123);
  EXPECT_EQ(cursor1.Rest(), "abc");

  EXPECT_FALSE(result2.has_value());
  EXPECT_EQ(cursor2.Position(), 0u);

  EXPECT_FALSE(result3.has_value());
}

TEST(CursorTest, ReadBracketBalanced) {
  parser::Cursor cursor("{a{b}c}x");

  auto content = cursor.ReadBracket('{', '}');

  ASSERT_TRUE(content.has_value());
  EXPECT_EQ(content.value(), "a{b}c");
  EXPECT_EQ(cursor.Rest(), "x");
}

TEST(CursorTest, ReadBracketUnbalanced) {
  parser::Cursor cursor1("{a{b}");
  parser::Cursor cursor2("a}");

  EXPECT_FALSE(cursor1.ReadBracket('{', '}').has_value());
  EXPECT_FALSE(cursor2.ReadBracket('{', '}').has_value());
}

TEST(CursorTest, ReadQuoted) {
  parser::Cursor cursor1("\"NSString\"i");
  parser::Cursor cursor2("\"open");

  auto result1 = cursor1.ReadQuoted();

  ASSERT_TRUE(result1.has_value());
  EXPECT_EQ(result1.value(), "NSString");
  EXPECT_EQ(cursor1.Rest(), "i");
  EXPECT_FALSE(cursor2.ReadQuoted().has_value());
}

TEST(CursorTest, ReadQuotedRemovesEscapes) {
  parser::Cursor cursor1("\"a\\\"b\\\\\"i");
  parser::Cursor cursor2("\"a\\");

  auto result1 = cursor1.ReadQuoted();

  ASSERT_TRUE(result1.has_value());
  EXPECT_EQ(result1.value(), "a\"b\\");
  EXPECT_EQ(cursor1.Rest(), "i");
  EXPECT_FALSE(cursor2.ReadQuoted().has_value());
}

TEST(CursorTest, SkipOneType) {
  parser::Cursor cursor("^{S=i}8rn^i16@?<v@?@\"NSError\">24@\"NSString\"i");

  EXPECT_EQ(cursor.SkipOneType(), "^{S=i}");
  EXPECT_EQ(cursor.ReadInt().value(), 8);
  EXPECT_EQ(cursor.SkipOneType(), "rn^i");
  EXPECT_EQ(cursor.ReadInt().value(), 16);
  EXPECT_EQ(cursor.SkipOneType(), "@?<v@?@\"NSError\">");
  EXPECT_EQ(cursor.ReadInt().value(), 24);
  EXPECT_EQ(cursor.SkipOneType(), "@\"NSString\"");
  EXPECT_EQ(cursor.SkipOneType(), "i");
  EXPECT_TRUE(cursor.AtEnd());
  EXPECT_EQ(cursor.SkipOneType(), "");
}

TEST(CursorTest, SkipOneTypeStopsAtEndOfUnclosedBracket) {
  parser::Cursor cursor("{unterminated");

  EXPECT_EQ(cursor.SkipOneType(), "{unterminated");
  EXPECT_TRUE(cursor.AtEnd());
}
