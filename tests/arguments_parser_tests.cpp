#include <gtest/gtest.h>

#include "../src/main/arguments_parser.hpp"
#include "../src/utils/verbose/verbose.hpp"

class ArgumentsParserTest : public ::testing::Test {
protected:
  void SetUp() override { utils::verbose::Flags::getInstance().Reset(); }
  void TearDown() override { utils::verbose::Flags::getInstance().Reset(); }
};

TEST_F(ArgumentsParserTest, NoArguments) {
  int argc1 = 1;
  char *argv1[] = {
      (char *)"program",
  };
  ArgumentsParser parser1;
  LaunchSettings result1 = parser1.Parse(argc1, argv1);
  EXPECT_EQ(result1.mode, Mode::kDecode);
  EXPECT_FALSE(result1.need_to_print_help_and_stop);
  EXPECT_EQ(result1.indent_width, 4);
  EXPECT_TRUE(result1.inputs.empty());
}

TEST_F(ArgumentsParserTest, SingleArgument) {
  int argc2 = 2;
  char *argv2[] = {(char *)"program", (char *)"-e"};
  ArgumentsParser parser2;
  LaunchSettings result2 = parser2.Parse(argc2, argv2);
  EXPECT_EQ(result2.mode, Mode::kEncode);
  EXPECT_TRUE(result2.inputs.empty());
}

TEST_F(ArgumentsParserTest, MultipleArguments) {
  int argc3 = 6;
  char *argv3[] = {(char *)"program", (char *)"-ssetValue:forKey:",
                   (char *)"-c",      (char *)"-t2",
                   (char *)"-v",      (char *)"v32@0:8@16@24"};
  ArgumentsParser parser3;
  LaunchSettings result3 = parser3.Parse(argc3, argv3);
  EXPECT_EQ(result3.mode, Mode::kMethod);
  EXPECT_EQ(result3.selector.value(), "setValue:forKey:");
  EXPECT_TRUE(result3.need_class_member);
  EXPECT_EQ(result3.indent_width, 2);
  EXPECT_EQ(result3.BuildTab(), "  ");
  EXPECT_TRUE(utils::verbose::Flags::getInstance().NeedToPrintVerbose());
  EXPECT_FALSE(utils::verbose::Flags::getInstance().NeedToPrintVeryVerbose());
  ASSERT_EQ(result3.inputs.size(), 1u);
  EXPECT_EQ(result3.inputs[0], "v32@0:8@16@24");
}

TEST_F(ArgumentsParserTest, MembersAndFiles) {
  int argc = 4;
  char *argv[] = {(char *)"program", (char *)"-p_title", (char *)"-ftypes.txt",
                  (char *)"-vv"};
  ArgumentsParser parser;
  LaunchSettings result = parser.Parse(argc, argv);
  EXPECT_EQ(result.mode, Mode::kProperty);
  EXPECT_EQ(result.member_name.value(), "_title");
  EXPECT_EQ(result.input_file.value(), "types.txt");
  EXPECT_TRUE(utils::verbose::Flags::getInstance().NeedToPrintVeryVerbose());
}

TEST_F(ArgumentsParserTest, InputsAfterOptionsEnd) {
  int argc = 4;
  char *argv[] = {(char *)"program", (char *)"-iflag", (char *)"--",
                  (char *)"-not-an-option"};
  ArgumentsParser parser;
  LaunchSettings result = parser.Parse(argc, argv);
  EXPECT_EQ(result.mode, Mode::kIvar);
  EXPECT_EQ(result.member_name.value(), "flag");
  ASSERT_EQ(result.inputs.size(), 1u);
  EXPECT_EQ(result.inputs[0], "-not-an-option");
}

TEST_F(ArgumentsParserTest, BadOptionsRequestHelp) {
  char *unknown[] = {(char *)"program", (char *)"-x"};
  char *bad_width[] = {(char *)"program", (char *)"-tabc"};
  char *missing_name[] = {(char *)"program", (char *)"-p"};
  char *version[] = {(char *)"program", (char *)"-V"};
  ArgumentsParser parser;

  EXPECT_TRUE(parser.Parse(2, unknown).need_to_print_help_and_stop);
  EXPECT_TRUE(parser.Parse(2, bad_width).need_to_print_help_and_stop);
  EXPECT_TRUE(parser.Parse(2, missing_name).need_to_print_help_and_stop);
  EXPECT_TRUE(parser.Parse(2, version).need_to_print_version_and_stop);
}

TEST(LaunchSettingsTest, SetIndentWidth) {
  LaunchSettings settings;

  settings.SetIndentWidth("8");
  EXPECT_EQ(settings.indent_width, 8);
  EXPECT_EQ(settings.BuildTab(), "        ");

  settings.SetIndentWidth("0");
  EXPECT_EQ(settings.BuildTab(), "");

  EXPECT_THROW(settings.SetIndentWidth(""), std::runtime_error);
  EXPECT_THROW(settings.SetIndentWidth("-1"), std::runtime_error);
  EXPECT_THROW(settings.SetIndentWidth("99"), std::runtime_error);
}
