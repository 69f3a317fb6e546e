#include <gtest/gtest.h>

#include "../src/models/modifier.hpp"

TEST(ModifierTest, ParseModifier) {
  auto result1 = models::ParseModifier('r');
  auto result2 = models::ParseModifier('V');
  auto result3 = models::ParseModifier('i');

  EXPECT_TRUE(result1.has_value());
  EXPECT_EQ(result1.value(), models::Modifier::kConst);

  EXPECT_TRUE(result2.has_value());
  EXPECT_EQ(result2.value(), models::Modifier::kOneway);

  EXPECT_FALSE(result3.has_value());
}

TEST(ModifierTest, EveryModifierRoundTrips) {
  for (auto modifier : models::kAllModifiers) {
    auto encoded = models::EncodeModifier(modifier);
    ASSERT_EQ(encoded.size(), 1u);
    auto parsed = models::ParseModifier(encoded[0]);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value(), modifier);
  }
}

TEST(ModifierTest, Keywords) {
  EXPECT_EQ(models::ModifierKeyword(models::Modifier::kComplex), "_Complex");
  EXPECT_EQ(models::ModifierKeyword(models::Modifier::kAtomic), "_Atomic");
  EXPECT_EQ(models::ModifierKeyword(models::Modifier::kInout), "inout");
  EXPECT_EQ(models::ModifierKeyword(models::Modifier::kRegister), "register");
}
