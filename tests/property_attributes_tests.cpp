#include <gtest/gtest.h>

#include "../src/models/field.hpp"
#include "../src/parser/property_attributes.hpp"

using Kind = models::PropertyAttribute::Kind;

TEST(PropertyAttributesTest, ParseCommonAttributes) {
  auto result = parser::ParsePropertyAttributes("T@\"NSString\",&,N,V_name");

  ASSERT_EQ(result.size(), 4u);
  EXPECT_EQ(result[0].kind, Kind::kType);
  EXPECT_EQ(result[0].value, "@\"NSString\"");
  ASSERT_TRUE(result[0].type.has_value());
  EXPECT_EQ(result[0].type.value(), models::TypeNode::Object("NSString"));
  EXPECT_EQ(result[1].kind, Kind::kRetain);
  EXPECT_EQ(result[1].value, "");
  EXPECT_EQ(result[2].kind, Kind::kNonatomic);
  EXPECT_EQ(result[3].kind, Kind::kIvar);
  EXPECT_EQ(result[3].value, "_name");
}

TEST(PropertyAttributesTest, AccessorsAndFlags) {
  auto result = parser::ParsePropertyAttributes(
      "TB,R,C,W,D,GisEnabled,SsetEnabled:");

  ASSERT_EQ(result.size(), 7u);
  EXPECT_EQ(result[1].kind, Kind::kReadonly);
  EXPECT_EQ(result[2].kind, Kind::kCopy);
  EXPECT_EQ(result[3].kind, Kind::kWeak);
  EXPECT_EQ(result[4].kind, Kind::kDynamic);
  EXPECT_EQ(result[5].kind, Kind::kGetter);
  EXPECT_EQ(result[5].value, "isEnabled");
  EXPECT_EQ(result[6].kind, Kind::kSetter);
  EXPECT_EQ(result[6].value, "setEnabled:");
}

TEST(PropertyAttributesTest, StructTypeKeepsNestedSeparators) {
  auto result =
      parser::ParsePropertyAttributes("T{Pair=\"a\"i\"b\"d},R,V_pair");

  ASSERT_EQ(result.size(), 3u);
  ASSERT_TRUE(result[0].type.has_value());
  EXPECT_EQ(result[0].type->GetFields()->size(), 2u);
}

TEST(PropertyAttributesTest, UnknownAttributesAreKept) {
  auto result = parser::ParsePropertyAttributes("Ti,P,Rx");

  ASSERT_EQ(result.size(), 3u);
  EXPECT_EQ(result[1].kind, Kind::kOther);
  EXPECT_EQ(result[1].value, "P");
  EXPECT_EQ(result[2].kind, Kind::kOther);
  EXPECT_EQ(result[2].value, "Rx");
}

TEST(PropertyAttributesTest, UndecodableType) {
  auto result = parser::ParsePropertyAttributes("T{bad,R");

  ASSERT_EQ(result.size(), 1u);
  EXPECT_EQ(result[0].kind, Kind::kType);
  EXPECT_FALSE(result[0].type.has_value());
}

TEST(PropertyAttributesTest, Empty) {
  EXPECT_TRUE(parser::ParsePropertyAttributes("").empty());
}

TEST(PropertyAttributesTest, EncodeBack) {
  std::string text = "T@\"NSArray\",R,C,N,GallItems,V_items,P";
  auto result = parser::ParsePropertyAttributes(text);

  EXPECT_EQ(models::EncodePropertyAttributes(result), text);
  EXPECT_TRUE(models::HasPropertyAttribute(result, Kind::kCopy));
  EXPECT_FALSE(models::HasPropertyAttribute(result, Kind::kWeak));
  EXPECT_EQ(models::FindPropertyAttribute(result, Kind::kSetter), nullptr);
  EXPECT_EQ(models::FindPropertyAttribute(result, Kind::kGetter)->value,
            "allItems");
}
