#include <gtest/gtest.h>

#include "../src/format/declaration_viewer.hpp"
#include "../src/parser/type_decoder.hpp"

class DeclarationViewerTest : public ::testing::Test {
protected:
  std::string View(const std::string &encoding) {
    auto type = parser::Decode(encoding);
    EXPECT_TRUE(type.has_value()) << encoding;
    return type ? viewer_.View(*type) : "";
  }

  std::string ViewForArgument(const std::string &encoding) {
    auto type = parser::Decode(encoding);
    EXPECT_TRUE(type.has_value()) << encoding;
    return type ? viewer_.ViewForArgument(*type) : "";
  }

  format::DeclarationViewer viewer_;
};

TEST_F(DeclarationViewerTest, Primitives) {
  EXPECT_EQ(View("#"), "Class");
  EXPECT_EQ(View(":"), "SEL");
  EXPECT_EQ(View("C"), "unsigned char");
  EXPECT_EQ(View("q"), "long long");
  EXPECT_EQ(View("T"), "__uint128_t");
  EXPECT_EQ(View("D"), "long double");
  EXPECT_EQ(View("B"), "BOOL");
  EXPECT_EQ(View("v"), "void");
  EXPECT_EQ(View("*"), "char *");
  EXPECT_EQ(View("?"), "unknown");
}

TEST_F(DeclarationViewerTest, ObjectsAndBlocks) {
  EXPECT_EQ(View("@"), "id");
  EXPECT_EQ(View("@\"NSString\""), "NSString *");
  EXPECT_EQ(View("@\"<NSCopying>\""), "id <NSCopying>");
  EXPECT_EQ(View("@?"), "id /* block */");
  EXPECT_EQ(View("@?<v@?@\"NSError\"B>"), "void (^)(NSError *, BOOL)");
  EXPECT_EQ(View("^?"), "void * /* function pointer */");
}

TEST_F(DeclarationViewerTest, PointersArraysAndModifiers) {
  EXPECT_EQ(View("^i"), "int *");
  EXPECT_EQ(View("^^@"), "id * *");
  EXPECT_EQ(View("[10i]"), "int[10]");
  EXPECT_EQ(View("[f]"), "float[]");
  EXPECT_EQ(View("rn^i"), "const in int *");
  EXPECT_EQ(View("b3"), "int x : 3");
}

TEST_F(DeclarationViewerTest, Structs) {
  EXPECT_EQ(View("{CGPoint=dd}"),
            "struct CGPoint {\n    double x0;\n    double x1;\n}");
  EXPECT_EQ(View("{CGPoint=\"x\"d\"y\"d}"),
            "struct CGPoint {\n    double x;\n    double y;\n}");
  EXPECT_EQ(View("{CGPoint}"), "struct CGPoint");
  EXPECT_EQ(View("{CGPoint=}"), "struct CGPoint");
  EXPECT_EQ(View("{?}"), "struct {}");
  EXPECT_EQ(View("{?=i}"), "struct {\n    int x0;\n}");
  EXPECT_EQ(View("(U=if)"), "union U {\n    int x0;\n    float x1;\n}");
  EXPECT_EQ(View("{S=b4\"on\"b1}"),
            "struct S {\n    int x0 : 4;\n    int on : 1;\n}");
}

TEST_F(DeclarationViewerTest, NestedStructsIndentPerLevel) {
  EXPECT_EQ(View("{A=\"b\"{B=i}}"), "struct A {\n"
                                    "    struct B {\n"
                                    "        int x0;\n"
                                    "    } b;\n"
                                    "}");
}

TEST_F(DeclarationViewerTest, CustomTab) {
  format::DeclarationViewer viewer("\t");
  auto type = parser::Decode("{P=ii}");

  ASSERT_TRUE(type.has_value());
  EXPECT_EQ(viewer.View(*type), "struct P {\n\tint x0;\n\tint x1;\n}");
}

TEST_F(DeclarationViewerTest, Deterministic) {
  std::string encoding = "{CGRect={CGPoint=dd}{CGSize=dd}}";

  EXPECT_EQ(View(encoding), View(encoding));
}

TEST_F(DeclarationViewerTest, ViewForArgument) {
  EXPECT_EQ(ViewForArgument("{CGRect={CGPoint=dd}{CGSize=dd}}"), "CGRect");
  EXPECT_EQ(ViewForArgument("c"), "BOOL");
  EXPECT_EQ(ViewForArgument("{?=i}"), "struct { int x0; }");
  EXPECT_EQ(ViewForArgument("^{CGPoint=dd}"),
            "struct CGPoint { double x0; double x1; } *");
  EXPECT_EQ(ViewForArgument("@\"NSString\""), "NSString *");
}

TEST_F(DeclarationViewerTest, ViewForHeader) {
  models::Field flag(models::TypeNode::Primitive(models::TypeNode::Kind::kChar),
                     "flag");
  models::Field count(
      models::TypeNode::Primitive(models::TypeNode::Kind::kInt));

  EXPECT_EQ(viewer_.ViewForHeader(flag, "unused"), "BOOL flag;");
  EXPECT_EQ(viewer_.ViewForHeader(count, "count"), "int count;");
  EXPECT_EQ(viewer_.ViewForHeader(models::Field::BitField(2), "bits"),
            "int bits : 2;");
}
