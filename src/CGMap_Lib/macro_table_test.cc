#include <string>

#include "gtest/gtest.h"

#include "CGMap_Lib/errors.h"
#include "CGMap_Lib/macro_table.h"

namespace {

using cgmap::ErrorKind;
using cgmap::MacroTable;

class TestMacroTable : public testing::Test {
  protected:
    MacroTable _macros;
};

TEST_F(TestMacroTable, Expand) {
  ASSERT_TRUE(_macros.Define("PROTEIN", R"("ALA|GLY|SER")").ok());

  absl::StatusOr<std::string> s = _macros.Expand(R"(CA {"resname": $PROTEIN})");
  ASSERT_TRUE(s.ok());
  EXPECT_EQ(*s, R"(CA {"resname": "ALA|GLY|SER"})");
}

TEST_F(TestMacroTable, NoReferences) {
  absl::StatusOr<std::string> s = _macros.Expand("N CA");
  ASSERT_TRUE(s.ok());
  EXPECT_EQ(*s, "N CA");
}

TEST_F(TestMacroTable, AdjacentReferences) {
  ASSERT_TRUE(_macros.Define("a", "x").ok());
  ASSERT_TRUE(_macros.Define("b", "y").ok());

  absl::StatusOr<std::string> s = _macros.Expand("$a$b-$a");
  ASSERT_TRUE(s.ok());
  EXPECT_EQ(*s, "xy-x");
}

TEST_F(TestMacroTable, DefinitionUsesEarlierMacro) {
  ASSERT_TRUE(_macros.Define("base", "ALA").ok());
  ASSERT_TRUE(_macros.Define("both", "$base|GLY").ok());

  ASSERT_NE(_macros.Find("both"), nullptr);
  EXPECT_EQ(*_macros.Find("both"), "ALA|GLY");
}

TEST_F(TestMacroTable, Redefinition) {
  ASSERT_TRUE(_macros.Define("x", "1").ok());
  ASSERT_TRUE(_macros.Define("x", "2").ok());
  EXPECT_EQ(_macros.size(), 1);
  EXPECT_EQ(*_macros.Find("x"), "2");
}

TEST_F(TestMacroTable, Undefined) {
  absl::StatusOr<std::string> s = _macros.Expand("CA $nothere");
  ASSERT_FALSE(s.ok());
  EXPECT_EQ(cgmap::KindOf(s.status()), ErrorKind::kMacro);
}

TEST_F(TestMacroTable, SelfReference) {
  absl::Status status = _macros.Define("loop", "1|$loop");
  EXPECT_EQ(cgmap::KindOf(status), ErrorKind::kMacro);
  EXPECT_FALSE(_macros.contains("loop"));
}

TEST_F(TestMacroTable, UndefinedInDefinition) {
  absl::Status status = _macros.Define("a", "$b");
  EXPECT_EQ(cgmap::KindOf(status), ErrorKind::kMacro);
}

TEST_F(TestMacroTable, InvalidName) {
  EXPECT_EQ(cgmap::KindOf(_macros.Define("1abc", "x")), ErrorKind::kMacro);
  EXPECT_FALSE(cgmap::ValidMacroName("a-b"));
  EXPECT_TRUE(cgmap::ValidMacroName("_a1"));
}

}  // namespace
