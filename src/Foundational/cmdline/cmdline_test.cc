// Tests for Command_Line

#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "cmdline.h"

namespace {

using testing::ElementsAre;

// getopt wants char**, build one from string literals.
class TestCommandLine : public testing::Test {
  protected:
    std::vector<std::string> _args;
    std::vector<char*> _argv;

    void Build(std::vector<std::string> args) {
      _args = std::move(args);
      _argv.clear();
      for (std::string& s : _args) {
        _argv.push_back(s.data());
      }
      _argv.push_back(nullptr);
    }

    int argc() const { return _args.size();}
    char** argv() { return _argv.data();}
};

TEST_F(TestCommandLine, TestNoOptions) {
  Build({"prog", "a.textproto"});
  Command_Line cl(argc(), argv(), "vr:");
  EXPECT_FALSE(cl.option_present('v'));
  EXPECT_EQ(cl.option_count('r'), 0);
  ASSERT_EQ(cl.number_elements(), 1);
  EXPECT_EQ(cl[0], "a.textproto");
}

TEST_F(TestCommandLine, TestRepeatedOptions) {
  Build({"prog", "-v", "-r", "a.map", "-v", "-r", "b.map", "input"});
  Command_Line cl(argc(), argv(), "vr:");
  EXPECT_EQ(cl.option_count('v'), 2);
  EXPECT_EQ(cl.option_count('r'), 2);

  std::vector<std::string> values;
  EXPECT_EQ(cl.all_values('r', values), 2);
  EXPECT_THAT(values, ElementsAre("a.map", "b.map"));

  EXPECT_EQ(cl.string_value('r', 1), "b.map");
  EXPECT_EQ(cl.string_value('r', 2), "");
  ASSERT_EQ(cl.number_elements(), 1);
  EXPECT_EQ(cl[0], "input");
}

TEST_F(TestCommandLine, TestNumericValues) {
  Build({"prog", "-n", "12", "-w", "0.5", "-x", "abc"});
  Command_Line cl(argc(), argv(), "n:w:x:");

  int n = 0;
  EXPECT_TRUE(cl.value('n', n));
  EXPECT_EQ(n, 12);

  double w = 0.0;
  EXPECT_TRUE(cl.value('w', w));
  EXPECT_DOUBLE_EQ(w, 0.5);

  int x = 0;
  EXPECT_FALSE(cl.value('x', x));
}

TEST_F(TestCommandLine, TestUnrecognised) {
  Build({"prog", "-q", "file"});
  Command_Line cl(argc(), argv(), "v");
  EXPECT_EQ(cl.unrecognised_options_encountered(), 1);
}

}  // namespace
