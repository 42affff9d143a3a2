#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "CGMap_Lib/merge_chains.h"

namespace {

using cgmap::AttributeMap;
using cgmap::AttributeValue;
using cgmap::MolecularGraph;
using cgmap::System;

// A molecule of `n` bonded atoms, all in `chain`. An empty chain means
// no chain attribute.
MolecularGraph
Molecule(const std::string& name, const std::string& chain, int n) {
  MolecularGraph result;
  result.set_name(name);

  for (int i = 0; i < n; ++i) {
    AttributeMap a;
    a[cgmap::kAtomName] = AttributeValue("CA");
    a[cgmap::kResId] = AttributeValue(i + 1);
    if (! chain.empty()) {
      a[cgmap::kChain] = AttributeValue(chain);
    }
    const cgmap::node_id_t id = result.AddNode(a);
    if (i > 0) {
      result.AddEdge(id - 1, id);
    }
  }

  return result;
}

std::vector<std::string>
Names(const System& system) {
  std::vector<std::string> result;
  for (const MolecularGraph& m : system.molecules()) {
    result.push_back(m.name());
  }

  return result;
}

class TestMergeChains : public testing::Test {
  protected:
    System _system;

    void SetUp() override {
      _system.Add(Molecule("a", "A", 2));
      _system.Add(Molecule("b", "B", 3));
      _system.Add(Molecule("c", "C", 1));
      _system.Add(Molecule("d", "A", 4));
    }
};

TEST_F(TestMergeChains, Selected) {
  ASSERT_TRUE(cgmap::MergeChains(_system, {"A", "C"}, false).ok());

  EXPECT_THAT(Names(_system), testing::ElementsAre("a", "b"));
  const MolecularGraph& merged = _system.molecule(0);
  EXPECT_EQ(merged.number_nodes(), 7);
  // Not connected to each other.
  EXPECT_EQ(merged.number_edges(), 1 + 3);
  EXPECT_EQ(_system.molecule(1).number_nodes(), 3);
}

TEST_F(TestMergeChains, MergedTakesPlaceOfFirst) {
  ASSERT_TRUE(cgmap::MergeChains(_system, {"C"}, false).ok());
  EXPECT_THAT(Names(_system), testing::ElementsAre("a", "b", "c", "d"));

  ASSERT_TRUE(cgmap::MergeChains(_system, {"B", "C"}, false).ok());
  EXPECT_THAT(Names(_system), testing::ElementsAre("a", "b", "d"));
  EXPECT_EQ(_system.molecule(1).number_nodes(), 4);
}

TEST_F(TestMergeChains, AllChains) {
  ASSERT_TRUE(cgmap::MergeChains(_system, {}, true).ok());
  ASSERT_EQ(_system.number_molecules(), 1);
  EXPECT_EQ(_system.molecule(0).number_nodes(), 10);
}

TEST_F(TestMergeChains, MultiChainMoleculeNeedsAllItsChains) {
  MolecularGraph ab = Molecule("ab", "A", 1);
  ASSERT_TRUE(ab.Append(Molecule("", "B", 1)));
  _system.Add(std::move(ab));

  ASSERT_TRUE(cgmap::MergeChains(_system, {"A"}, false).ok());
  EXPECT_THAT(Names(_system), testing::ElementsAre("a", "b", "c", "ab"));
}

TEST_F(TestMergeChains, MissingChainIdentifier) {
  _system.Add(Molecule("nochain", "", 2));

  ASSERT_TRUE(cgmap::MergeChains(_system, {}, true).ok());
  EXPECT_EQ(_system.number_molecules(), 1);
}

TEST_F(TestMergeChains, BothOrNeither) {
  EXPECT_EQ(cgmap::MergeChains(_system, {"A"}, true).code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(cgmap::MergeChains(_system, {}, false).code(), absl::StatusCode::kInvalidArgument);
  EXPECT_EQ(_system.number_molecules(), 4);
}

TEST(TestChainsOf, Chains) {
  MolecularGraph m = Molecule("x", "A", 2);
  ASSERT_TRUE(m.Append(Molecule("", "", 1)));
  EXPECT_THAT(cgmap::ChainsOf(m), testing::ElementsAre("", "A"));
}

}  // namespace
