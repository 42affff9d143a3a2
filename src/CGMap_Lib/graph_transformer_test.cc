#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "CGMap_Lib/errors.h"
#include "CGMap_Lib/graph_transformer.h"
#include "CGMap_Lib/rule_parser.h"

namespace {

using cgmap::AttributeMap;
using cgmap::AttributeValue;
using cgmap::ErrorKind;
using cgmap::MappingReport;
using cgmap::MolecularGraph;
using cgmap::node_id_t;

AttributeMap
Atom(const char* name, const std::string& resname, int resid, const char* element,
     double x) {
  AttributeMap result;
  result[cgmap::kAtomName] = AttributeValue(name);
  result[cgmap::kResName] = AttributeValue(resname);
  result[cgmap::kResId] = AttributeValue(resid);
  result[cgmap::kElement] = AttributeValue(element);
  result[cgmap::kPosition] = AttributeValue(std::vector<double>{x, 0.0, 0.0});

  return result;
}

// N CA C O of each residue, joined by peptide bonds. Atoms are placed
// along x, one unit apart.
MolecularGraph
Backbone(const std::vector<std::string>& residues) {
  MolecularGraph result;

  double x = 0.0;
  node_id_t previous_c = 0;
  for (size_t i = 0; i < residues.size(); ++i) {
    const int resid = i + 1;
    const node_id_t n = result.AddNode(Atom("N", residues[i], resid, "N", x));
    const node_id_t ca = result.AddNode(Atom("CA", residues[i], resid, "C", x + 1.0));
    const node_id_t c = result.AddNode(Atom("C", residues[i], resid, "C", x + 2.0));
    const node_id_t o = result.AddNode(Atom("O", residues[i], resid, "O", x + 3.0));
    result.AddEdge(n, ca);
    result.AddEdge(ca, c);
    result.AddEdge(c, o);
    if (i > 0) {
      result.AddEdge(previous_c, n);
    }
    previous_c = c;
    x += 4.0;
  }

  return result;
}

constexpr char kBackboneBlocks[] = R"(
[ block ]
ALA
[ from blocks ]
ALA
[ from nodes ]
N
CA
C
O
[ from edges ]
N CA
CA C
C O
[ mapping ]
N BB
CA BB
C BB
O BB

[ block ]
GLY
[ from blocks ]
GLY
[ from nodes ]
N
CA
C
O
[ from edges ]
N CA
CA C
C O
[ mapping ]
N BB
CA BB
C BB
O BB
)";

class TestGraphTransformer : public testing::Test {
  protected:
    cgmap::MacroTable _macros;
    cgmap::RuleSet _rules;

    cgmap::GraphTransformer _transformer;

    MolecularGraph _m;

    MappingReport _report;

    int _Parse(const char* text) {
      cgmap::RuleParser parser(_macros);
      absl::Status status = parser.Parse(text, _rules);
      if (! status.ok()) {
        std::cerr << status << '\n';
      }
      return status.ok();
    }

    std::vector<double> _Position(const MolecularGraph& m, node_id_t id) const {
      return m.attributes(id)->at(cgmap::kPosition).vector_value();
    }
};

// Four atoms to one bead, no edges left over.
TEST_F(TestGraphTransformer, WholeResidueToOneBead) {
  ASSERT_TRUE(_Parse(kBackboneBlocks));
  _m = Backbone({"ALA"});

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(_m, _rules.blocks(), 0, _report);
  ASSERT_TRUE(output.ok()) << output.status();

  ASSERT_EQ(output->number_nodes(), 1);
  EXPECT_EQ(output->number_edges(), 0);

  const AttributeMap& bb = *output->attributes(0);
  EXPECT_EQ(bb.at(cgmap::kAtomName), AttributeValue("BB"));
  EXPECT_EQ(bb.at(cgmap::kResName), AttributeValue("ALA"));
  EXPECT_EQ(bb.at(cgmap::kResId), AttributeValue(1));
  EXPECT_THAT(_Position(*output, 0), testing::ElementsAre(1.5, 0.0, 0.0));
  EXPECT_FALSE(bb.contains(cgmap::kElement));

  EXPECT_EQ(_report.residues_mapped, 1);
  EXPECT_EQ(_report.unmapped_atoms, 0);
}

TEST_F(TestGraphTransformer, BondsBetweenBeads) {
  ASSERT_TRUE(_Parse(kBackboneBlocks));
  _m = Backbone({"ALA", "GLY", "ALA"});

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(_m, _rules.blocks(), 100, _report);
  ASSERT_TRUE(output.ok()) << output.status();

  ASSERT_EQ(output->number_nodes(), 3);
  EXPECT_THAT(output->NodeIds(), testing::ElementsAre(100, 101, 102));
  EXPECT_EQ(output->attributes(101)->at(cgmap::kResName), AttributeValue("GLY"));
  EXPECT_EQ(output->number_edges(), 2);
  EXPECT_TRUE(output->HasEdge(100, 101));
  EXPECT_TRUE(output->HasEdge(101, 102));
  EXPECT_THAT(_Position(*output, 102), testing::ElementsAre(9.5, 0.0, 0.0));
  EXPECT_EQ(_report.residues_mapped, 3);
}

TEST_F(TestGraphTransformer, UnmatchedResidue) {
  ASSERT_TRUE(_Parse(kBackboneBlocks));
  _m = Backbone({"ALA", "SER"});

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(_m, _rules.blocks(), 0, _report);
  ASSERT_TRUE(output.ok()) << output.status();
  EXPECT_EQ(output->number_nodes(), 1);
  EXPECT_EQ(_report.unmapped_atoms, 4);
  EXPECT_THAT(_report.unmatched_residues, testing::ElementsAre("SER 2"));

  _transformer.set_fail_on_unmapped(true);
  output = _transformer.MapBlocks(_m, _rules.blocks(), 0, _report);
  EXPECT_EQ(cgmap::KindOf(output.status()), ErrorKind::kNoMatch);
}

constexpr char kTwoBeads[] = R"(
[ block ]
PAIR
[ from nodes ]
A1
A2
A3
[ from edges ]
A1 A2
A2 A3
[ to nodes ]
X {"charge": 1}
Y
[ to edges ]
X Y {"kind": "constraint"}
[ mapping ]
A1 X 0.5
A2 X 0.5
A2 Y 1
A3 Y 3
)";

// A1-A2-A3, masses 2 4 6.
void
MakeTriple(MolecularGraph& m) {
  const char* names[] = {"A1", "A2", "A3"};
  for (int i = 0; i < 3; ++i) {
    AttributeMap a = Atom(names[i], "TRI", 1, "C", 2.0 * (i + 1));
    a["mass"] = AttributeValue(2.0 * (i + 1));
    m.AddNode(a);
  }
  m.AddEdge(0, 1);
  m.AddEdge(1, 2);
}

TEST_F(TestGraphTransformer, WeightedAverage) {
  ASSERT_TRUE(_Parse(kTwoBeads));
  MakeTriple(_m);
  _transformer.set_aggregate_attributes({cgmap::kPosition, "mass"});

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(_m, _rules.blocks(), 0, _report);
  ASSERT_TRUE(output.ok()) << output.status();
  ASSERT_EQ(output->number_nodes(), 2);

  const AttributeMap& x = *output->attributes(0);
  EXPECT_EQ(x.at(cgmap::kAtomName), AttributeValue("X"));
  EXPECT_EQ(x.at("mass"), AttributeValue(3.0));
  EXPECT_EQ(x.at("charge"), AttributeValue(1));
  EXPECT_THAT(_Position(*output, 0), testing::ElementsAre(3.0, 0.0, 0.0));

  // (4 + 3 * 6) / 4
  const AttributeMap& y = *output->attributes(1);
  EXPECT_EQ(y.at("mass"), AttributeValue(5.5));

  // The declared edge, the bonds between sources add nothing more.
  ASSERT_EQ(output->number_edges(), 1);
  EXPECT_EQ(output->edge_attributes(0, 1)->at("kind"), AttributeValue("constraint"));
}

TEST_F(TestGraphTransformer, InconsistentVectors) {
  ASSERT_TRUE(_Parse(kTwoBeads));
  MakeTriple(_m);
  _m.SetAttribute(1, cgmap::kPosition, AttributeValue(std::vector<double>{1.0, 2.0}));
  _transformer.set_skip_inconsistent_residues(false);

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(_m, _rules.blocks(), 0, _report);
  EXPECT_EQ(cgmap::KindOf(output.status()), ErrorKind::kStructuralInconsistency);
}

// The ALA cannot be averaged, the GLY before it is still mapped.
TEST_F(TestGraphTransformer, InconsistentResidueIsSkipped) {
  ASSERT_TRUE(_Parse(kBackboneBlocks));
  _m = Backbone({"GLY", "ALA"});
  _m.SetAttribute(5, cgmap::kPosition, AttributeValue(std::vector<double>{5.0, 0.0}));

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(_m, _rules.blocks(), 10, _report);
  ASSERT_TRUE(output.ok()) << output.status();

  ASSERT_EQ(output->number_nodes(), 1);
  EXPECT_THAT(output->NodeIds(), testing::ElementsAre(10u));
  EXPECT_EQ(output->attributes(10)->at(cgmap::kResName), AttributeValue("GLY"));
  EXPECT_EQ(output->number_edges(), 0);

  EXPECT_EQ(_report.blocks_skipped, 1);
  EXPECT_EQ(_report.residues_mapped, 1);
  EXPECT_EQ(_report.unmapped_atoms, 4);
  EXPECT_THAT(_report.unmatched_residues, testing::ElementsAre("ALA 2"));
}

TEST_F(TestGraphTransformer, ApplySingleMatch) {
  ASSERT_TRUE(_Parse(kTwoBeads));
  MakeTriple(_m);

  const cgmap::Block& block = _rules.blocks()[0];
  std::vector<cgmap::Correspondence> matches = _transformer.matcher().Match(_m, block.from());
  ASSERT_EQ(matches.size(), 1u);

  absl::StatusOr<MolecularGraph> output = _transformer.Apply(_m, block, matches[0]);
  ASSERT_TRUE(output.ok()) << output.status();
  EXPECT_EQ(output->number_nodes(), 2);
  EXPECT_EQ(output->number_edges(), 1);
}

TEST_F(TestGraphTransformer, SharedSourceGivesEdge) {
  constexpr char kRules[] = R"(
[ block ]
SPLIT
[ from nodes ]
A1
A2
A3
[ mapping ]
A1 X
A2 X
A2 Y
A3 Y
)";

  ASSERT_TRUE(_Parse(kRules));
  MakeTriple(_m);

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(_m, _rules.blocks(), 0, _report);
  ASSERT_TRUE(output.ok()) << output.status();
  ASSERT_EQ(output->number_nodes(), 2);
  // A1-A2 gives X-Y, A2-A3 gives Y-Y which is dropped.
  EXPECT_EQ(output->number_edges(), 1);
  EXPECT_TRUE(output->HasEdge(0, 1));
}

TEST_F(TestGraphTransformer, ReplaceNullRemovesAttributeNotAtom) {
  constexpr char kRules[] = R"(
[ modification ]
rename
[ atoms ]
CA {"replace": {"atomname": null, "charge": 1}}
)";

  ASSERT_TRUE(_Parse(kRules));
  _m = Backbone({"ALA"});

  ASSERT_TRUE(_transformer.ApplyModifications(_m, _rules.modifications(), _report).ok());
  EXPECT_EQ(_report.modifications_applied, 1);

  ASSERT_TRUE(_m.HasNode(1));
  EXPECT_EQ(_m.number_nodes(), 4);
  const AttributeMap& ca = *_m.attributes(1);
  EXPECT_FALSE(ca.contains(cgmap::kAtomName));
  EXPECT_EQ(ca.at("charge"), AttributeValue(1));
  EXPECT_EQ(ca.at(cgmap::kModification), AttributeValue("rename"));
  EXPECT_TRUE(_m.HasEdge(0, 1));
}

TEST_F(TestGraphTransformer, RemoveAtom) {
  constexpr char kRules[] = R"(
[ modification ]
strip
[ atoms ]
N
HN {"PTM_atom": true, "element": "H", "replace": {"atomname": null}}
[ edges ]
N HN
)";

  ASSERT_TRUE(_Parse(kRules));
  _m = Backbone({"ALA"});
  const node_id_t h = _m.AddNode(Atom("H", "ALA", 1, "H", -1.0));
  _m.AddEdge(0, h);

  ASSERT_TRUE(_transformer.ApplyModifications(_m, _rules.modifications(), _report).ok());
  EXPECT_FALSE(_m.HasNode(h));
  EXPECT_EQ(_m.number_nodes(), 4);
  EXPECT_EQ(_m.degree(0), 1);
  EXPECT_EQ(_m.attributes(0)->at(cgmap::kModification), AttributeValue("strip"));
}

TEST_F(TestGraphTransformer, CreateAtom) {
  constexpr char kRules[] = R"(
[ modification ]
C-ter
[ atoms ]
C
O
OXT {"PTM_atom": true, "element": "O", "replace": {"charge": -1}}
[ edges ]
C O
C OXT
)";

  ASSERT_TRUE(_Parse(kRules));
  _m = Backbone({"ALA"});

  ASSERT_TRUE(_transformer.ApplyModifications(_m, _rules.modifications(), _report).ok());
  ASSERT_EQ(_m.number_nodes(), 5);
  ASSERT_TRUE(_m.HasNode(4));

  const AttributeMap& oxt = *_m.attributes(4);
  EXPECT_EQ(oxt.at(cgmap::kAtomName), AttributeValue("OXT"));
  EXPECT_EQ(oxt.at(cgmap::kElement), AttributeValue("O"));
  EXPECT_EQ(oxt.at(cgmap::kPtmAtom), AttributeValue(true));
  EXPECT_EQ(oxt.at("charge"), AttributeValue(-1));
  EXPECT_EQ(oxt.at(cgmap::kResName), AttributeValue("ALA"));
  EXPECT_EQ(oxt.at(cgmap::kResId), AttributeValue(1));
  EXPECT_EQ(oxt.at(cgmap::kModification), AttributeValue("C-ter"));
  EXPECT_TRUE(_m.HasEdge(2, 4));
}

TEST_F(TestGraphTransformer, ExistingAtomIsNotDuplicated) {
  constexpr char kRules[] = R"(
[ modification ]
C-ter
[ atoms ]
C
OXT {"PTM_atom": true, "atomname": "OXT", "replace": {"charge": -1}}
[ edges ]
C OXT
)";

  ASSERT_TRUE(_Parse(kRules));
  _m = Backbone({"ALA"});
  const node_id_t oxt = _m.AddNode(Atom("OXT", "ALA", 1, "O", 3.0));
  _m.AddEdge(2, oxt);

  ASSERT_TRUE(_transformer.ApplyModifications(_m, _rules.modifications(), _report).ok());
  EXPECT_EQ(_m.number_nodes(), 5);
  EXPECT_EQ(_m.attributes(oxt)->at("charge"), AttributeValue(-1));
}

constexpr char kCompeting[] = R"(
[ modification ]
first
[ atoms ]
C {"replace": {"tag": "first"}}
O
[ edges ]
C O

[ modification ]
second
[ atoms ]
C {"replace": {"tag": "second"}}
O
[ edges ]
C O
)";

// Same atoms, same specificity, the first declared is applied.
TEST_F(TestGraphTransformer, CompetingModificationsFirstDeclared) {
  ASSERT_TRUE(_Parse(kCompeting));
  _m = Backbone({"ALA", "GLY"});
  MolecularGraph copy = _m;

  ASSERT_TRUE(_transformer.ApplyModifications(_m, _rules.modifications(), _report).ok());
  EXPECT_EQ(_report.modifications_applied, 2);
  for (node_id_t c : {2u, 6u}) {
    EXPECT_EQ(_m.attributes(c)->at("tag"), AttributeValue("first"));
    EXPECT_EQ(_m.attributes(c)->at(cgmap::kModification), AttributeValue("first"));
  }

  // Same again gives the same graph.
  MappingReport report;
  ASSERT_TRUE(_transformer.ApplyModifications(copy, _rules.modifications(), report).ok());
  EXPECT_TRUE(copy.nodes() == _m.nodes());
  EXPECT_TRUE(copy.edges() == _m.edges());
}

// A later declaration wins when it is more specific.
TEST_F(TestGraphTransformer, CompetingModificationsMoreSpecific) {
  constexpr char kSpecific[] = R"(
[ modification ]
specific
[ atoms ]
C {"element": "C", "replace": {"tag": "specific"}}
O
[ edges ]
C O
)";

  ASSERT_TRUE(_Parse(kCompeting));
  ASSERT_TRUE(_Parse(kSpecific));
  ASSERT_EQ(_rules.number_modifications(), 3);
  _m = Backbone({"ALA"});

  ASSERT_TRUE(_transformer.ApplyModifications(_m, _rules.modifications(), _report).ok());
  EXPECT_EQ(_report.modifications_applied, 1);
  EXPECT_EQ(_m.attributes(2)->at("tag"), AttributeValue("specific"));
}

// The C-ter pattern with C and O both bound to the same atom. Checked
// before anything is created.
TEST_F(TestGraphTransformer, ModificationIsAllOrNothing) {
  constexpr char kRules[] = R"(
[ modification ]
C-ter
[ atoms ]
C
O
OXT {"PTM_atom": true, "element": "O"}
[ edges ]
C O
C OXT
)";

  ASSERT_TRUE(_Parse(kRules));
  _m = Backbone({"ALA"});

  cgmap::Correspondence c(3, 0);
  c.set(0, 2);
  c.set(1, 2);

  absl::Status status = _transformer.ApplyModification(_m, _rules.modifications()[0], c);
  EXPECT_EQ(cgmap::KindOf(status), ErrorKind::kStructuralInconsistency);
  EXPECT_EQ(_m.number_nodes(), 4);
  EXPECT_FALSE(_m.attributes(2)->contains(cgmap::kModification));
}

constexpr char kDangling[] = R"(
[ modification ]
dangling
[ atoms ]
C
H {"PTM_atom": true, "replace": {"atomname": null}}
X {"PTM_atom": true, "element": "X"}
[ edges ]
C H
H X
)";

// C bonded to a single other atom, H1.
void
MakeCH(MolecularGraph& m) {
  m.AddNode(Atom("C", "UNK", 1, "C", 0.0));
  m.AddNode(Atom("H1", "UNK", 1, "H", 1.0));
  m.AddEdge(0, 1);
}

TEST_F(TestGraphTransformer, DanglingAtomIsSkipped) {
  ASSERT_TRUE(_Parse(kDangling));
  MakeCH(_m);

  ASSERT_TRUE(_transformer.ApplyModifications(_m, _rules.modifications(), _report).ok());
  EXPECT_EQ(_report.modifications_applied, 0);
  EXPECT_EQ(_report.modifications_skipped, 1);

  // Nothing changed.
  EXPECT_EQ(_m.number_nodes(), 2);
  EXPECT_TRUE(_m.HasEdge(0, 1));
  EXPECT_FALSE(_m.attributes(0)->contains(cgmap::kModification));
}

TEST_F(TestGraphTransformer, DanglingAtomIsAnError) {
  ASSERT_TRUE(_Parse(kDangling));
  MakeCH(_m);

  _transformer.set_skip_inconsistent_residues(false);
  absl::Status status = _transformer.ApplyModifications(_m, _rules.modifications(), _report);
  EXPECT_EQ(cgmap::KindOf(status), ErrorKind::kStructuralInconsistency);
  EXPECT_THAT(std::string(status.message()), testing::HasSubstr("dangling"));
  EXPECT_THAT(std::string(status.message()), testing::HasSubstr("UNK 1"));
  EXPECT_EQ(_m.number_nodes(), 2);
}

TEST_F(TestGraphTransformer, Links) {
  constexpr char kLinks[] = R"(
[ link ]
[ atoms ]
BB {"resname": "ALA|GLY"}
+BB {"resname": "ALA|GLY"}
[ edges ]
BB +BB {"kind": "backbone"}

[ link ]
[ atoms ]
BB {"resname": "GLY", "replace": {"flexible": true}}
)";

  ASSERT_TRUE(_Parse(kBackboneBlocks));
  ASSERT_TRUE(_Parse(kLinks));
  _m = Backbone({"ALA", "GLY", "ALA"});

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(_m, _rules.blocks(), 0, _report);
  ASSERT_TRUE(output.ok()) << output.status();

  ASSERT_TRUE(_transformer.ApplyLinks(*output, _rules.links(), _report).ok());
  EXPECT_EQ(_report.links_applied, 3);
  EXPECT_EQ(output->number_edges(), 2);
  EXPECT_EQ(output->edge_attributes(0, 1)->at("kind"), AttributeValue("backbone"));
  EXPECT_EQ(output->edge_attributes(1, 2)->at("kind"), AttributeValue("backbone"));
  EXPECT_EQ(output->attributes(1)->at("flexible"), AttributeValue(true));
  EXPECT_FALSE(output->attributes(0)->contains("flexible"));
}

// The first link puts both beads in residue 1, so they are no longer
// consecutive residues for the second.
TEST_F(TestGraphTransformer, LinksSeeChangedResidues) {
  constexpr char kLinks[] = R"(
[ link ]
[ atoms ]
BB {"resid": 2, "replace": {"resid": 1}}

[ link ]
[ atoms ]
BB
+BB
[ edges ]
BB +BB {"kind": "backbone"}
)";

  ASSERT_TRUE(_Parse(kBackboneBlocks));
  ASSERT_TRUE(_Parse(kLinks));
  _m = Backbone({"GLY", "GLY"});

  absl::StatusOr<MolecularGraph> output = _transformer.MapBlocks(_m, _rules.blocks(), 0, _report);
  ASSERT_TRUE(output.ok()) << output.status();
  ASSERT_TRUE(output->HasEdge(0, 1));

  ASSERT_TRUE(_transformer.ApplyLinks(*output, _rules.links(), _report).ok());
  EXPECT_EQ(_report.links_applied, 1);
  EXPECT_EQ(output->attributes(1)->at(cgmap::kResId), AttributeValue(1));
  EXPECT_FALSE(output->edge_attributes(0, 1)->contains("kind"));
}

TEST_F(TestGraphTransformer, InducedEdgesOnly) {
  MolecularGraph output;
  const node_id_t x = output.AddNode(AttributeMap());
  const node_id_t y = output.AddNode(AttributeMap());

  MakeTriple(_m);

  cgmap::SourceToOutput source_to_output;
  source_to_output[0].push_back(x);
  source_to_output[1].push_back(x);
  source_to_output[2].push_back(y);

  EXPECT_EQ(cgmap::AddInducedEdges(_m, source_to_output, output), 1);
  EXPECT_TRUE(output.HasEdge(x, y));
  EXPECT_EQ(cgmap::AddInducedEdges(_m, source_to_output, output), 0);
}

TEST(TestMappingReport, Add) {
  MappingReport r1;
  r1.residues_mapped = 2;
  r1.unmatched_residues.push_back("SER 3");
  MappingReport r2;
  r2.residues_mapped = 1;
  r2.links_applied = 4;
  r2.blocks_skipped = 1;
  r2.unmatched_residues.push_back("LYS 9");

  r1.Add(r2);
  EXPECT_EQ(r1.residues_mapped, 3);
  EXPECT_EQ(r1.links_applied, 4);
  EXPECT_EQ(r1.blocks_skipped, 1);
  EXPECT_THAT(r1.unmatched_residues, testing::ElementsAre("SER 3", "LYS 9"));
}

}  // namespace
