#ifndef CGMAP_LIB_RESOLUTION_H_
#define CGMAP_LIB_RESOLUTION_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"

#include "CGMap_Lib/molecular_graph.h"
#include "CGMap_Lib/pattern_matcher.h"
#include "CGMap_Lib/residue_index.h"

namespace cgmap {

// A correspondence of one rule, competing with others for atoms of the
// target.
struct Candidate {
  // Index of the rule in the list it came from.
  int rule = 0;
  std::string name;
  int declaration_order = 0;

  // Ranking keys.
  int specificity = 0;
  int atoms_covered = 0;

  Correspondence correspondence;
  NodeSet target_atoms;

  // "resname resid" of the first bound atom, for messages.
  std::string region;
};

Candidate MakeCandidate(int rule, const std::string& name, int declaration_order,
                        Correspondence&& correspondence,
                        const ResidueIndex& residues);

// True if `c1` should be preferred to `c2`: higher specificity, then
// more atoms covered, then declared earlier.
bool RanksBefore(const Candidate& c1, const Candidate& c2);

// Equal on all three ranking keys.
bool TiedRank(const Candidate& c1, const Candidate& c2);

// Stable sort by RanksBefore, so candidates tied on every key keep
// the order in which they were generated.
void RankCandidates(std::vector<Candidate>& candidates);

// Candidates over a whole graph, for regions that may partly overlap.
// Walk the ranked list, accepting a candidate whose target atoms are
// disjoint from all those accepted. A candidate whose atoms lie within
// an accepted region is dropped silently, one that partly overlaps is
// dropped with a diagnostic when `verbose`. With `require_unique`, a
// candidate tied with an accepted one it overlaps is an
// AmbiguousMatchError.
// Returns the indices of accepted candidates, in ranked order.
absl::StatusOr<std::vector<int>> SelectNonOverlapping(const std::vector<Candidate>& ranked,
                                                      bool require_unique,
                                                      int verbose = 0);

}  // namespace cgmap

#endif  // CGMAP_LIB_RESOLUTION_H_
