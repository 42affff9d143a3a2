#include <algorithm>
#include <iostream>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_cat.h"

#include "CGMap_Lib/errors.h"
#include "CGMap_Lib/resolution.h"

namespace cgmap {

using std::cerr;

Candidate
MakeCandidate(int rule, const std::string& name, int declaration_order,
              Correspondence&& correspondence,
              const ResidueIndex& residues) {
  Candidate result;
  result.rule = rule;
  result.name = name;
  result.declaration_order = declaration_order;
  result.specificity = correspondence.specificity();
  result.atoms_covered = correspondence.atoms_covered();
  result.target_atoms = correspondence.TargetAtoms();
  if (! result.target_atoms.empty()) {
    result.region = residues.LabelOf(*result.target_atoms.begin());
  }
  result.correspondence = std::move(correspondence);

  return result;
}

bool
RanksBefore(const Candidate& c1, const Candidate& c2) {
  if (c1.specificity != c2.specificity) {
    return c1.specificity > c2.specificity;
  }

  if (c1.atoms_covered != c2.atoms_covered) {
    return c1.atoms_covered > c2.atoms_covered;
  }

  return c1.declaration_order < c2.declaration_order;
}

bool
TiedRank(const Candidate& c1, const Candidate& c2) {
  return c1.specificity == c2.specificity &&
         c1.atoms_covered == c2.atoms_covered &&
         c1.declaration_order == c2.declaration_order;
}

void
RankCandidates(std::vector<Candidate>& candidates) {
  std::stable_sort(candidates.begin(), candidates.end(), RanksBefore);
}

namespace {

std::string
Describe(const Candidate& c) {
  return absl::StrCat(c.name, " at ", c.region);
}

bool
Intersects(const NodeSet& s1, const NodeSet& s2) {
  for (node_id_t id : s1) {
    if (s2.contains(id)) {
      return true;
    }
  }

  return false;
}

}  // namespace

absl::StatusOr<std::vector<int>>
SelectNonOverlapping(const std::vector<Candidate>& ranked,
                     bool require_unique,
                     int verbose) {
  std::vector<int> accepted;

  // Target atom to the accepted candidate that holds it.
  absl::flat_hash_map<node_id_t, int> owner;

  for (size_t i = 0; i < ranked.size(); ++i) {
    const Candidate& c = ranked[i];

    // The accepted candidates this one shares atoms with.
    std::vector<int> overlapping;
    for (node_id_t id : c.target_atoms) {
      auto iter = owner.find(id);
      if (iter == owner.end()) {
        continue;
      }
      if (std::find(overlapping.begin(), overlapping.end(), iter->second) == overlapping.end()) {
        overlapping.push_back(iter->second);
      }
    }

    if (overlapping.empty()) {
      accepted.push_back(i);
      for (node_id_t id : c.target_atoms) {
        owner[id] = i;
      }
      continue;
    }

    if (require_unique) {
      for (int j : overlapping) {
        if (TiedRank(ranked[j], c)) {
          return AmbiguousMatchError(absl::StrCat("cannot choose between ", Describe(ranked[j]),
                                                  " and ", Describe(c)));
        }
      }
    }

    // Contained within a single accepted region, superseded.
    bool contained = false;
    if (overlapping.size() == 1) {
      const NodeSet& region = ranked[overlapping[0]].target_atoms;
      contained = std::all_of(c.target_atoms.begin(), c.target_atoms.end(),
                              [&region](node_id_t id) { return region.contains(id);});
    }

    if (! contained && verbose) {
      cerr << "SelectNonOverlapping:" << Describe(c) << " partly overlaps "
           << Describe(ranked[overlapping[0]]) << ", dropped\n";
    }
  }

  return accepted;
}

}  // namespace cgmap
