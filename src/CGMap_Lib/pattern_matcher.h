#ifndef CGMAP_LIB_PATTERN_MATCHER_H_
#define CGMAP_LIB_PATTERN_MATCHER_H_

#include <cstdint>
#include <limits>
#include <vector>

#include "CGMap_Lib/molecular_graph.h"
#include "CGMap_Lib/residue_index.h"
#include "CGMap_Lib/rule_records.h"

namespace cgmap {

// The result of matching a Pattern against a target graph. For each
// atom of the pattern, the target atom it is bound to. Atoms that a
// modification will create may be left unbound.
class Correspondence {
  public:
    static constexpr node_id_t kUnbound = std::numeric_limits<node_id_t>::max();

  private:
    std::vector<node_id_t> _target;

    // Copied from the pattern.
    int _specificity;

  public:
    Correspondence();
    Correspondence(int number_atoms, int specificity);

    int number_atoms() const { return _target.size();}

    node_id_t operator[](int i) const { return _target[i];}
    void set(int i, node_id_t t) { _target[i] = t;}

    bool is_bound(int i) const { return _target[i] != kUnbound;}

    int specificity() const { return _specificity;}

    // The number of bound pattern atoms.
    int atoms_covered() const;

    // The target atoms bound.
    NodeSet TargetAtoms() const;

    const std::vector<node_id_t>& targets() const { return _target;}

    bool operator==(const Correspondence& rhs) const { return _target == rhs._target;}
};

// Constrained subgraph isomorphism of a rule Pattern into a target graph.
//  - a pattern atom may only be bound to a target atom satisfying all
//    of its attribute predicates,
//  - every pattern edge between bound atoms must be a target edge,
//  - the residue of each bound target atom, relative to the residue
//    of the first bound atom, must equal the order of the pattern atom
//    relative to the first bound pattern atom,
//  - additive PTM atoms are bound if a suitable target atom exists,
//    otherwise left unbound.
// Atoms are bound most constrained first, then by growing along the
// pattern edges, so that candidates come from target neighbours.
// The target graph is never changed.
class PatternMatcher {
  private:
    int _verbose;

    // Report correspondences that only differ by a permutation of
    // interchangeable pattern atoms.
    bool _keep_symmetric_permutations;

    // Zero means no limit.
    uint32_t _max_matches;

  public:
    PatternMatcher();

    void set_verbose(int s) { _verbose = s;}
    void set_keep_symmetric_permutations(bool s) { _keep_symmetric_permutations = s;}
    void set_max_matches(uint32_t s) { _max_matches = s;}

    // An empty result means the pattern does not occur.
    std::vector<Correspondence> Match(const MolecularGraph& target,
                                      const Pattern& pattern) const;

    // Use when matching many patterns against the same graph.
    std::vector<Correspondence> Match(const MolecularGraph& target,
                                      const ResidueIndex& residues,
                                      const Pattern& pattern) const;
};

}  // namespace cgmap

#endif  // CGMAP_LIB_PATTERN_MATCHER_H_
