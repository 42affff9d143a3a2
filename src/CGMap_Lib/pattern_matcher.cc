#include <algorithm>
#include <iostream>
#include <utility>

#include "absl/container/btree_set.h"
#include "absl/container/flat_hash_set.h"

#include "CGMap_Lib/pattern_matcher.h"

namespace cgmap {

using std::cerr;

Correspondence::Correspondence() {
  _specificity = 0;
}

Correspondence::Correspondence(int number_atoms, int specificity) :
        _target(number_atoms, kUnbound),
        _specificity(specificity) {
}

int
Correspondence::atoms_covered() const {
  int result = 0;
  for (node_id_t t : _target) {
    if (t != kUnbound) {
      ++result;
    }
  }

  return result;
}

NodeSet
Correspondence::TargetAtoms() const {
  NodeSet result;
  for (node_id_t t : _target) {
    if (t != kUnbound) {
      result.insert(t);
    }
  }

  return result;
}

PatternMatcher::PatternMatcher() {
  _verbose = 0;
  _keep_symmetric_permutations = false;
  _max_matches = 0;
}

namespace {

// The working state of one Match call.
class MatchState {
  private:
    const MolecularGraph& _target;
    const ResidueIndex& _residues;
    const Pattern& _pattern;

    const bool _keep_symmetric_permutations;
    const uint32_t _max_matches;

    // For each pattern atom, the target atoms satisfying its predicates.
    std::vector<std::vector<node_id_t>> _candidates;
    std::vector<absl::flat_hash_set<node_id_t>> _is_candidate;

    // Pattern atoms that must be bound, in the order they are bound.
    std::vector<int> _order;

    // Additive PTM atoms, bound after the others if possible.
    std::vector<int> _optional;

    // The binding being built.
    std::vector<node_id_t> _binding;
    absl::flat_hash_set<node_id_t> _already_matched;

    // For each atom of _order, a previously bound pattern neighbour,
    // or -1. Candidates are drawn from the target neighbours of its match.
    std::vector<int> _anchor;

    // Keys of correspondences already reported.
    absl::btree_set<std::vector<std::pair<node_id_t, int>>> _seen;

    std::vector<Correspondence> _results;

  // private functions

    void _BuildSearchOrder();
    bool _Acceptable(int a, node_id_t t) const;
    void _Extend(int depth);
    void _BindOptional();
    bool _Done() const;

  public:
    MatchState(const MolecularGraph& target, const ResidueIndex& residues,
               const Pattern& pattern, bool keep_symmetric_permutations,
               uint32_t max_matches);

    // Returns 0 if some required pattern atom has no candidates.
    int Initialise();

    std::vector<Correspondence> Search();

    int number_required() const { return _order.size();}
};

MatchState::MatchState(const MolecularGraph& target, const ResidueIndex& residues,
                       const Pattern& pattern, bool keep_symmetric_permutations,
                       uint32_t max_matches) :
        _target(target),
        _residues(residues),
        _pattern(pattern),
        _keep_symmetric_permutations(keep_symmetric_permutations),
        _max_matches(max_matches) {
}

int
MatchState::Initialise() {
  const int n = _pattern.number_atoms();

  _candidates.assign(n, std::vector<node_id_t>());
  _is_candidate.assign(n, absl::flat_hash_set<node_id_t>());

  for (int i = 0; i < n; ++i) {
    const PredicateMap& predicates = _pattern.atom(i).predicates;
    for (const auto& [id, attributes] : _target.nodes()) {
      if (PredicatesMatch(predicates, attributes)) {
        _candidates[i].push_back(id);
        _is_candidate[i].insert(id);
      }
    }

    if (_candidates[i].empty() && ! _pattern.atom(i).additive()) {
      return 0;
    }
  }

  _BuildSearchOrder();

  _binding.assign(n, Correspondence::kUnbound);

  return 1;
}

// Required atoms are ordered so that each atom after the first is, if
// possible, bonded to an atom already placed. The first atom is the
// one with fewest candidates, ties to the highest degree.
void
MatchState::_BuildSearchOrder() {
  const int n = _pattern.number_atoms();

  std::vector<int> remaining;
  for (int i = 0; i < n; ++i) {
    if (_pattern.atom(i).additive()) {
      _optional.push_back(i);
    } else {
      remaining.push_back(i);
    }
  }

  std::vector<int> placed(n, 0);

  while (! remaining.empty()) {
    int best = -1;
    int best_connections = -1;
    for (size_t j = 0; j < remaining.size(); ++j) {
      const int a = remaining[j];
      int connections = 0;
      for (int nbr : _pattern.neighbours(a)) {
        if (placed[nbr]) {
          ++connections;
        }
      }

      if (best < 0) {
        best = j;
        best_connections = connections;
        continue;
      }

      const int b = remaining[best];
      // More connections to placed atoms, then fewer candidates, then
      // higher degree. Index breaks ties, remaining is in index order.
      if (connections > best_connections ||
          (connections == best_connections &&
           (_candidates[a].size() < _candidates[b].size() ||
            (_candidates[a].size() == _candidates[b].size() &&
             _pattern.degree(a) > _pattern.degree(b))))) {
        best = j;
        best_connections = connections;
      }
    }

    const int a = remaining[best];
    int anchor = -1;
    for (int nbr : _pattern.neighbours(a)) {
      if (placed[nbr] && ! _pattern.atom(nbr).additive()) {
        anchor = nbr;
        break;
      }
    }

    _order.push_back(a);
    _anchor.push_back(anchor);
    placed[a] = 1;
    remaining.erase(remaining.begin() + best);
  }
}

bool
MatchState::_Done() const {
  return _max_matches > 0 && _results.size() >= _max_matches;
}

// Can pattern atom `a` be bound to target atom `t`, given what is
// bound so far.
bool
MatchState::_Acceptable(int a, node_id_t t) const {
  if (_already_matched.contains(t)) {
    return false;
  }

  if (! _is_candidate[a].contains(t)) {
    return false;
  }

  for (int nbr : _pattern.neighbours(a)) {
    const node_id_t tn = _binding[nbr];
    if (tn == Correspondence::kUnbound) {
      continue;
    }
    if (! _target.HasEdge(t, tn)) {
      return false;
    }
  }

  // Relative residue placement, measured from the first bound atom.
  if (! _order.empty()) {
    const int first = _order[0];
    const node_id_t tf = _binding[first];
    if (tf != Correspondence::kUnbound) {
      const int delta_target = _residues.residue(t) - _residues.residue(tf);
      const int delta_pattern = _pattern.atom(a).order - _pattern.atom(first).order;
      if (delta_target != delta_pattern) {
        return false;
      }
    }
  }

  return true;
}

void
MatchState::_Extend(int depth) {
  if (_Done()) {
    return;
  }

  if (depth == static_cast<int>(_order.size())) {
    _BindOptional();
    return;
  }

  const int a = _order[depth];
  const int anchor = _anchor[depth];

  // Copy, the binding changes below us.
  std::vector<node_id_t> choices;
  if (anchor >= 0) {
    const NodeSet& nbrs = _target.neighbours(_binding[anchor]);
    choices.assign(nbrs.begin(), nbrs.end());
  } else {
    choices = _candidates[a];
  }

  for (node_id_t t : choices) {
    if (! _Acceptable(a, t)) {
      continue;
    }

    _binding[a] = t;
    _already_matched.insert(t);

    _Extend(depth + 1);

    _already_matched.erase(t);
    _binding[a] = Correspondence::kUnbound;

    if (_Done()) {
      return;
    }
  }
}

// The required atoms are bound. Bind what optional atoms we can, then
// record the correspondence unless it is a permutation of one already seen.
void
MatchState::_BindOptional() {
  std::vector<node_id_t> bound_here;

  for (int a : _optional) {
    for (node_id_t t : _candidates[a]) {
      if (_Acceptable(a, t)) {
        _binding[a] = t;
        _already_matched.insert(t);
        bound_here.push_back(t);
        break;
      }
    }
  }

  std::vector<std::pair<node_id_t, int>> key;
  for (size_t i = 0; i < _binding.size(); ++i) {
    if (_binding[i] != Correspondence::kUnbound) {
      key.emplace_back(_binding[i], _keep_symmetric_permutations ? i : _pattern.symmetry_class(i));
    }
  }
  std::sort(key.begin(), key.end());

  if (_seen.insert(key).second) {
    Correspondence c(_binding.size(), _pattern.specificity());
    for (size_t i = 0; i < _binding.size(); ++i) {
      c.set(i, _binding[i]);
    }
    _results.push_back(std::move(c));
  }

  for (int a : _optional) {
    _binding[a] = Correspondence::kUnbound;
  }
  for (node_id_t t : bound_here) {
    _already_matched.erase(t);
  }
}

std::vector<Correspondence>
MatchState::Search() {
  _Extend(0);

  return std::move(_results);
}

}  // namespace

std::vector<Correspondence>
PatternMatcher::Match(const MolecularGraph& target, const Pattern& pattern) const {
  const ResidueIndex residues(target);

  return Match(target, residues, pattern);
}

std::vector<Correspondence>
PatternMatcher::Match(const MolecularGraph& target,
                      const ResidueIndex& residues,
                      const Pattern& pattern) const {
  if (pattern.empty() || target.empty()) {
    return std::vector<Correspondence>();
  }

  MatchState state(target, residues, pattern, _keep_symmetric_permutations, _max_matches);

  if (! state.Initialise()) {
    return std::vector<Correspondence>();
  }

  if (state.number_required() == 0) {
    if (_verbose) {
      cerr << "PatternMatcher::Match:pattern has only PTM atoms, nothing to anchor a match\n";
    }
    return std::vector<Correspondence>();
  }

  std::vector<Correspondence> result = state.Search();

  if (_verbose > 1) {
    cerr << "PatternMatcher::Match:" << result.size() << " correspondences\n";
  }

  return result;
}

}  // namespace cgmap
