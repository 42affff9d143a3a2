#include <algorithm>
#include <iostream>
#include <utility>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "CGMap_Lib/errors.h"
#include "CGMap_Lib/graph_transformer.h"
#include "CGMap_Lib/resolution.h"

namespace cgmap {

using std::cerr;

void
MappingReport::Add(const MappingReport& rhs) {
  residues_mapped += rhs.residues_mapped;
  modifications_applied += rhs.modifications_applied;
  modifications_skipped += rhs.modifications_skipped;
  blocks_skipped += rhs.blocks_skipped;
  links_applied += rhs.links_applied;
  unmapped_atoms += rhs.unmapped_atoms;
  unmatched_residues.insert(unmatched_residues.end(), rhs.unmatched_residues.begin(),
                            rhs.unmatched_residues.end());
}

int
MappingReport::Report(std::ostream& output) const {
  output << residues_mapped << " residues mapped\n";
  output << modifications_applied << " modifications applied";
  if (modifications_skipped) {
    output << ", " << modifications_skipped << " skipped";
  }
  output << '\n';
  if (blocks_skipped) {
    output << blocks_skipped << " block matches skipped\n";
  }
  output << links_applied << " links applied\n";
  output << unmapped_atoms << " atoms not mapped\n";
  if (! unmatched_residues.empty()) {
    output << unmatched_residues.size() << " residues without a block: "
           << absl::StrJoin(unmatched_residues, ", ") << '\n';
  }

  return output.good();
}

GraphTransformer::GraphTransformer() {
  _verbose = 0;
  _aggregate.push_back(kPosition);
  _require_unique = false;
  _skip_inconsistent_residues = true;
  _fail_on_unmapped = false;
}

void
GraphTransformer::set_verbose(int s) {
  _verbose = s;
  _matcher.set_verbose(s);
}

namespace {

// Label for the residue of the first bound atom of `c`.
std::string
RegionOf(const MolecularGraph& target, const Correspondence& c) {
  for (node_id_t t : c.targets()) {
    if (t == Correspondence::kUnbound) {
      continue;
    }
    const AttributeMap* attributes = target.attributes(t);
    if (attributes != nullptr) {
      return ResidueLabel(*attributes);
    }
  }

  return "?";
}

void
CopyIfPresent(const AttributeMap& from, const char* key, AttributeMap& to) {
  if (to.contains(key)) {
    return;
  }

  const AttributeValue* v = FindAttribute(from, key);
  if (v != nullptr) {
    to[key] = *v;
  }
}

}  // namespace

absl::Status
GraphTransformer::ApplyModification(MolecularGraph& target,
                                    const PatternRule& modification,
                                    const Correspondence& c) const {
  const Pattern& pattern = modification.pattern();
  const int n = pattern.number_atoms();

  const std::string region = RegionOf(target, c);
  auto fail = [&modification, &region](absl::string_view why) {
    return StructuralInconsistencyError(absl::StrCat("modification ", modification.name(),
                                                     " at ", region, ": ", why));
  };

  if (c.number_atoms() != n) {
    return fail("correspondence does not fit the modification");
  }

  // Nothing is changed until everything has been checked.
  for (int i = 0; i < n; ++i) {
    if (c.is_bound(i)) {
      if (! target.HasNode(c[i])) {
        return fail(absl::StrCat("atom ", pattern.atom(i).token, " is no longer present"));
      }
    } else if (! pattern.atom(i).additive()) {
      return fail(absl::StrCat("atom ", pattern.atom(i).token, " is not matched"));
    }
  }

  // Each atom to be created is attached to a bound atom, or to an atom
  // created before it.
  std::vector<int> anchor(n, -1);
  std::vector<int> creation_order;
  std::vector<int> placed(n, 0);
  for (int i = 0; i < n; ++i) {
    if (c.is_bound(i) && ! pattern.atom(i).subtractive()) {
      placed[i] = 1;
    }
  }

  for (bool changed = true; changed; ) {
    changed = false;
    for (int i = 0; i < n; ++i) {
      if (c.is_bound(i) || anchor[i] >= 0) {
        continue;
      }
      for (int nbr : pattern.neighbours(i)) {
        if (placed[nbr]) {
          anchor[i] = nbr;
          placed[i] = 1;
          creation_order.push_back(i);
          changed = true;
          break;
        }
      }
    }
  }

  for (int i = 0; i < n; ++i) {
    if (! c.is_bound(i) && anchor[i] < 0) {
      return fail(absl::StrCat("dangling PTM atom ", pattern.atom(i).token,
                               ", no bonded atom to attach to"));
    }
  }

  for (const RuleEdge& e : pattern.edges()) {
    const bool removed = (c.is_bound(e.a1) && pattern.atom(e.a1).subtractive()) ||
                         (c.is_bound(e.a2) && pattern.atom(e.a2).subtractive());
    const bool created = ! c.is_bound(e.a1) || ! c.is_bound(e.a2);
    if (removed && created) {
      return fail(absl::StrCat("edge ", pattern.atom(e.a1).token, " ", pattern.atom(e.a2).token,
                               " joins a created atom to a removed atom"));
    }
    if (e.a1 == e.a2 || (c.is_bound(e.a1) && c.is_bound(e.a2) && c[e.a1] == c[e.a2])) {
      return fail(absl::StrCat("edge ", pattern.atom(e.a1).token, " ", pattern.atom(e.a2).token,
                               " joins an atom to itself"));
    }
  }

  // Checks done, make the changes.
  std::vector<node_id_t> id(c.targets());

  for (int i : creation_order) {
    const RuleAtom& atom = pattern.atom(i);

    AttributeMap attributes;
    for (const auto& [key, predicate] : atom.predicates) {
      if (predicate.kind() == PredicateKind::kLiteral) {
        attributes[key] = predicate.literal();
      }
    }
    for (const auto& [key, value] : atom.replace) {
      if (! value.is_null()) {
        attributes[key] = value;
      }
    }
    if (! attributes.contains(kAtomName)) {
      attributes[kAtomName] = AttributeValue(atom.name);
    }
    attributes[kPtmAtom] = AttributeValue(true);
    attributes[kModification] = AttributeValue(modification.name());

    const AttributeMap* from = target.attributes(id[anchor[i]]);
    for (const char* key : {kChain, kResId, kResName, kPosition}) {
      CopyIfPresent(*from, key, attributes);
    }

    id[i] = target.AddNode(attributes);
  }

  for (int i = 0; i < n; ++i) {
    if (! c.is_bound(i) || pattern.atom(i).subtractive()) {
      continue;
    }
    AttributeMap changes = pattern.atom(i).replace;
    changes[kModification] = AttributeValue(modification.name());
    target.MergeAttributes(id[i], changes);
  }

  for (const RuleEdge& e : pattern.edges()) {
    if ((c.is_bound(e.a1) && pattern.atom(e.a1).subtractive()) ||
        (c.is_bound(e.a2) && pattern.atom(e.a2).subtractive())) {
      continue;
    }
    // Ends are present and distinct, checked above.
    target.AddEdge(id[e.a1], id[e.a2], e.attributes);
  }

  for (int i = 0; i < n; ++i) {
    if (c.is_bound(i) && pattern.atom(i).subtractive()) {
      target.RemoveNode(id[i]);
    }
  }

  if (_verbose > 1) {
    cerr << "GraphTransformer::ApplyModification:applied " << modification.name() << " at " << region << '\n';
  }

  return absl::OkStatus();
}

absl::Status
GraphTransformer::ApplyModifications(MolecularGraph& target,
                                     const std::vector<PatternRule>& modifications,
                                     MappingReport& report) const {
  if (modifications.empty()) {
    return absl::OkStatus();
  }

  const ResidueIndex residues(target);

  std::vector<Candidate> candidates;
  for (size_t i = 0; i < modifications.size(); ++i) {
    const PatternRule& m = modifications[i];
    for (Correspondence& c : _matcher.Match(target, residues, m.pattern())) {
      candidates.push_back(MakeCandidate(i, m.name(), m.declaration_order(), std::move(c), residues));
    }
  }

  RankCandidates(candidates);

  absl::StatusOr<std::vector<int>> selected = SelectNonOverlapping(candidates, _require_unique, _verbose);
  if (! selected.ok()) {
    return selected.status();
  }

  for (int i : *selected) {
    const Candidate& candidate = candidates[i];
    absl::Status status = ApplyModification(target, modifications[candidate.rule],
                                            candidate.correspondence);
    if (status.ok()) {
      ++report.modifications_applied;
      continue;
    }

    if (KindOf(status) != ErrorKind::kStructuralInconsistency || ! _skip_inconsistent_residues) {
      return status;
    }

    ++report.modifications_skipped;
    if (_verbose) {
      cerr << "GraphTransformer::ApplyModifications:skipped " << status.message() << '\n';
    }
  }

  return absl::OkStatus();
}

// Weight normalised mean of each aggregated attribute over `sources`.
// Sources lacking the attribute do not contribute.
absl::Status
GraphTransformer::_Aggregate(const MolecularGraph& target,
                             const std::vector<std::pair<node_id_t, double>>& sources,
                             AttributeMap& destination) const {
  for (const std::string& key : _aggregate) {
    double total_weight = 0.0;
    std::vector<double> sum;
    bool is_vector = false;
    bool found = false;

    for (const auto& [id, weight] : sources) {
      const AttributeValue* v = FindAttribute(*target.attributes(id), key);
      if (v == nullptr) {
        continue;
      }

      if (v->is_numeric()) {
        if (found && is_vector) {
          return StructuralInconsistencyError(absl::StrCat("'", key, "' mixes scalars and vectors"));
        }
        double x;
        v->AsDouble(x);
        sum.resize(1, 0.0);
        sum[0] += weight * x;
      } else if (v->is_vector()) {
        const std::vector<double>& x = v->vector_value();
        if (found && (! is_vector || x.size() != sum.size())) {
          return StructuralInconsistencyError(absl::StrCat("'", key, "' has inconsistent dimensions"));
        }
        sum.resize(x.size(), 0.0);
        for (size_t j = 0; j < x.size(); ++j) {
          sum[j] += weight * x[j];
        }
        is_vector = true;
      } else {
        if (_verbose) {
          cerr << "GraphTransformer::_Aggregate:cannot average '" << key << "' value " << *v << '\n';
        }
        continue;
      }

      total_weight += weight;
      found = true;
    }

    if (! found) {
      continue;
    }

    for (double& x : sum) {
      x /= total_weight;
    }

    if (is_vector) {
      destination[key] = AttributeValue(sum);
    } else {
      destination[key] = AttributeValue(sum[0]);
    }
  }

  return absl::OkStatus();
}

absl::Status
GraphTransformer::ApplyBlock(const MolecularGraph& target,
                             const Block& block,
                             const Correspondence& c,
                             MolecularGraph& output,
                             SourceToOutput& source_to_output) const {
  const Pattern& from = block.from();
  const std::string region = RegionOf(target, c);

  auto fail = [&block, &region](absl::string_view why) {
    return StructuralInconsistencyError(absl::StrCat("block ", block.name(), " at ", region,
                                                     ": ", why));
  };

  if (c.number_atoms() != from.number_atoms()) {
    return fail("correspondence does not fit the block");
  }

  const std::vector<DestinationAtom>& destinations = block.destinations();

  // Every output atom is built before any is added, so a failure
  // leaves `output` unchanged.
  std::vector<AttributeMap> atoms(destinations.size());
  std::vector<std::vector<std::pair<node_id_t, double>>> atom_sources(destinations.size());

  for (size_t k = 0; k < destinations.size(); ++k) {
    const DestinationAtom& d = destinations[k];

    std::vector<std::pair<node_id_t, double>>& sources = atom_sources[k];
    for (const MappingEntry& m : block.mapping()) {
      if (m.destination != d.token) {
        continue;
      }
      const int i = from.IndexOf(m.source);
      if (i < 0 || ! c.is_bound(i) || ! target.HasNode(c[i])) {
        return fail(absl::StrCat("source ", m.source, " of ", d.token, " is not matched"));
      }
      sources.emplace_back(c[i], m.weight);
    }

    const int r = from.IndexOf(block.ReferenceAtom(d.token));
    if (r < 0 || ! c.is_bound(r) || ! target.HasNode(c[r])) {
      return fail(absl::StrCat("no reference atom for ", d.token));
    }
    const AttributeMap& reference = *target.attributes(c[r]);

    AttributeMap& attributes = atoms[k];
    CopyIfPresent(reference, kChain, attributes);
    CopyIfPresent(reference, kResId, attributes);
    if (d.order < static_cast<int>(block.to_blocks().size())) {
      attributes[kResName] = AttributeValue(block.to_blocks()[d.order]);
    } else {
      CopyIfPresent(reference, kResName, attributes);
    }
    attributes[kAtomName] = AttributeValue(d.name);

    absl::Status status = _Aggregate(target, sources, attributes);
    if (! status.ok()) {
      return AddContext(status, absl::StrCat("block ", block.name(), " at ", region, " ", d.token));
    }

    for (const auto& [key, value] : d.attributes) {
      attributes[key] = value;
    }
  }

  for (const RuleEdge& e : block.to_edges()) {
    if (e.a1 == e.a2) {
      return fail(absl::StrCat("to edge joins ", destinations[e.a1].token, " to itself"));
    }
  }

  std::vector<node_id_t> output_id(destinations.size());
  for (size_t k = 0; k < destinations.size(); ++k) {
    output_id[k] = output.AddNode(atoms[k]);
    for (const auto& [source, weight] : atom_sources[k]) {
      source_to_output[source].push_back(output_id[k]);
    }
  }

  // Both ends were just added and are distinct, so this cannot fail.
  for (const RuleEdge& e : block.to_edges()) {
    output.AddEdge(output_id[e.a1], output_id[e.a2], e.attributes);
  }

  return absl::OkStatus();
}

int
AddInducedEdges(const MolecularGraph& target,
                const SourceToOutput& source_to_output,
                MolecularGraph& output) {
  int result = 0;

  for (const auto& [key, attributes] : target.edges()) {
    auto i1 = source_to_output.find(key.first);
    if (i1 == source_to_output.end()) {
      continue;
    }
    auto i2 = source_to_output.find(key.second);
    if (i2 == source_to_output.end()) {
      continue;
    }

    for (node_id_t o1 : i1->second) {
      for (node_id_t o2 : i2->second) {
        if (o1 == o2 || output.HasEdge(o1, o2)) {
          continue;
        }
        if (output.AddEdge(o1, o2)) {
          ++result;
        }
      }
    }
  }

  return result;
}

absl::StatusOr<MolecularGraph>
GraphTransformer::Apply(const MolecularGraph& target,
                        const Block& block,
                        const Correspondence& correspondence) const {
  MolecularGraph output;
  output.set_name(target.name());

  SourceToOutput source_to_output;
  absl::Status status = ApplyBlock(target, block, correspondence, output, source_to_output);
  if (! status.ok()) {
    return status;
  }

  AddInducedEdges(target, source_to_output, output);

  return output;
}

absl::StatusOr<MolecularGraph>
GraphTransformer::MapBlocks(const MolecularGraph& target,
                            const std::vector<Block>& blocks,
                            node_id_t first_node_id,
                            MappingReport& report) const {
  const ResidueIndex residues(target);

  std::vector<Candidate> candidates;
  for (size_t i = 0; i < blocks.size(); ++i) {
    const Block& b = blocks[i];
    for (Correspondence& c : _matcher.Match(target, residues, b.from())) {
      candidates.push_back(MakeCandidate(i, b.name(), b.declaration_order(), std::move(c), residues));
    }
  }

  RankCandidates(candidates);

  absl::StatusOr<std::vector<int>> selected = SelectNonOverlapping(candidates, _require_unique, _verbose);
  if (! selected.ok()) {
    return selected.status();
  }

  // Output atoms follow the order of the input atoms.
  std::vector<int> accepted = *std::move(selected);
  std::sort(accepted.begin(), accepted.end(), [&candidates](int i1, int i2) {
    return *candidates[i1].target_atoms.begin() < *candidates[i2].target_atoms.begin();
  });

  MolecularGraph output;
  output.set_name(target.name());
  output.set_next_id(first_node_id);

  SourceToOutput source_to_output;
  NodeSet covered;

  for (int i : accepted) {
    const Candidate& candidate = candidates[i];
    absl::Status status = ApplyBlock(target, blocks[candidate.rule], candidate.correspondence,
                                     output, source_to_output);
    if (! status.ok()) {
      if (KindOf(status) != ErrorKind::kStructuralInconsistency || ! _skip_inconsistent_residues) {
        return status;
      }
      // The atoms stay uncovered, so the residue is reported as unmatched.
      ++report.blocks_skipped;
      if (_verbose) {
        cerr << "GraphTransformer::MapBlocks:skipped " << status.message() << '\n';
      }
      continue;
    }

    covered.insert(candidate.target_atoms.begin(), candidate.target_atoms.end());

    if (_verbose > 1) {
      cerr << "GraphTransformer::MapBlocks:block " << candidate.name << " at " << candidate.region << '\n';
    }
  }

  AddInducedEdges(target, source_to_output, output);

  for (const auto& [id, attributes] : target.nodes()) {
    if (! covered.contains(id)) {
      ++report.unmapped_atoms;
    }
  }

  std::vector<std::string> unmatched;
  for (int r = 0; r < residues.number_residues(); ++r) {
    const std::vector<node_id_t>& members = residues.members(r);
    const bool any = std::any_of(members.begin(), members.end(),
                                 [&covered](node_id_t id) { return covered.contains(id);});
    if (any) {
      ++report.residues_mapped;
    } else {
      unmatched.push_back(residues.label(r));
    }
  }

  if (_verbose && ! unmatched.empty()) {
    cerr << "GraphTransformer::MapBlocks:no block for " << absl::StrJoin(unmatched, ", ") << '\n';
  }

  if (_fail_on_unmapped && ! unmatched.empty()) {
    return NoMatchError(absl::StrCat("molecule ", target.name(), ": no block matches ",
                                     absl::StrJoin(unmatched, ", ")));
  }

  report.unmatched_residues.insert(report.unmatched_residues.end(), unmatched.begin(), unmatched.end());

  return output;
}

absl::Status
GraphTransformer::ApplyLinks(MolecularGraph& output,
                             const std::vector<PatternRule>& links,
                             MappingReport& report) const {
  ResidueIndex residues(output);

  for (const PatternRule& link : links) {
    const Pattern& pattern = link.pattern();
    bool residues_changed = false;
    for (const Correspondence& c : _matcher.Match(output, residues, pattern)) {
      for (const RuleEdge& e : pattern.edges()) {
        if (! c.is_bound(e.a1) || ! c.is_bound(e.a2)) {
          continue;
        }
        if (! output.AddEdge(c[e.a1], c[e.a2], e.attributes)) {
          return StructuralInconsistencyError(absl::StrCat("link ", link.name(), " at ",
                                                           RegionOf(output, c), ": cannot add edge"));
        }
      }

      for (int i = 0; i < pattern.number_atoms(); ++i) {
        if (! c.is_bound(i) || pattern.atom(i).replace.empty()) {
          continue;
        }
        const AttributeMap& replace = pattern.atom(i).replace;
        output.MergeAttributes(c[i], replace);
        if (replace.contains(kChain) || replace.contains(kResId) || replace.contains(kResName)) {
          residues_changed = true;
        }
      }

      ++report.links_applied;
    }

    // Later links see the residues as this one left them.
    if (residues_changed) {
      residues = ResidueIndex(output);
    }
  }

  return absl::OkStatus();
}

}  // namespace cgmap
