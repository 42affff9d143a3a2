#ifndef CGMAP_LIB_GRAPH_TRANSFORMER_H_
#define CGMAP_LIB_GRAPH_TRANSFORMER_H_

#include <iostream>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "CGMap_Lib/molecular_graph.h"
#include "CGMap_Lib/pattern_matcher.h"
#include "CGMap_Lib/residue_index.h"
#include "CGMap_Lib/rule_records.h"

namespace cgmap {

// What happened while mapping one or more molecules.
struct MappingReport {
  int residues_mapped = 0;
  int modifications_applied = 0;
  int modifications_skipped = 0;
  int links_applied = 0;

  // Block matches whose output atoms could not be built.
  int blocks_skipped = 0;

  // Target atoms not part of any block match.
  int unmapped_atoms = 0;

  // "resname resid" of residues that no block covered.
  std::vector<std::string> unmatched_residues;

  void Add(const MappingReport& rhs);

  int Report(std::ostream& output) const;
};

// Source atom to the output atoms it contributes to.
using SourceToOutput = absl::flat_hash_map<node_id_t, std::vector<node_id_t>>;

// Changes a target graph according to matched rules, and builds the
// output graph of a mapping.
class GraphTransformer {
  private:
    int _verbose;

    // Attributes averaged over the source atoms of an output atom.
    std::vector<std::string> _aggregate;

    bool _require_unique;

    // A modification or block match that cannot be applied is skipped
    // rather than failing the molecule.
    bool _skip_inconsistent_residues;

    bool _fail_on_unmapped;

    PatternMatcher _matcher;

  // private functions

    absl::Status _Aggregate(const MolecularGraph& target,
                            const std::vector<std::pair<node_id_t, double>>& sources,
                            AttributeMap& destination) const;

  public:
    GraphTransformer();

    void set_verbose(int s);
    void set_require_unique(bool s) { _require_unique = s;}
    void set_skip_inconsistent_residues(bool s) { _skip_inconsistent_residues = s;}
    void set_fail_on_unmapped(bool s) { _fail_on_unmapped = s;}

    // Replaces the default, which is "position".
    void set_aggregate_attributes(const std::vector<std::string>& s) { _aggregate = s;}

    PatternMatcher& matcher() { return _matcher;}

    // Apply one matched modification to `target`. Either every change
    // is made or, on a StructuralInconsistencyError, none.
    //  - a bound PTM atom with a null replacement is removed, with its edges,
    //  - an unbound PTM atom is created, in the residue of the atom it bonds to,
    //  - other bound atoms have `replace` merged into their attributes,
    //  - the edges of the modification are added.
    absl::Status ApplyModification(MolecularGraph& target,
                                   const PatternRule& modification,
                                   const Correspondence& correspondence) const;

    // Match every modification, rank the results, choose non
    // overlapping regions and apply them.
    absl::Status ApplyModifications(MolecularGraph& target,
                                    const std::vector<PatternRule>& modifications,
                                    MappingReport& report) const;

    // Add the output atoms of one matched block to `output`, recording
    // which source atoms feed which output atoms. On failure nothing is
    // added. Edges are not made.
    absl::Status ApplyBlock(const MolecularGraph& target,
                            const Block& block,
                            const Correspondence& correspondence,
                            MolecularGraph& output,
                            SourceToOutput& source_to_output) const;

    // The output graph of a single block match, with induced edges.
    absl::StatusOr<MolecularGraph> Apply(const MolecularGraph& target,
                                         const Block& block,
                                         const Correspondence& correspondence) const;

    // Map a whole molecule. Output atoms are numbered from `first_node_id`.
    absl::StatusOr<MolecularGraph> MapBlocks(const MolecularGraph& target,
                                             const std::vector<Block>& blocks,
                                             node_id_t first_node_id,
                                             MappingReport& report) const;

    // For every match of every link in `output`, merge the attributes
    // of the link edges onto the matched edges and make the link atom
    // replacements. Link edges constrain the match, so they already exist.
    absl::Status ApplyLinks(MolecularGraph& output,
                            const std::vector<PatternRule>& links,
                            MappingReport& report) const;
};

// Add an edge between output atoms whenever a bond joins their source
// atoms. Output atoms never get an edge to themselves.
int AddInducedEdges(const MolecularGraph& target,
                    const SourceToOutput& source_to_output,
                    MolecularGraph& output);

}  // namespace cgmap

#endif  // CGMAP_LIB_GRAPH_TRANSFORMER_H_
