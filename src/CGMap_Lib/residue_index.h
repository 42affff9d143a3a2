#ifndef CGMAP_LIB_RESIDUE_INDEX_H_
#define CGMAP_LIB_RESIDUE_INDEX_H_

#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"

#include "CGMap_Lib/molecular_graph.h"

namespace cgmap {

// Groups the atoms of a graph into residues. A residue is the set of
// atoms sharing (chain, resid, resname). Residues are numbered in
// order of first appearance, scanning atoms by ascending id.
class ResidueIndex {
  private:
    absl::flat_hash_map<node_id_t, int> _residue;

    // For each residue, the atoms in ascending id order.
    std::vector<std::vector<node_id_t>> _members;

    // "resname resid", and the chain when set.
    std::vector<std::string> _label;

  public:
    ResidueIndex();
    explicit ResidueIndex(const MolecularGraph& graph);

    int Build(const MolecularGraph& graph);

    int number_residues() const { return _members.size();}

    // -1 if `id` is unknown.
    int residue(node_id_t id) const;

    const std::vector<node_id_t>& members(int r) const { return _members[r];}

    const std::string& label(int r) const { return _label[r];}

    // The label of the residue holding `id`, "?" if unknown.
    std::string LabelOf(node_id_t id) const;
};

// The label used in diagnostics for the residue holding an atom.
std::string ResidueLabel(const AttributeMap& attributes);

}  // namespace cgmap

#endif  // CGMAP_LIB_RESIDUE_INDEX_H_
