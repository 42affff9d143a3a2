#ifndef CGMAP_LIB_MOLECULAR_GRAPH_H_
#define CGMAP_LIB_MOLECULAR_GRAPH_H_

#include <cstdint>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/btree_map.h"
#include "absl/container/btree_set.h"

#include "CGMap_Lib/attribute.h"
#include "CGMap_Lib/cgmap.pb.h"

namespace cgmap {

typedef uint32_t node_id_t;

// Edges are stored once, keyed by (smaller id, larger id).
using EdgeKey = std::pair<node_id_t, node_id_t>;

inline EdgeKey
MakeEdgeKey(node_id_t a1, node_id_t a2) {
  if (a1 < a2) {
    return EdgeKey(a1, a2);
  }
  return EdgeKey(a2, a1);
}

using NodeSet = absl::btree_set<node_id_t>;

// An undirected graph of atoms and bonds, both of which carry
// attributes.
// Node identifiers are handed out in increasing order and are never
// reused, even after the node has been removed.
// All containers are ordered, so iteration is reproducible.
class MolecularGraph {
  private:
    std::string _name;

    // The identifier that the next AddNode will return.
    node_id_t _next_id;

    absl::btree_map<node_id_t, AttributeMap> _nodes;
    absl::btree_map<node_id_t, NodeSet> _adjacency;
    absl::btree_map<EdgeKey, AttributeMap> _edges;

  // private functions

    void _MergeInto(const AttributeMap& attributes, AttributeMap& destination) const;

  public:
    MolecularGraph();

    const std::string& name() const { return _name;}
    void set_name(const std::string& s) { _name = s;}

    int number_nodes() const { return _nodes.size();}
    int number_edges() const { return _edges.size();}
    bool empty() const { return _nodes.empty();}

    node_id_t next_id() const { return _next_id;}
    // Ids handed out will be at least `id`. Ids are never reused, so
    // this cannot move backwards.
    void set_next_id(node_id_t id);

    // Null valued attributes are ignored.
    node_id_t AddNode(const AttributeMap& attributes);

    // Used when reading a serialized graph. Fails if `id` is in use.
    int AddNodeWithId(node_id_t id, const AttributeMap& attributes);

    // Removes the node and every edge touching it.
    int RemoveNode(node_id_t id);

    // Inserting an edge that already exists merges the attributes.
    // (a1, a2) and (a2, a1) are the same edge. Self loops are rejected.
    int AddEdge(node_id_t a1, node_id_t a2, const AttributeMap& attributes = AttributeMap());
    int RemoveEdge(node_id_t a1, node_id_t a2);

    bool HasNode(node_id_t id) const { return _nodes.contains(id);}
    bool HasEdge(node_id_t a1, node_id_t a2) const;

    // nullptr if `id` is not a node.
    const AttributeMap* attributes(node_id_t id) const;
    const AttributeMap* edge_attributes(node_id_t a1, node_id_t a2) const;

    // Keys in `attributes` overwrite existing values. A null value
    // removes that attribute from the node.
    int MergeAttributes(node_id_t id, const AttributeMap& attributes);

    int SetAttribute(node_id_t id, const std::string& key, const AttributeValue& value);

    int degree(node_id_t id) const;
    // Empty if `id` is not a node.
    const NodeSet& neighbours(node_id_t id) const;

    const absl::btree_map<node_id_t, AttributeMap>& nodes() const { return _nodes;}
    const absl::btree_map<EdgeKey, AttributeMap>& edges() const { return _edges;}

    std::vector<node_id_t> NodeIds() const;

    // A new graph holding the nodes in `ids`, and the edges with both
    // ends in `ids`. Identifiers are preserved.
    MolecularGraph Subgraph(const NodeSet& ids) const;

    // Append the nodes and edges of `rhs`, renumbered to follow the
    // current nodes. Relative order of `rhs` nodes is preserved.
    int Append(const MolecularGraph& rhs);

    void ToProto(cgmap_data::MolecularGraph& proto) const;
    int BuildFromProto(const cgmap_data::MolecularGraph& proto);

    int debug_print(std::ostream& output) const;
};

// A collection of molecules, as handed over by a structure reader.
class System {
  private:
    std::vector<MolecularGraph> _molecules;

  public:
    int number_molecules() const { return _molecules.size();}

    MolecularGraph& molecule(int i) { return _molecules[i];}
    const MolecularGraph& molecule(int i) const { return _molecules[i];}

    std::vector<MolecularGraph>& molecules() { return _molecules;}
    const std::vector<MolecularGraph>& molecules() const { return _molecules;}

    void Add(MolecularGraph&& m) { _molecules.push_back(std::move(m));}

    int number_nodes() const;

    void ToProto(cgmap_data::System& proto) const;
    int BuildFromProto(const cgmap_data::System& proto);
};

}  // namespace cgmap

#endif  // CGMAP_LIB_MOLECULAR_GRAPH_H_
