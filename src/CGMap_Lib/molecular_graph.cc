#include <iostream>

#include "absl/container/flat_hash_map.h"

#include "CGMap_Lib/molecular_graph.h"

namespace cgmap {

using std::cerr;

MolecularGraph::MolecularGraph() {
  _next_id = 0;
}

void
MolecularGraph::set_next_id(node_id_t id) {
  if (id > _next_id) {
    _next_id = id;
  }
}

void
MolecularGraph::_MergeInto(const AttributeMap& attributes, AttributeMap& destination) const {
  for (const auto& [key, value] : attributes) {
    if (value.is_null()) {
      destination.erase(key);
    } else {
      destination[key] = value;
    }
  }
}

node_id_t
MolecularGraph::AddNode(const AttributeMap& attributes) {
  const node_id_t result = _next_id;
  ++_next_id;

  AttributeMap& destination = _nodes[result];
  _MergeInto(attributes, destination);
  _adjacency[result];

  return result;
}

int
MolecularGraph::AddNodeWithId(node_id_t id, const AttributeMap& attributes) {
  if (_nodes.contains(id)) {
    cerr << "MolecularGraph::AddNodeWithId:duplicate node id " << id << '\n';
    return 0;
  }

  _MergeInto(attributes, _nodes[id]);
  _adjacency[id];

  if (id >= _next_id) {
    _next_id = id + 1;
  }

  return 1;
}

int
MolecularGraph::RemoveNode(node_id_t id) {
  auto iter = _adjacency.find(id);
  if (iter == _adjacency.end()) {
    cerr << "MolecularGraph::RemoveNode:no node " << id << '\n';
    return 0;
  }

  for (node_id_t nbr : iter->second) {
    _edges.erase(MakeEdgeKey(id, nbr));
    _adjacency[nbr].erase(id);
  }

  _adjacency.erase(iter);
  _nodes.erase(id);

  return 1;
}

int
MolecularGraph::AddEdge(node_id_t a1, node_id_t a2, const AttributeMap& attributes) {
  if (a1 == a2) {
    cerr << "MolecularGraph::AddEdge:self loop on " << a1 << '\n';
    return 0;
  }

  if (! _nodes.contains(a1) || ! _nodes.contains(a2)) {
    cerr << "MolecularGraph::AddEdge:invalid edge " << a1 << ',' << a2 << '\n';
    return 0;
  }

  _MergeInto(attributes, _edges[MakeEdgeKey(a1, a2)]);
  _adjacency[a1].insert(a2);
  _adjacency[a2].insert(a1);

  return 1;
}

int
MolecularGraph::RemoveEdge(node_id_t a1, node_id_t a2) {
  if (_edges.erase(MakeEdgeKey(a1, a2)) == 0) {
    return 0;
  }

  _adjacency[a1].erase(a2);
  _adjacency[a2].erase(a1);

  return 1;
}

bool
MolecularGraph::HasEdge(node_id_t a1, node_id_t a2) const {
  return _edges.contains(MakeEdgeKey(a1, a2));
}

const AttributeMap*
MolecularGraph::attributes(node_id_t id) const {
  auto iter = _nodes.find(id);
  if (iter == _nodes.end()) {
    return nullptr;
  }

  return &iter->second;
}

const AttributeMap*
MolecularGraph::edge_attributes(node_id_t a1, node_id_t a2) const {
  auto iter = _edges.find(MakeEdgeKey(a1, a2));
  if (iter == _edges.end()) {
    return nullptr;
  }

  return &iter->second;
}

int
MolecularGraph::MergeAttributes(node_id_t id, const AttributeMap& attributes) {
  auto iter = _nodes.find(id);
  if (iter == _nodes.end()) {
    cerr << "MolecularGraph::MergeAttributes:no node " << id << '\n';
    return 0;
  }

  _MergeInto(attributes, iter->second);

  return 1;
}

int
MolecularGraph::SetAttribute(node_id_t id, const std::string& key, const AttributeValue& value) {
  AttributeMap tmp;
  tmp[key] = value;

  return MergeAttributes(id, tmp);
}

int
MolecularGraph::degree(node_id_t id) const {
  auto iter = _adjacency.find(id);
  if (iter == _adjacency.end()) {
    return 0;
  }

  return iter->second.size();
}

const NodeSet&
MolecularGraph::neighbours(node_id_t id) const {
  static const NodeSet empty;

  auto iter = _adjacency.find(id);
  if (iter == _adjacency.end()) {
    return empty;
  }

  return iter->second;
}

std::vector<node_id_t>
MolecularGraph::NodeIds() const {
  std::vector<node_id_t> result;
  result.reserve(_nodes.size());

  for (const auto& [id, attributes] : _nodes) {
    result.push_back(id);
  }

  return result;
}

MolecularGraph
MolecularGraph::Subgraph(const NodeSet& ids) const {
  MolecularGraph result;
  result._name = _name;

  for (node_id_t id : ids) {
    auto iter = _nodes.find(id);
    if (iter == _nodes.end()) {
      continue;
    }
    result._nodes[id] = iter->second;
    result._adjacency[id];
  }

  for (const auto& [key, attributes] : _edges) {
    if (! result._nodes.contains(key.first) || ! result._nodes.contains(key.second)) {
      continue;
    }
    result._edges[key] = attributes;
    result._adjacency[key.first].insert(key.second);
    result._adjacency[key.second].insert(key.first);
  }

  result._next_id = _next_id;

  return result;
}

int
MolecularGraph::Append(const MolecularGraph& rhs) {
  absl::flat_hash_map<node_id_t, node_id_t> xref;

  for (const auto& [id, attributes] : rhs._nodes) {
    xref[id] = AddNode(attributes);
  }

  for (const auto& [key, attributes] : rhs._edges) {
    if (! AddEdge(xref[key.first], xref[key.second], attributes)) {
      return 0;
    }
  }

  return 1;
}

void
MolecularGraph::ToProto(cgmap_data::MolecularGraph& proto) const {
  proto.Clear();

  if (! _name.empty()) {
    proto.set_name(_name);
  }

  for (const auto& [id, attributes] : _nodes) {
    cgmap_data::Node* node = proto.add_node();
    node->set_id(id);
    AttributeMapToProto(attributes, *node->mutable_attribute());
  }

  for (const auto& [key, attributes] : _edges) {
    cgmap_data::Edge* edge = proto.add_edge();
    edge->set_a1(key.first);
    edge->set_a2(key.second);
    AttributeMapToProto(attributes, *edge->mutable_attribute());
  }
}

int
MolecularGraph::BuildFromProto(const cgmap_data::MolecularGraph& proto) {
  *this = MolecularGraph();

  _name = proto.name();

  for (const cgmap_data::Node& node : proto.node()) {
    AttributeMap attributes;
    if (! AttributeMapFromProto(node.attribute(), attributes)) {
      cerr << "MolecularGraph::BuildFromProto:invalid attributes on node " << node.id() << '\n';
      return 0;
    }
    if (! AddNodeWithId(node.id(), attributes)) {
      return 0;
    }
  }

  for (const cgmap_data::Edge& edge : proto.edge()) {
    AttributeMap attributes;
    if (! AttributeMapFromProto(edge.attribute(), attributes)) {
      cerr << "MolecularGraph::BuildFromProto:invalid attributes on edge " << edge.a1() << ',' << edge.a2() << '\n';
      return 0;
    }
    if (! AddEdge(edge.a1(), edge.a2(), attributes)) {
      cerr << "MolecularGraph::BuildFromProto:cannot add edge " << edge.ShortDebugString() << '\n';
      return 0;
    }
  }

  return 1;
}

int
MolecularGraph::debug_print(std::ostream& output) const {
  output << "MolecularGraph '" << _name << "' " << _nodes.size() << " nodes " << _edges.size() << " edges\n";

  for (const auto& [id, attributes] : _nodes) {
    output << ' ' << id;
    for (const auto& [key, value] : attributes) {
      output << ' ' << key << '=' << value;
    }
    output << '\n';
  }

  for (const auto& [key, attributes] : _edges) {
    output << ' ' << key.first << '-' << key.second;
    for (const auto& [k, value] : attributes) {
      output << ' ' << k << '=' << value;
    }
    output << '\n';
  }

  return output.good();
}

int
System::number_nodes() const {
  int result = 0;
  for (const MolecularGraph& m : _molecules) {
    result += m.number_nodes();
  }

  return result;
}

void
System::ToProto(cgmap_data::System& proto) const {
  proto.Clear();

  for (const MolecularGraph& m : _molecules) {
    m.ToProto(*proto.add_molecule());
  }
}

int
System::BuildFromProto(const cgmap_data::System& proto) {
  _molecules.clear();
  _molecules.resize(proto.molecule_size());

  for (int i = 0; i < proto.molecule_size(); ++i) {
    if (! _molecules[i].BuildFromProto(proto.molecule(i))) {
      cerr << "System::BuildFromProto:cannot build molecule " << i << '\n';
      return 0;
    }
  }

  return 1;
}

}  // namespace cgmap
