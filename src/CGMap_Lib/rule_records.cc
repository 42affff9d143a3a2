#include <iostream>
#include <string>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"

#include "CGMap_Lib/rule_json.h"
#include "CGMap_Lib/rule_records.h"

namespace cgmap {

using std::cerr;

bool
RuleAtom::subtractive() const {
  if (! ptm_atom) {
    return false;
  }

  for (const auto& [key, value] : replace) {
    if (value.is_null()) {
      return true;
    }
  }

  return false;
}

bool
RuleAtom::additive() const {
  return ptm_atom && ! subtractive();
}

bool
RuleAtom::operator==(const RuleAtom& rhs) const {
  return token == rhs.token && name == rhs.name &&
         attributes == rhs.attributes && predicates == rhs.predicates &&
         replace == rhs.replace && ptm_atom == rhs.ptm_atom && order == rhs.order;
}

bool
RuleEdge::operator==(const RuleEdge& rhs) const {
  return a1 == rhs.a1 && a2 == rhs.a2 && attributes == rhs.attributes;
}

bool
MappingEntry::operator==(const MappingEntry& rhs) const {
  return source == rhs.source && destination == rhs.destination && weight == rhs.weight;
}

bool
DestinationAtom::operator==(const DestinationAtom& rhs) const {
  return token == rhs.token && name == rhs.name && order == rhs.order &&
         attributes == rhs.attributes;
}

Pattern::Pattern() {
  _specificity = 0;
}

int
Pattern::IndexOf(const std::string& token) const {
  for (size_t i = 0; i < _atoms.size(); ++i) {
    if (_atoms[i].token == token) {
      return i;
    }
  }

  return -1;
}

int
Pattern::AddAtom(RuleAtom&& atom) {
  if (IndexOf(atom.token) >= 0) {
    return -1;
  }

  _atoms.push_back(std::move(atom));

  return _atoms.size() - 1;
}

int
Pattern::AddEdge(int a1, int a2, const AttributeMap& attributes) {
  const int n = _atoms.size();
  if (a1 < 0 || a2 < 0 || a1 >= n || a2 >= n || a1 == a2) {
    cerr << "Pattern::AddEdge:invalid edge " << a1 << ',' << a2 << " natoms " << n << '\n';
    return 0;
  }

  for (RuleEdge& e : _edges) {
    if ((e.a1 == a1 && e.a2 == a2) || (e.a1 == a2 && e.a2 == a1)) {
      for (const auto& [key, value] : attributes) {
        e.attributes[key] = value;
      }
      return 1;
    }
  }

  _edges.push_back(RuleEdge{a1, a2, attributes});

  return 1;
}

bool
Pattern::HasEdge(int a1, int a2) const {
  for (int j : _adjacency[a1]) {
    if (j == a2) {
      return true;
    }
  }

  return false;
}

namespace {

bool
Interchangeable(const RuleAtom& a1, const RuleAtom& a2) {
  return a1.predicates == a2.predicates && a1.replace == a2.replace &&
         a1.ptm_atom == a2.ptm_atom && a1.order == a2.order;
}

}  // namespace

void
Pattern::Finish() {
  const int n = _atoms.size();

  _adjacency.assign(n, std::vector<int>());
  for (const RuleEdge& e : _edges) {
    _adjacency[e.a1].push_back(e.a2);
    _adjacency[e.a2].push_back(e.a1);
  }

  _symmetry_class.assign(n, -1);
  int classes = 0;
  for (int i = 0; i < n; ++i) {
    for (int j = 0; j < i; ++j) {
      if (Interchangeable(_atoms[i], _atoms[j])) {
        _symmetry_class[i] = _symmetry_class[j];
        break;
      }
    }
    if (_symmetry_class[i] < 0) {
      _symmetry_class[i] = classes;
      ++classes;
    }
  }

  _specificity = 0;
  for (const RuleAtom& a : _atoms) {
    _specificity += CountConstraints(a.predicates);
  }
}

bool
Pattern::operator==(const Pattern& rhs) const {
  return _atoms == rhs._atoms && _edges == rhs._edges;
}

Block::Block() {
  _declaration_order = 0;
  _from_nodes_declared = false;
  _number_declared_destinations = 0;
}

int
Block::DestinationIndex(const std::string& token) const {
  for (size_t i = 0; i < _destinations.size(); ++i) {
    if (_destinations[i].token == token) {
      return i;
    }
  }

  return -1;
}

std::string
Block::ReferenceAtom(const std::string& token) const {
  for (const auto& [destination, source] : _reference_atoms) {
    if (destination == token) {
      return source;
    }
  }

  for (const MappingEntry& m : _mapping) {
    if (m.destination == token) {
      return m.source;
    }
  }

  return "";
}

bool
Block::operator==(const Block& rhs) const {
  return _name == rhs._name &&
         _from_force_fields == rhs._from_force_fields &&
         _to_force_fields == rhs._to_force_fields &&
         _from_blocks == rhs._from_blocks &&
         _to_blocks == rhs._to_blocks &&
         _from == rhs._from &&
         _from_nodes_declared == rhs._from_nodes_declared &&
         _destinations == rhs._destinations &&
         _to_edges == rhs._to_edges &&
         _mapping == rhs._mapping &&
         _reference_atoms == rhs._reference_atoms;
}

namespace {

// JSON for a struct, "" if it is empty.
std::string
StructAsJson(const google::protobuf::Struct& s) {
  if (s.fields().empty()) {
    return "";
  }

  std::string result;
  auto status = google::protobuf::util::MessageToJsonString(s, &result);
  if (! status.ok()) {
    cerr << "StructAsJson:cannot write " << s.ShortDebugString() << '\n';
    return "";
  }

  return result;
}

std::string
AttributeMapAsJson(const AttributeMap& attributes) {
  google::protobuf::Struct s;
  for (const auto& [key, value] : attributes) {
    AttributeToValue(value, (*s.mutable_fields())[key]);
  }

  return StructAsJson(s);
}

void
WriteLine(std::ostream& output, const std::string& s1, const std::string& json) {
  output << s1;
  if (! json.empty()) {
    output << ' ' << json;
  }
  output << '\n';
}

void
WriteEdges(const std::vector<RuleEdge>& edges, const std::vector<std::string>& tokens,
           std::ostream& output) {
  for (const RuleEdge& e : edges) {
    WriteLine(output, absl::StrCat(tokens[e.a1], " ", tokens[e.a2]),
              AttributeMapAsJson(e.attributes));
  }
}

std::vector<std::string>
Tokens(const Pattern& pattern) {
  std::vector<std::string> result;
  for (const RuleAtom& a : pattern.atoms()) {
    result.push_back(a.token);
  }

  return result;
}

}  // namespace

std::string
AttributeObjectAsJson(const RuleAtom& atom, RecordKind kind) {
  google::protobuf::Struct s;
  auto& fields = *s.mutable_fields();

  for (const auto& [key, predicate] : atom.attributes) {
    PredicateToValue(predicate, fields[key]);
  }

  if (! atom.replace.empty()) {
    auto& replace = *fields["replace"].mutable_struct_value()->mutable_fields();
    for (const auto& [key, value] : atom.replace) {
      AttributeToValue(value, replace[key]);
    }
  }

  if (atom.ptm_atom) {
    fields[kPtmAtom].set_bool_value(true);
  }

  if (kind == RecordKind::kLink && atom.explicit_order) {
    fields["order"].set_number_value(atom.order);
  }

  return StructAsJson(s);
}

int
Block::Write(std::ostream& output) const {
  output << "[ block ]\n";
  output << _name << '\n';

  if (! _from_force_fields.empty()) {
    output << "[ from ]\n" << absl::StrJoin(_from_force_fields, " ") << '\n';
  }
  if (! _to_force_fields.empty()) {
    output << "[ to ]\n" << absl::StrJoin(_to_force_fields, " ") << '\n';
  }
  if (! _from_blocks.empty()) {
    output << "[ from blocks ]\n" << absl::StrJoin(_from_blocks, " ") << '\n';
  }
  if (! _to_blocks.empty()) {
    output << "[ to blocks ]\n" << absl::StrJoin(_to_blocks, " ") << '\n';
  }

  if (_from_nodes_declared) {
    output << "[ from nodes ]\n";
    for (const RuleAtom& a : _from.atoms()) {
      WriteLine(output, a.token, AttributeObjectAsJson(a, RecordKind::kBlock));
    }
  }

  if (_from.number_edges() > 0) {
    output << "[ from edges ]\n";
    WriteEdges(_from.edges(), Tokens(_from), output);
  }

  if (_number_declared_destinations > 0) {
    output << "[ to nodes ]\n";
    for (int i = 0; i < _number_declared_destinations; ++i) {
      const DestinationAtom& d = _destinations[i];
      WriteLine(output, d.token, AttributeMapAsJson(d.attributes));
    }
  }

  if (! _to_edges.empty()) {
    std::vector<std::string> tokens;
    for (const DestinationAtom& d : _destinations) {
      tokens.push_back(d.token);
    }
    output << "[ to edges ]\n";
    WriteEdges(_to_edges, tokens, output);
  }

  if (! _mapping.empty()) {
    output << "[ mapping ]\n";
    for (const MappingEntry& m : _mapping) {
      output << m.source << ' ' << m.destination;
      if (m.weight != 1.0) {
        // Enough digits that reading back gives the same double.
        output << ' ' << absl::StrFormat("%.17g", m.weight);
      }
      output << '\n';
    }
  }

  if (! _reference_atoms.empty()) {
    output << "[ reference atoms ]\n";
    for (const auto& [destination, source] : _reference_atoms) {
      output << destination << ' ' << source << '\n';
    }
  }

  return output.good();
}

PatternRule::PatternRule(RecordKind kind) : _kind(kind) {
  _declaration_order = 0;
}

bool
PatternRule::operator==(const PatternRule& rhs) const {
  return _kind == rhs._kind && _name == rhs._name && _pattern == rhs._pattern;
}

int
PatternRule::Write(std::ostream& output) const {
  if (_kind == RecordKind::kLink) {
    output << "[ link ]\n";
  } else {
    output << "[ modification ]\n";
  }
  output << _name << '\n';

  output << "[ atoms ]\n";
  for (const RuleAtom& a : _pattern.atoms()) {
    WriteLine(output, a.token, AttributeObjectAsJson(a, _kind));
  }

  if (_pattern.number_edges() > 0) {
    output << "[ edges ]\n";
    WriteEdges(_pattern.edges(), Tokens(_pattern), output);
  }

  return output.good();
}

RuleSet::RuleSet() {
  _records_added = 0;
}

const Block*
RuleSet::FindBlock(const std::string& name) const {
  for (const Block& b : _blocks) {
    if (b.name() == name) {
      return &b;
    }
  }

  return nullptr;
}

const PatternRule*
RuleSet::FindModification(const std::string& name) const {
  for (const PatternRule& m : _modifications) {
    if (m.name() == name) {
      return &m;
    }
  }

  return nullptr;
}

int
RuleSet::Write(std::ostream& output) const {
  for (const PatternRule& m : _modifications) {
    m.Write(output);
    output << '\n';
  }
  for (const Block& b : _blocks) {
    b.Write(output);
    output << '\n';
  }
  for (const PatternRule& l : _links) {
    l.Write(output);
    output << '\n';
  }

  return output.good();
}

}  // namespace cgmap
