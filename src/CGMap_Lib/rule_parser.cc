#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "google/protobuf/struct.pb.h"
#include "google/protobuf/util/json_util.h"
#include "re2/re2.h"

#include "Foundational/iwmisc/proto_support.h"

#include "CGMap_Lib/errors.h"
#include "CGMap_Lib/rule_json.h"
#include "CGMap_Lib/rule_parser.h"

namespace cgmap {

using std::cerr;

namespace {

const RE2&
SectionHeader() {
  static const RE2 rx(R"(\s*\[\s*(.*?)\s*\]\s*)");
  return rx;
}

const RE2&
IndexedToken() {
  static const RE2 rx(R"((\d+):(\S+))");
  return rx;
}

absl::string_view
StripComment(absl::string_view line) {
  const size_t semicolon = line.find(';');
  if (semicolon == absl::string_view::npos) {
    return line;
  }

  return line.substr(0, semicolon);
}

const char*
KindName(RecordKind kind) {
  switch (kind) {
    case RecordKind::kBlock:
      return "block";
    case RecordKind::kModification:
      return "modification";
    case RecordKind::kLink:
      return "link";
  }

  return "";
}

bool
AllowedSection(RecordKind kind, const std::string& section) {
  if (kind == RecordKind::kBlock) {
    return section == "from" || section == "to" || section == "from blocks" ||
           section == "to blocks" || section == "from nodes" || section == "to nodes" ||
           section == "from edges" || section == "to edges" || section == "mapping" ||
           section == "reference atoms";
  }

  return section == "atoms" || section == "edges";
}

// Split an entry line into the leading whitespace separated tokens
// and the JSON object, if any, that follows them.
void
SplitEntry(const std::string& text, std::vector<std::string>& tokens, std::string& json) {
  tokens.clear();
  json.clear();

  absl::string_view s(text);
  const size_t brace = s.find('{');
  if (brace != absl::string_view::npos) {
    json = std::string(s.substr(brace));
    s = s.substr(0, brace);
  }

  for (absl::string_view token : absl::StrSplit(s, absl::ByAnyChar(" \t"), absl::SkipWhitespace())) {
    tokens.emplace_back(token);
  }
}

int
ParseObject(const std::string& json, google::protobuf::Struct& object, std::string& why) {
  object.Clear();
  if (json.empty()) {
    return 1;
  }

  auto status = google::protobuf::util::JsonStringToMessage(json, &object);
  if (! status.ok()) {
    why = absl::StrCat("malformed attribute object ", json);
    return 0;
  }

  return 1;
}

// Literal values only, as used for replace, to nodes and edges.
int
ParseLiterals(const google::protobuf::Struct& object, AttributeMap& destination, std::string& why) {
  for (const auto& [key, value] : object.fields()) {
    AttributeValue v;
    if (! AttributeFromValue(value, v)) {
      why = absl::StrCat("invalid value for '", key, "'");
      return 0;
    }
    destination[key] = v;
  }

  return 1;
}

// Build `atom` from the single token in `tokens` and its attribute
// object. `residues` are the [ from blocks ] of a block.
int
ParseAtom(const std::vector<std::string>& tokens,
          const google::protobuf::Struct& object,
          RecordKind kind,
          const std::vector<std::string>& residues,
          RuleAtom& atom,
          std::string& why) {
  if (tokens.size() != 1) {
    why = absl::StrCat("expected a single atom name, got '", absl::StrJoin(tokens, " "), "'");
    return 0;
  }

  atom.token = tokens[0];
  std::string name = tokens[0];
  int order = 0;

  if (kind == RecordKind::kLink) {
    size_t i = 0;
    while (i < name.size() && (name[i] == '+' || name[i] == '-')) {
      order += (name[i] == '+') ? 1 : -1;
      ++i;
    }
    name = name.substr(i);
  } else if (kind == RecordKind::kBlock) {
    int index;
    std::string n;
    if (RE2::FullMatch(name, IndexedToken(), &index, &n)) {
      if (index < 1 || index > static_cast<int>(residues.size())) {
        why = absl::StrCat("residue index ", index, " in '", atom.token,
                           "' is not declared in [ from blocks ]");
        return 0;
      }
      order = index - 1;
      name = n;
    }
  }

  if (name.empty()) {
    why = absl::StrCat("empty atom name '", atom.token, "'");
    return 0;
  }

  atom.name = name;
  atom.order = order;

  for (const auto& [key, value] : object.fields()) {
    if (key == "replace") {
      if (value.kind_case() != google::protobuf::Value::kStructValue) {
        why = "replace must be an object";
        return 0;
      }
      if (! ParseLiterals(value.struct_value(), atom.replace, why)) {
        return 0;
      }
    } else if (key == kPtmAtom) {
      if (value.kind_case() != google::protobuf::Value::kBoolValue) {
        why = "PTM_atom must be true or false";
        return 0;
      }
      atom.ptm_atom = value.bool_value();
    } else if (key == "order" && kind == RecordKind::kLink) {
      const AttributeValue v = NumberToAttribute(value.number_value());
      if (value.kind_case() != google::protobuf::Value::kNumberValue ||
          v.kind() != AttributeKind::kInt) {
        why = "order must be an integer";
        return 0;
      }
      atom.order = v.int_value();
      atom.explicit_order = true;
    } else {
      AttributePredicate predicate;
      if (! PredicateFromValue(value, predicate)) {
        why = absl::StrCat("invalid condition for '", key, "'");
        return 0;
      }
      atom.attributes[key] = predicate;
    }
  }

  atom.predicates = atom.attributes;

  // Atoms created by a modification have no known name.
  const bool named = ! (kind == RecordKind::kModification && atom.ptm_atom);
  if (named && ! atom.predicates.contains(kAtomName)) {
    atom.predicates[kAtomName] = AttributePredicate::Literal(AttributeValue(atom.name));
  }

  if (kind == RecordKind::kBlock && ! residues.empty() && ! atom.predicates.contains(kResName)) {
    atom.predicates[kResName] = AttributePredicate::Literal(AttributeValue(residues[atom.order]));
  }

  return 1;
}

// A destination token, "BB" or "2:SC1". `residues` are the [ to blocks ].
int
ParseDestination(const std::string& token,
                 const std::vector<std::string>& residues,
                 DestinationAtom& destination,
                 std::string& why) {
  destination.token = token;
  destination.name = token;
  destination.order = 0;

  int index;
  std::string n;
  if (RE2::FullMatch(token, IndexedToken(), &index, &n)) {
    if (index < 1 || index > static_cast<int>(residues.size())) {
      why = absl::StrCat("residue index ", index, " in '", token,
                         "' is not declared in [ to blocks ]");
      return 0;
    }
    destination.order = index - 1;
    destination.name = n;
  }

  return 1;
}

}  // namespace

std::string
NormaliseSectionName(absl::string_view s) {
  std::vector<std::string> words = absl::StrSplit(s, absl::ByAnyChar(" \t"), absl::SkipWhitespace());

  return absl::AsciiStrToLower(absl::StrJoin(words, " "));
}

RuleParser::RuleParser(MacroTable& macros) : _macros(macros) {
  _verbose = 0;
  _state = State::kOutside;
  _kind = RecordKind::kBlock;
  _expect_name = false;
  _header_line = 0;
}

std::string
RuleParser::_Context(int line_number, const std::string& section) const {
  std::string result = absl::StrCat(_source_name, ":", line_number);
  if (! section.empty()) {
    absl::StrAppend(&result, " [ ", section, " ]");
  }
  if (_state == State::kRecord) {
    absl::StrAppend(&result, " ", KindName(_kind));
    if (! _name.empty()) {
      absl::StrAppend(&result, " ", _name);
    }
  }

  return result;
}

absl::Status
RuleParser::_Error(const EntryLine& line, absl::string_view message) const {
  return GrammarError(absl::StrCat(_Context(line.line_number, line.section), ": ", message,
                                   " '", line.text, "'"));
}

absl::Status
RuleParser::ParseFile(const std::string& fname, RuleSet& rules) {
  std::optional<std::string> contents = iwmisc::FileContents(fname);
  if (! contents) {
    return absl::NotFoundError(absl::StrCat("RuleParser::ParseFile:cannot read '", fname, "'"));
  }

  return Parse(*contents, rules, fname);
}

absl::Status
RuleParser::Parse(absl::string_view text, RuleSet& rules, absl::string_view source_name) {
  _source_name = std::string(source_name);
  _state = State::kOutside;
  _name.clear();
  _expect_name = false;
  _section.clear();
  _lines.clear();

  int line_number = 0;
  for (absl::string_view raw : absl::StrSplit(text, '\n')) {
    ++line_number;

    absl::string_view line = absl::StripAsciiWhitespace(StripComment(raw));
    if (line.empty()) {
      continue;
    }

    std::string header;
    absl::Status status;
    if (RE2::FullMatch(re2::StringPiece(line.data(), line.size()), SectionHeader(), &header)) {
      status = _Header(NormaliseSectionName(header), line_number, rules);
    } else {
      status = _Entry(line, line_number);
    }

    if (! status.ok()) {
      return status;
    }
  }

  return _FinishRecord(rules);
}

absl::Status
RuleParser::_Header(const std::string& section, int line_number, RuleSet& rules) {
  if (section == "macros" || section == "block" || section == "modification" ||
      section == "link") {
    absl::Status status = _FinishRecord(rules);
    if (! status.ok()) {
      return status;
    }

    _section = section;
    if (section == "macros") {
      _state = State::kMacros;
      return absl::OkStatus();
    }

    _state = State::kRecord;
    if (section == "block") {
      _kind = RecordKind::kBlock;
    } else if (section == "modification") {
      _kind = RecordKind::kModification;
    } else {
      _kind = RecordKind::kLink;
    }
    _name.clear();
    _expect_name = true;
    _header_line = line_number;
    _lines.clear();

    return absl::OkStatus();
  }

  if (_state != State::kRecord) {
    return GrammarError(absl::StrCat(_Context(line_number, ""), ": section [ ", section,
                                     " ] outside a block, modification or link"));
  }

  if (! AllowedSection(_kind, section)) {
    return GrammarError(absl::StrCat(_Context(line_number, ""), ": section [ ", section,
                                     " ] not allowed in a ", KindName(_kind)));
  }

  _section = section;
  _expect_name = false;

  return absl::OkStatus();
}

absl::Status
RuleParser::_Entry(absl::string_view line, int line_number) {
  if (_state == State::kOutside) {
    return GrammarError(absl::StrCat(_Context(line_number, ""), ": entry outside any section '",
                                     line, "'"));
  }

  if (_state == State::kMacros) {
    std::vector<absl::string_view> parts = absl::StrSplit(line, absl::MaxSplits(absl::ByAnyChar(" \t"), 1));
    absl::string_view value;
    if (parts.size() > 1) {
      value = absl::StripAsciiWhitespace(parts[1]);
    }
    absl::Status status = _macros.Define(parts[0], value);
    if (! status.ok()) {
      return AddContext(status, _Context(line_number, _section));
    }
    return absl::OkStatus();
  }

  absl::StatusOr<std::string> expanded = _macros.Expand(line);
  if (! expanded.ok()) {
    return AddContext(expanded.status(), _Context(line_number, _section));
  }

  if (_expect_name) {
    std::vector<std::string> tokens = absl::StrSplit(*expanded, absl::ByAnyChar(" \t"), absl::SkipWhitespace());
    if (tokens.size() != 1 || tokens[0].find('{') != std::string::npos) {
      return GrammarError(absl::StrCat(_Context(line_number, ""), ": ", KindName(_kind),
                                       " name must be a single token '", *expanded, "'"));
    }
    _name = tokens[0];
    _expect_name = false;
    return absl::OkStatus();
  }

  if (_section.empty() || _section == "block" || _section == "modification" || _section == "link") {
    return GrammarError(absl::StrCat(_Context(line_number, ""), ": entry before any section '",
                                     *expanded, "'"));
  }

  _lines.push_back(EntryLine{line_number, _section, *std::move(expanded)});

  return absl::OkStatus();
}

absl::Status
RuleParser::_FinishRecord(RuleSet& rules) {
  if (_state != State::kRecord) {
    _state = State::kOutside;
    return absl::OkStatus();
  }

  if (_name.empty()) {
    if (_kind != RecordKind::kLink) {
      return GrammarError(absl::StrCat(_Context(_header_line, ""), ": ", KindName(_kind),
                                       " has no name"));
    }
    _name = absl::StrCat("link_", rules._records_added);
  }

  absl::Status status;
  if (_kind == RecordKind::kBlock) {
    status = _BuildBlock(rules);
  } else {
    status = _BuildPatternRule(rules);
  }

  if (status.ok() && _verbose > 1) {
    cerr << "RuleParser::_FinishRecord:read " << KindName(_kind) << ' ' << _name << '\n';
  }

  _state = State::kOutside;
  _lines.clear();

  return status;
}

absl::Status
RuleParser::_BuildPatternRule(RuleSet& rules) {
  PatternRule rule(_kind);
  rule._name = _name;

  std::vector<std::string> tokens;
  std::string json;
  google::protobuf::Struct object;
  std::string why;

  for (const EntryLine& line : _lines) {
    if (line.section != "atoms") {
      continue;
    }

    SplitEntry(line.text, tokens, json);
    if (! ParseObject(json, object, why)) {
      return _Error(line, why);
    }

    RuleAtom atom;
    if (! ParseAtom(tokens, object, _kind, {}, atom, why)) {
      return _Error(line, why);
    }

    if (rule._pattern.AddAtom(std::move(atom)) < 0) {
      return _Error(line, "duplicate atom");
    }
  }

  for (const EntryLine& line : _lines) {
    if (line.section != "edges") {
      continue;
    }

    SplitEntry(line.text, tokens, json);
    if (tokens.size() != 2) {
      return _Error(line, "an edge needs two atoms");
    }

    const int a1 = rule._pattern.IndexOf(tokens[0]);
    const int a2 = rule._pattern.IndexOf(tokens[1]);
    if (a1 < 0 || a2 < 0) {
      return _Error(line, "edge references an undeclared atom");
    }

    AttributeMap attributes;
    if (! ParseObject(json, object, why) || ! ParseLiterals(object, attributes, why)) {
      return _Error(line, why);
    }

    if (! rule._pattern.AddEdge(a1, a2, attributes)) {
      return _Error(line, "invalid edge");
    }
  }

  if (rule._pattern.empty()) {
    return GrammarError(absl::StrCat(_Context(_header_line, ""), ": no atoms"));
  }

  rule._pattern.Finish();
  rule._declaration_order = rules._records_added;
  ++rules._records_added;

  if (_kind == RecordKind::kModification) {
    rules._modifications.push_back(std::move(rule));
  } else {
    rules._links.push_back(std::move(rule));
  }

  return absl::OkStatus();
}

absl::Status
RuleParser::_BuildBlock(RuleSet& rules) {
  Block block;
  block._name = _name;

  std::vector<std::string> tokens;
  std::string json;
  google::protobuf::Struct object;
  std::string why;

  // Residue and force field names come first, the atoms depend on them.
  for (const EntryLine& line : _lines) {
    std::vector<std::string>* destination = nullptr;
    if (line.section == "from") {
      destination = &block._from_force_fields;
    } else if (line.section == "to") {
      destination = &block._to_force_fields;
    } else if (line.section == "from blocks") {
      destination = &block._from_blocks;
    } else if (line.section == "to blocks") {
      destination = &block._to_blocks;
    } else {
      continue;
    }

    SplitEntry(line.text, tokens, json);
    if (! json.empty()) {
      return _Error(line, "unexpected attribute object");
    }
    destination->insert(destination->end(), tokens.begin(), tokens.end());
  }

  for (const EntryLine& line : _lines) {
    if (line.section == "from nodes") {
      SplitEntry(line.text, tokens, json);
      RuleAtom atom;
      if (! ParseObject(json, object, why) ||
          ! ParseAtom(tokens, object, RecordKind::kBlock, block._from_blocks, atom, why)) {
        return _Error(line, why);
      }
      if (block._from.AddAtom(std::move(atom)) < 0) {
        return _Error(line, "duplicate from node");
      }
      block._from_nodes_declared = true;
    } else if (line.section == "to nodes") {
      SplitEntry(line.text, tokens, json);
      if (tokens.size() != 1) {
        return _Error(line, "expected a single atom name");
      }
      DestinationAtom d;
      if (! ParseDestination(tokens[0], block._to_blocks, d, why) ||
          ! ParseObject(json, object, why) ||
          ! ParseLiterals(object, d.attributes, why)) {
        return _Error(line, why);
      }
      if (block.DestinationIndex(d.token) >= 0) {
        return _Error(line, "duplicate to node");
      }
      block._destinations.push_back(std::move(d));
      ++block._number_declared_destinations;
    }
  }

  for (const EntryLine& line : _lines) {
    if (line.section != "mapping") {
      continue;
    }

    SplitEntry(line.text, tokens, json);
    if (tokens.size() < 2 || tokens.size() > 3 || ! json.empty()) {
      return _Error(line, "mapping must be 'source destination [weight]'");
    }

    MappingEntry entry;
    entry.source = tokens[0];
    entry.destination = tokens[1];
    if (tokens.size() == 3) {
      if (! absl::SimpleAtod(tokens[2], &entry.weight) || entry.weight <= 0.0) {
        return _Error(line, "mapping weight must be a positive number");
      }
    }

    if (block._from.IndexOf(entry.source) < 0) {
      if (block._from_nodes_declared) {
        return _Error(line, absl::StrCat("mapping source '", entry.source, "' is not a from node"));
      }
      RuleAtom atom;
      if (! ParseAtom({entry.source}, google::protobuf::Struct(), RecordKind::kBlock,
                      block._from_blocks, atom, why)) {
        return _Error(line, why);
      }
      block._from.AddAtom(std::move(atom));
    }

    if (block.DestinationIndex(entry.destination) < 0) {
      DestinationAtom d;
      if (! ParseDestination(entry.destination, block._to_blocks, d, why)) {
        return _Error(line, why);
      }
      block._destinations.push_back(std::move(d));
    }

    for (const MappingEntry& m : block._mapping) {
      if (m.source == entry.source && m.destination == entry.destination) {
        return _Error(line, "duplicate mapping");
      }
    }

    block._mapping.push_back(entry);
  }

  for (const EntryLine& line : _lines) {
    const bool from_edge = line.section == "from edges";
    const bool to_edge = line.section == "to edges";
    if (! from_edge && ! to_edge) {
      continue;
    }

    SplitEntry(line.text, tokens, json);
    if (tokens.size() != 2) {
      return _Error(line, "an edge needs two atoms");
    }

    AttributeMap attributes;
    if (! ParseObject(json, object, why) || ! ParseLiterals(object, attributes, why)) {
      return _Error(line, why);
    }

    if (from_edge) {
      const int a1 = block._from.IndexOf(tokens[0]);
      const int a2 = block._from.IndexOf(tokens[1]);
      if (a1 < 0 || a2 < 0) {
        return _Error(line, "edge references an undeclared atom");
      }
      if (! block._from.AddEdge(a1, a2, attributes)) {
        return _Error(line, "invalid edge");
      }
    } else {
      const int a1 = block.DestinationIndex(tokens[0]);
      const int a2 = block.DestinationIndex(tokens[1]);
      if (a1 < 0 || a2 < 0 || a1 == a2) {
        return _Error(line, "edge references an undeclared atom");
      }
      block._to_edges.push_back(RuleEdge{a1, a2, attributes});
    }
  }

  for (const EntryLine& line : _lines) {
    if (line.section != "reference atoms") {
      continue;
    }

    SplitEntry(line.text, tokens, json);
    if (tokens.size() != 2 || ! json.empty()) {
      return _Error(line, "reference atoms must be 'destination source'");
    }
    if (block.DestinationIndex(tokens[0]) < 0) {
      return _Error(line, absl::StrCat("unknown destination '", tokens[0], "'"));
    }
    if (block._from.IndexOf(tokens[1]) < 0) {
      return _Error(line, absl::StrCat("unknown source '", tokens[1], "'"));
    }
    for (const auto& [d, s] : block._reference_atoms) {
      if (d == tokens[0]) {
        return _Error(line, "duplicate reference atom");
      }
    }
    block._reference_atoms.emplace_back(tokens[0], tokens[1]);
  }

  if (block._from.empty()) {
    return GrammarError(absl::StrCat(_Context(_header_line, ""), ": no from nodes"));
  }
  if (block._mapping.empty()) {
    return GrammarError(absl::StrCat(_Context(_header_line, ""), ": no mapping"));
  }

  for (const DestinationAtom& d : block._destinations) {
    const bool mapped = std::any_of(block._mapping.begin(), block._mapping.end(),
                                    [&d](const MappingEntry& m) { return m.destination == d.token;});
    if (! mapped) {
      return GrammarError(absl::StrCat(_Context(_header_line, ""), ": to node '", d.token,
                                       "' has no source in [ mapping ]"));
    }
  }

  block._from.Finish();
  block._declaration_order = rules._records_added;
  ++rules._records_added;

  rules._blocks.push_back(std::move(block));

  return absl::OkStatus();
}

}  // namespace cgmap
