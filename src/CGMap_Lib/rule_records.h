#ifndef CGMAP_LIB_RULE_RECORDS_H_
#define CGMAP_LIB_RULE_RECORDS_H_

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "CGMap_Lib/attribute.h"
#include "CGMap_Lib/attribute_predicate.h"

namespace cgmap {

// One atom of a rule.
struct RuleAtom {
  // The atom as written in the rule file: "CA", "+N", "2:BB".
  std::string token;

  // `token` without residue prefixes.
  std::string name;

  // The attribute object as written, without the annotation keys.
  PredicateMap attributes;

  // `attributes` plus the implicit atomname and resname conditions.
  PredicateMap predicates;

  // Values written onto the matched atom. Null values remove.
  AttributeMap replace;

  bool ptm_atom = false;

  // Residue offset relative to the first residue of the rule.
  int order = 0;

  // Set when the attribute object carried an explicit order.
  bool explicit_order = false;

  // A PTM atom that is not being removed. It need not be present in
  // the target, the transformer creates it.
  bool additive() const;

  // A PTM atom with a null replacement of some attribute: it is deleted.
  bool subtractive() const;

  bool operator==(const RuleAtom& rhs) const;
  bool operator!=(const RuleAtom& rhs) const { return ! (*this == rhs);}
};

struct RuleEdge {
  int a1;
  int a2;
  AttributeMap attributes;

  bool operator==(const RuleEdge& rhs) const;
};

// Atoms plus the bonds required between them. Edge ends are indices
// into the atom list.
class Pattern {
  private:
    std::vector<RuleAtom> _atoms;
    std::vector<RuleEdge> _edges;

    // Derived by Finish().
    std::vector<std::vector<int>> _adjacency;
    std::vector<int> _symmetry_class;
    int _specificity;

  public:
    Pattern();

    int number_atoms() const { return _atoms.size();}
    int number_edges() const { return _edges.size();}
    bool empty() const { return _atoms.empty();}

    const RuleAtom& atom(int i) const { return _atoms[i];}
    const std::vector<RuleAtom>& atoms() const { return _atoms;}
    const std::vector<RuleEdge>& edges() const { return _edges;}

    // -1 if no atom has `token`.
    int IndexOf(const std::string& token) const;

    // Returns the index of the new atom, -1 if `token` is already present.
    int AddAtom(RuleAtom&& atom);

    // Fails for out of range or equal indices. A repeated edge merges
    // its attributes.
    int AddEdge(int a1, int a2, const AttributeMap& attributes);

    // Compute adjacency, symmetry classes and specificity. Must be
    // called once the atoms and edges are complete.
    void Finish();

    const std::vector<int>& neighbours(int i) const { return _adjacency[i];}
    int degree(int i) const { return _adjacency[i].size();}
    bool HasEdge(int a1, int a2) const;

    // Atoms in the same class are interchangeable: same predicates,
    // same annotations, same residue offset.
    int symmetry_class(int i) const { return _symmetry_class[i];}

    // The number of non wildcard conditions over all atoms.
    int specificity() const { return _specificity;}

    bool operator==(const Pattern& rhs) const;
};

// [ mapping ] line: source atom, destination atom, weight.
struct MappingEntry {
  std::string source;
  std::string destination;
  double weight = 1.0;

  bool operator==(const MappingEntry& rhs) const;
};

// An atom of the output residue.
struct DestinationAtom {
  // As written, "BB" or "2:SC1".
  std::string token;
  std::string name;

  // Index into [ to blocks ].
  int order = 0;

  // Literal values from [ to nodes ].
  AttributeMap attributes;

  bool operator==(const DestinationAtom& rhs) const;
};

// A from/to mapping of one or more residues.
class Block {
  private:
    std::string _name;

    // Position in the rule files, over all records.
    int _declaration_order;

    // [ from ] and [ to ], force field names. Informational.
    std::vector<std::string> _from_force_fields;
    std::vector<std::string> _to_force_fields;

    std::vector<std::string> _from_blocks;
    std::vector<std::string> _to_blocks;

    // [ from nodes ] and [ from edges ].
    Pattern _from;

    // False if the from nodes were implied by [ mapping ].
    bool _from_nodes_declared;

    // [ to nodes ] followed by destinations first seen in [ mapping ].
    std::vector<DestinationAtom> _destinations;
    int _number_declared_destinations;

    // [ to edges ], indices into _destinations.
    std::vector<RuleEdge> _to_edges;

    std::vector<MappingEntry> _mapping;

    // [ reference atoms ], destination token to source token.
    std::vector<std::pair<std::string, std::string>> _reference_atoms;

    friend class RuleParser;

  public:
    Block();

    const std::string& name() const { return _name;}
    int declaration_order() const { return _declaration_order;}

    const std::vector<std::string>& from_force_fields() const { return _from_force_fields;}
    const std::vector<std::string>& to_force_fields() const { return _to_force_fields;}
    const std::vector<std::string>& from_blocks() const { return _from_blocks;}
    const std::vector<std::string>& to_blocks() const { return _to_blocks;}

    const Pattern& from() const { return _from;}

    const std::vector<DestinationAtom>& destinations() const { return _destinations;}
    int DestinationIndex(const std::string& token) const;

    const std::vector<RuleEdge>& to_edges() const { return _to_edges;}
    const std::vector<MappingEntry>& mapping() const { return _mapping;}

    // The source token that anchors destination `token`. When not
    // declared, the first source mapped to it.
    std::string ReferenceAtom(const std::string& token) const;

    int specificity() const { return _from.specificity();}

    int Write(std::ostream& output) const;

    // Declaration order is not compared.
    bool operator==(const Block& rhs) const;
};

enum class RecordKind {
  kBlock,
  kModification,
  kLink
};

// A [ modification ] or a [ link ]. Both are an [ atoms ] pattern
// with [ edges ]. A modification changes the atoms it matches, a link
// adds its edges to the output.
class PatternRule {
  private:
    RecordKind _kind;
    std::string _name;
    int _declaration_order;

    Pattern _pattern;

    friend class RuleParser;

  public:
    explicit PatternRule(RecordKind kind);

    RecordKind kind() const { return _kind;}
    const std::string& name() const { return _name;}
    int declaration_order() const { return _declaration_order;}

    const Pattern& pattern() const { return _pattern;}

    int specificity() const { return _pattern.specificity();}

    int Write(std::ostream& output) const;

    bool operator==(const PatternRule& rhs) const;
};

// Everything read from one or more rule files.
class RuleSet {
  private:
    std::vector<Block> _blocks;
    std::vector<PatternRule> _modifications;
    std::vector<PatternRule> _links;

    // Records added so far. Gives declaration order.
    int _records_added;

    friend class RuleParser;

  public:
    RuleSet();

    int number_blocks() const { return _blocks.size();}
    int number_modifications() const { return _modifications.size();}
    int number_links() const { return _links.size();}

    const std::vector<Block>& blocks() const { return _blocks;}
    const std::vector<PatternRule>& modifications() const { return _modifications;}
    const std::vector<PatternRule>& links() const { return _links;}

    // nullptr if not found.
    const Block* FindBlock(const std::string& name) const;
    const PatternRule* FindModification(const std::string& name) const;

    // Every record, in the rule file grammar.
    int Write(std::ostream& output) const;
};

// The attribute object written for `atom`, "" if there is nothing to write.
std::string AttributeObjectAsJson(const RuleAtom& atom, RecordKind kind);

}  // namespace cgmap

#endif  // CGMAP_LIB_RULE_RECORDS_H_
