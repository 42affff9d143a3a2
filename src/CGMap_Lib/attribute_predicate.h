#ifndef CGMAP_LIB_ATTRIBUTE_PREDICATE_H_
#define CGMAP_LIB_ATTRIBUTE_PREDICATE_H_

#include <iostream>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

#include "CGMap_Lib/attribute.h"

namespace cgmap {

// A condition placed on one attribute of a target atom.
//  kAny         matches anything, including absence
//  kLiteral     attribute present and equal to the value
//  kAlternation attribute present and equal to one of the values
//  kNull        attribute absent, or cleared
//  kNegation    attribute absent, or not one of the values
enum class PredicateKind {
  kAny = 0,
  kLiteral,
  kAlternation,
  kNull,
  kNegation
};

class AttributePredicate {
  private:
    PredicateKind _kind;

    // For kLiteral.
    AttributeValue _literal;

    // For kAlternation and kNegation. A negated literal is held here
    // as a single choice. Order is as declared, which only matters
    // when writing.
    std::vector<AttributeValue> _choices;

  public:
    AttributePredicate();

    static AttributePredicate Any();
    static AttributePredicate Literal(const AttributeValue& value);
    static AttributePredicate Alternation(const std::vector<AttributeValue>& choices);
    static AttributePredicate Null();
    static AttributePredicate Not(const std::vector<AttributeValue>& choices);

    // "*" gives kAny, "A|B|C" an alternation, anything else a literal.
    static AttributePredicate FromString(const std::string& s);

    PredicateKind kind() const { return _kind;}

    const AttributeValue& literal() const { return _literal;}
    const std::vector<AttributeValue>& choices() const { return _choices;}

    // Does this predicate restrict anything. Used for specificity.
    bool is_constraint() const { return _kind != PredicateKind::kAny;}

    // `value` is nullptr when the attribute is absent.
    int Matches(const AttributeValue* value) const;

    // Alternations compare as sets.
    bool operator==(const AttributePredicate& rhs) const;
    bool operator!=(const AttributePredicate& rhs) const { return ! (*this == rhs);}

    std::string ToString() const;
};

std::ostream& operator<<(std::ostream& output, const AttributePredicate& predicate);

using PredicateMap = absl::btree_map<std::string, AttributePredicate>;

// Return 1 if every predicate in `predicates` is satisfied by `attributes`.
int PredicatesMatch(const PredicateMap& predicates, const AttributeMap& attributes);

// The number of predicates that are not wildcards.
int CountConstraints(const PredicateMap& predicates);

}  // namespace cgmap

#endif  // CGMAP_LIB_ATTRIBUTE_PREDICATE_H_
