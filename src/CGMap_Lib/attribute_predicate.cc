#include <algorithm>
#include <iostream>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

#include "CGMap_Lib/attribute_predicate.h"

namespace cgmap {

AttributePredicate::AttributePredicate() {
  _kind = PredicateKind::kAny;
}

AttributePredicate
AttributePredicate::Any() {
  return AttributePredicate();
}

AttributePredicate
AttributePredicate::Literal(const AttributeValue& value) {
  AttributePredicate result;
  result._kind = PredicateKind::kLiteral;
  result._literal = value;
  return result;
}

AttributePredicate
AttributePredicate::Alternation(const std::vector<AttributeValue>& choices) {
  AttributePredicate result;
  result._kind = PredicateKind::kAlternation;
  result._choices = choices;
  return result;
}

AttributePredicate
AttributePredicate::Null() {
  AttributePredicate result;
  result._kind = PredicateKind::kNull;
  return result;
}

AttributePredicate
AttributePredicate::Not(const std::vector<AttributeValue>& choices) {
  AttributePredicate result;
  result._kind = PredicateKind::kNegation;
  result._choices = choices;
  return result;
}

AttributePredicate
AttributePredicate::FromString(const std::string& s) {
  if (s == "*") {
    return Any();
  }

  if (s.find('|') == std::string::npos) {
    return Literal(AttributeValue(s));
  }

  std::vector<AttributeValue> choices;
  for (absl::string_view token : absl::StrSplit(s, '|', absl::SkipEmpty())) {
    choices.emplace_back(std::string(token));
  }

  if (choices.size() == 1) {
    return Literal(choices[0]);
  }

  return Alternation(choices);
}

namespace {

bool
InChoices(const std::vector<AttributeValue>& choices, const AttributeValue& value) {
  return std::find(choices.begin(), choices.end(), value) != choices.end();
}

// Compare two sets of choices ignoring order.
bool
SameChoices(const std::vector<AttributeValue>& c1, const std::vector<AttributeValue>& c2) {
  for (const AttributeValue& v : c1) {
    if (! InChoices(c2, v)) {
      return false;
    }
  }
  for (const AttributeValue& v : c2) {
    if (! InChoices(c1, v)) {
      return false;
    }
  }

  return true;
}

}  // namespace

int
AttributePredicate::Matches(const AttributeValue* value) const {
  const bool absent = (value == nullptr || value->is_null());

  switch (_kind) {
    case PredicateKind::kAny:
      return 1;
    case PredicateKind::kLiteral:
      if (absent) {
        return 0;
      }
      return *value == _literal;
    case PredicateKind::kAlternation:
      if (absent) {
        return 0;
      }
      return InChoices(_choices, *value);
    case PredicateKind::kNull:
      return absent;
    case PredicateKind::kNegation:
      if (absent) {
        return 1;
      }
      return ! InChoices(_choices, *value);
  }

  return 0;
}

bool
AttributePredicate::operator==(const AttributePredicate& rhs) const {
  if (_kind != rhs._kind) {
    return false;
  }

  switch (_kind) {
    case PredicateKind::kAny:
    case PredicateKind::kNull:
      return true;
    case PredicateKind::kLiteral:
      return _literal == rhs._literal;
    case PredicateKind::kAlternation:
    case PredicateKind::kNegation:
      return SameChoices(_choices, rhs._choices);
  }

  return false;
}

std::string
AttributePredicate::ToString() const {
  auto formatter = [](std::string* out, const AttributeValue& v) {
    out->append(v.ToString());
  };

  switch (_kind) {
    case PredicateKind::kAny:
      return "*";
    case PredicateKind::kLiteral:
      return _literal.ToString();
    case PredicateKind::kAlternation:
      return absl::StrJoin(_choices, "|", formatter);
    case PredicateKind::kNull:
      return "null";
    case PredicateKind::kNegation:
      return absl::StrCat("not ", absl::StrJoin(_choices, "|", formatter));
  }

  return "";
}

std::ostream&
operator<<(std::ostream& output, const AttributePredicate& predicate) {
  output << predicate.ToString();

  return output;
}

int
PredicatesMatch(const PredicateMap& predicates, const AttributeMap& attributes) {
  for (const auto& [key, predicate] : predicates) {
    if (! predicate.Matches(FindAttribute(attributes, key))) {
      return 0;
    }
  }

  return 1;
}

int
CountConstraints(const PredicateMap& predicates) {
  int result = 0;
  for (const auto& [key, predicate] : predicates) {
    if (predicate.is_constraint()) {
      ++result;
    }
  }

  return result;
}

}  // namespace cgmap
