#include <cmath>
#include <iostream>
#include <string>
#include <vector>

#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

#include "CGMap_Lib/rule_json.h"

namespace cgmap {

using std::cerr;
using google::protobuf::ListValue;
using google::protobuf::Value;

AttributeValue
NumberToAttribute(double d) {
  if (std::isfinite(d) && d == std::floor(d) && std::fabs(d) < 9.0e15) {
    return AttributeValue(static_cast<int64_t>(d));
  }

  return AttributeValue(d);
}

namespace {

// All strings, all numbers, or mixed/other.
enum class ListKind {
  kEmpty,
  kStrings,
  kNumbers,
  kMixed
};

ListKind
KindOfList(const ListValue& list) {
  if (list.values_size() == 0) {
    return ListKind::kEmpty;
  }

  int strings = 0;
  int numbers = 0;
  for (const Value& v : list.values()) {
    if (v.kind_case() == Value::kStringValue) {
      ++strings;
    } else if (v.kind_case() == Value::kNumberValue) {
      ++numbers;
    }
  }

  if (strings == list.values_size()) {
    return ListKind::kStrings;
  }
  if (numbers == list.values_size()) {
    return ListKind::kNumbers;
  }

  return ListKind::kMixed;
}

std::vector<double>
ListAsVector(const ListValue& list) {
  std::vector<double> result;
  result.reserve(list.values_size());
  for (const Value& v : list.values()) {
    result.push_back(v.number_value());
  }

  return result;
}

// The choices of a negation, from a string "A|B", a list of strings,
// or a single literal.
int
NegatedChoices(const Value& value, std::vector<AttributeValue>& choices) {
  switch (value.kind_case()) {
    case Value::kStringValue:
      for (absl::string_view token : absl::StrSplit(value.string_value(), '|', absl::SkipEmpty())) {
        choices.emplace_back(std::string(token));
      }
      return ! choices.empty();
    case Value::kNumberValue:
      choices.push_back(NumberToAttribute(value.number_value()));
      return 1;
    case Value::kBoolValue:
      choices.emplace_back(value.bool_value());
      return 1;
    case Value::kListValue:
      if (KindOfList(value.list_value()) == ListKind::kStrings) {
        for (const Value& v : value.list_value().values()) {
          choices.emplace_back(v.string_value());
        }
        return 1;
      }
      if (KindOfList(value.list_value()) == ListKind::kNumbers) {
        choices.emplace_back(ListAsVector(value.list_value()));
        return 1;
      }
      break;
    default:
      break;
  }

  cerr << "NegatedChoices:cannot negate " << value.ShortDebugString() << '\n';
  return 0;
}

}  // namespace

int
PredicateFromValue(const Value& value, AttributePredicate& predicate) {
  switch (value.kind_case()) {
    case Value::kNullValue:
      predicate = AttributePredicate::Null();
      return 1;
    case Value::kNumberValue:
      predicate = AttributePredicate::Literal(NumberToAttribute(value.number_value()));
      return 1;
    case Value::kStringValue:
      predicate = AttributePredicate::FromString(value.string_value());
      return 1;
    case Value::kBoolValue:
      predicate = AttributePredicate::Literal(AttributeValue(value.bool_value()));
      return 1;
    case Value::kListValue: {
      const ListKind kind = KindOfList(value.list_value());
      if (kind == ListKind::kStrings) {
        std::vector<AttributeValue> choices;
        for (const Value& v : value.list_value().values()) {
          choices.emplace_back(v.string_value());
        }
        if (choices.size() == 1) {
          predicate = AttributePredicate::Literal(choices[0]);
        } else {
          predicate = AttributePredicate::Alternation(choices);
        }
        return 1;
      }
      if (kind == ListKind::kNumbers) {
        predicate = AttributePredicate::Literal(AttributeValue(ListAsVector(value.list_value())));
        return 1;
      }
      cerr << "PredicateFromValue:list must be all strings or all numbers " << value.ShortDebugString() << '\n';
      return 0;
    }
    case Value::kStructValue: {
      const auto& fields = value.struct_value().fields();
      if (fields.size() != 1 || fields.count("not") == 0) {
        cerr << "PredicateFromValue:only {\"not\": ...} objects are recognised " << value.ShortDebugString() << '\n';
        return 0;
      }
      std::vector<AttributeValue> choices;
      if (! NegatedChoices(fields.at("not"), choices)) {
        return 0;
      }
      predicate = AttributePredicate::Not(choices);
      return 1;
    }
    default:
      break;
  }

  cerr << "PredicateFromValue:unrecognised value " << value.ShortDebugString() << '\n';
  return 0;
}

int
AttributeFromValue(const Value& value, AttributeValue& result) {
  switch (value.kind_case()) {
    case Value::kNullValue:
      result = AttributeValue::Null();
      return 1;
    case Value::kNumberValue:
      result = NumberToAttribute(value.number_value());
      return 1;
    case Value::kStringValue:
      result = AttributeValue(value.string_value());
      return 1;
    case Value::kBoolValue:
      result = AttributeValue(value.bool_value());
      return 1;
    case Value::kListValue:
      if (KindOfList(value.list_value()) == ListKind::kNumbers) {
        result = AttributeValue(ListAsVector(value.list_value()));
        return 1;
      }
      break;
    default:
      break;
  }

  cerr << "AttributeFromValue:not a literal " << value.ShortDebugString() << '\n';
  return 0;
}

void
AttributeToValue(const AttributeValue& attribute, Value& value) {
  value.Clear();

  switch (attribute.kind()) {
    case AttributeKind::kNull:
      value.set_null_value(google::protobuf::NULL_VALUE);
      break;
    case AttributeKind::kBool:
      value.set_bool_value(attribute.bool_value());
      break;
    case AttributeKind::kInt:
      value.set_number_value(static_cast<double>(attribute.int_value()));
      break;
    case AttributeKind::kFloat:
      value.set_number_value(attribute.float_value());
      break;
    case AttributeKind::kString:
      value.set_string_value(attribute.string_value());
      break;
    case AttributeKind::kVector:
      for (double x : attribute.vector_value()) {
        value.mutable_list_value()->add_values()->set_number_value(x);
      }
      break;
  }
}

namespace {

bool
AllStrings(const std::vector<AttributeValue>& choices) {
  for (const AttributeValue& v : choices) {
    if (! v.is_string()) {
      return false;
    }
  }

  return true;
}

void
ChoicesToValue(const std::vector<AttributeValue>& choices, Value& value) {
  if (choices.size() == 1) {
    AttributeToValue(choices[0], value);
    return;
  }

  if (AllStrings(choices)) {
    std::vector<std::string> tmp;
    for (const AttributeValue& v : choices) {
      tmp.push_back(v.string_value());
    }
    value.set_string_value(absl::StrJoin(tmp, "|"));
    return;
  }

  for (const AttributeValue& v : choices) {
    AttributeToValue(v, *value.mutable_list_value()->add_values());
  }
}

}  // namespace

void
PredicateToValue(const AttributePredicate& predicate, Value& value) {
  value.Clear();

  switch (predicate.kind()) {
    case PredicateKind::kAny:
      value.set_string_value("*");
      break;
    case PredicateKind::kLiteral:
      AttributeToValue(predicate.literal(), value);
      break;
    case PredicateKind::kAlternation:
      ChoicesToValue(predicate.choices(), value);
      break;
    case PredicateKind::kNull:
      value.set_null_value(google::protobuf::NULL_VALUE);
      break;
    case PredicateKind::kNegation: {
      Value& negated = (*value.mutable_struct_value()->mutable_fields())["not"];
      ChoicesToValue(predicate.choices(), negated);
      break;
    }
  }
}

}  // namespace cgmap
