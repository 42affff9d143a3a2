#ifndef CGMAP_LIB_RULE_JSON_H_
#define CGMAP_LIB_RULE_JSON_H_

// Conversion between the JSON attribute objects of the rule files,
// held as google.protobuf.Value, and predicates or attribute values.

#include "google/protobuf/struct.pb.h"

#include "CGMap_Lib/attribute.h"
#include "CGMap_Lib/attribute_predicate.h"

namespace cgmap {

// Strings with '|' become alternations, "*" a wildcard, a list of
// strings an alternation, a list of numbers a vector literal and
// {"not": X} a negation. Returns 0 for anything else.
int PredicateFromValue(const google::protobuf::Value& value, AttributePredicate& predicate);

// Literal values only. null is allowed, it means remove.
int AttributeFromValue(const google::protobuf::Value& value, AttributeValue& result);

void PredicateToValue(const AttributePredicate& predicate, google::protobuf::Value& value);
void AttributeToValue(const AttributeValue& attribute, google::protobuf::Value& value);

// JSON numbers are doubles. Integral values become ints.
AttributeValue NumberToAttribute(double d);

}  // namespace cgmap

#endif  // CGMAP_LIB_RULE_JSON_H_
