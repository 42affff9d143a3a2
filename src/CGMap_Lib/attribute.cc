#include <iostream>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "CGMap_Lib/attribute.h"

namespace cgmap {

using std::cerr;

AttributeValue::AttributeValue() {
  _kind = AttributeKind::kNull;
  _bool_value = false;
  _int_value = 0;
  _float_value = 0.0;
}

AttributeValue::AttributeValue(bool b) : AttributeValue() {
  _kind = AttributeKind::kBool;
  _bool_value = b;
}

AttributeValue::AttributeValue(int i) : AttributeValue() {
  _kind = AttributeKind::kInt;
  _int_value = i;
}

AttributeValue::AttributeValue(int64_t i) : AttributeValue() {
  _kind = AttributeKind::kInt;
  _int_value = i;
}

AttributeValue::AttributeValue(double d) : AttributeValue() {
  _kind = AttributeKind::kFloat;
  _float_value = d;
}

AttributeValue::AttributeValue(const char* s) : AttributeValue() {
  _kind = AttributeKind::kString;
  _string_value = s;
}

AttributeValue::AttributeValue(const std::string& s) : AttributeValue() {
  _kind = AttributeKind::kString;
  _string_value = s;
}

AttributeValue::AttributeValue(const std::vector<double>& v) : AttributeValue() {
  _kind = AttributeKind::kVector;
  _vector_value = v;
}

int
AttributeValue::AsDouble(double& result) const {
  if (_kind == AttributeKind::kInt) {
    result = static_cast<double>(_int_value);
    return 1;
  }
  if (_kind == AttributeKind::kFloat) {
    result = _float_value;
    return 1;
  }

  return 0;
}

bool
AttributeValue::operator==(const AttributeValue& rhs) const {
  if (is_numeric() && rhs.is_numeric()) {
    if (_kind == AttributeKind::kInt && rhs._kind == AttributeKind::kInt) {
      return _int_value == rhs._int_value;
    }
    double v1, v2;
    AsDouble(v1);
    rhs.AsDouble(v2);
    return v1 == v2;
  }

  if (_kind != rhs._kind) {
    return false;
  }

  switch (_kind) {
    case AttributeKind::kNull:
      return true;
    case AttributeKind::kBool:
      return _bool_value == rhs._bool_value;
    case AttributeKind::kString:
      return _string_value == rhs._string_value;
    case AttributeKind::kVector:
      return _vector_value == rhs._vector_value;
    default:
      break;
  }

  return false;
}

bool
AttributeValue::operator<(const AttributeValue& rhs) const {
  if (is_numeric() && rhs.is_numeric()) {
    double v1, v2;
    AsDouble(v1);
    rhs.AsDouble(v2);
    return v1 < v2;
  }

  if (_kind != rhs._kind) {
    return static_cast<int>(_kind) < static_cast<int>(rhs._kind);
  }

  switch (_kind) {
    case AttributeKind::kNull:
      return false;
    case AttributeKind::kBool:
      return _bool_value < rhs._bool_value;
    case AttributeKind::kString:
      return _string_value < rhs._string_value;
    case AttributeKind::kVector:
      return _vector_value < rhs._vector_value;
    default:
      break;
  }

  return false;
}

std::string
AttributeValue::ToString() const {
  switch (_kind) {
    case AttributeKind::kNull:
      return "null";
    case AttributeKind::kBool:
      return _bool_value ? "true" : "false";
    case AttributeKind::kInt:
      return absl::StrCat(_int_value);
    case AttributeKind::kFloat:
      return absl::StrCat(_float_value);
    case AttributeKind::kString:
      return _string_value;
    case AttributeKind::kVector:
      return absl::StrCat("(", absl::StrJoin(_vector_value, ","), ")");
  }

  return "";
}

std::ostream&
operator<<(std::ostream& output, const AttributeValue& value) {
  output << value.ToString();

  return output;
}

void
AttributeValue::ToProto(cgmap_data::AttributeValue& proto) const {
  proto.Clear();

  switch (_kind) {
    case AttributeKind::kNull:
      break;
    case AttributeKind::kBool:
      proto.set_bool_value(_bool_value);
      break;
    case AttributeKind::kInt:
      proto.set_int_value(_int_value);
      break;
    case AttributeKind::kFloat:
      proto.set_float_value(_float_value);
      break;
    case AttributeKind::kString:
      proto.set_string_value(_string_value);
      break;
    case AttributeKind::kVector:
      for (double x : _vector_value) {
        proto.mutable_vector_value()->add_x(x);
      }
      break;
  }
}

int
AttributeValue::BuildFromProto(const cgmap_data::AttributeValue& proto) {
  *this = AttributeValue();

  switch (proto.value_case()) {
    case cgmap_data::AttributeValue::kBoolValue:
      *this = AttributeValue(proto.bool_value());
      return 1;
    case cgmap_data::AttributeValue::kIntValue:
      *this = AttributeValue(static_cast<int64_t>(proto.int_value()));
      return 1;
    case cgmap_data::AttributeValue::kFloatValue:
      *this = AttributeValue(proto.float_value());
      return 1;
    case cgmap_data::AttributeValue::kStringValue:
      *this = AttributeValue(proto.string_value());
      return 1;
    case cgmap_data::AttributeValue::kVectorValue:
      *this = AttributeValue(std::vector<double>(proto.vector_value().x().begin(),
                                                 proto.vector_value().x().end()));
      return 1;
    case cgmap_data::AttributeValue::VALUE_NOT_SET:
      break;
  }

  cerr << "AttributeValue::BuildFromProto:no value " << proto.ShortDebugString() << '\n';
  return 0;
}

const AttributeValue*
FindAttribute(const AttributeMap& attributes, const std::string& key) {
  auto iter = attributes.find(key);
  if (iter == attributes.end()) {
    return nullptr;
  }

  return &iter->second;
}

std::string
AttributeAsString(const AttributeMap& attributes, const std::string& key) {
  const AttributeValue* v = FindAttribute(attributes, key);
  if (v == nullptr) {
    return "";
  }

  return v->ToString();
}

int
AttributeMapFromProto(const google::protobuf::Map<std::string, cgmap_data::AttributeValue>& proto,
                      AttributeMap& destination) {
  destination.clear();

  for (const auto& [key, value] : proto) {
    AttributeValue v;
    if (! v.BuildFromProto(value)) {
      cerr << "AttributeMapFromProto:invalid value for '" << key << "'\n";
      return 0;
    }
    destination[key] = std::move(v);
  }

  return 1;
}

void
AttributeMapToProto(const AttributeMap& attributes,
                    google::protobuf::Map<std::string, cgmap_data::AttributeValue>& destination) {
  destination.clear();

  for (const auto& [key, value] : attributes) {
    if (value.is_null()) {
      continue;
    }
    value.ToProto(destination[key]);
  }
}

}  // namespace cgmap
