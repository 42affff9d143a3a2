#ifndef CGMAP_LIB_ATTRIBUTE_H_
#define CGMAP_LIB_ATTRIBUTE_H_

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "absl/container/btree_map.h"

#include "CGMap_Lib/cgmap.pb.h"

namespace cgmap {

// Atoms and bonds carry dictionaries of attributes. Values are
// one of a small number of kinds. A Null value only ever appears in
// an update: when merged into an atom it removes the attribute.

enum class AttributeKind {
  kNull = 0,
  kBool,
  kInt,
  kFloat,
  kString,
  kVector
};

class AttributeValue {
  private:
    AttributeKind _kind;

    bool _bool_value;
    int64_t _int_value;
    double _float_value;
    std::string _string_value;

    // Positions, velocities...
    std::vector<double> _vector_value;

  public:
    AttributeValue();
    AttributeValue(bool b);
    AttributeValue(int i);
    AttributeValue(int64_t i);
    AttributeValue(double d);
    AttributeValue(const char* s);
    AttributeValue(const std::string& s);
    AttributeValue(const std::vector<double>& v);

    static AttributeValue Null() { return AttributeValue();}

    AttributeKind kind() const { return _kind;}

    bool is_null() const { return _kind == AttributeKind::kNull;}
    bool is_numeric() const {
      return _kind == AttributeKind::kInt || _kind == AttributeKind::kFloat;
    }
    bool is_string() const { return _kind == AttributeKind::kString;}
    bool is_vector() const { return _kind == AttributeKind::kVector;}

    bool bool_value() const { return _bool_value;}
    int64_t int_value() const { return _int_value;}
    double float_value() const { return _float_value;}
    const std::string& string_value() const { return _string_value;}
    const std::vector<double>& vector_value() const { return _vector_value;}

    // Numeric kinds only. Returns 0 if not numeric.
    int AsDouble(double& result) const;

    // Int and Float values compare numerically, so 3 == 3.0.
    bool operator==(const AttributeValue& rhs) const;
    bool operator!=(const AttributeValue& rhs) const { return ! (*this == rhs);}

    // A total order, used to build keys. Kinds order first.
    bool operator<(const AttributeValue& rhs) const;

    std::string ToString() const;

    void ToProto(cgmap_data::AttributeValue& proto) const;
    int BuildFromProto(const cgmap_data::AttributeValue& proto);
};

std::ostream& operator<<(std::ostream& output, const AttributeValue& value);

// Keys are kept sorted so that iteration, printing and comparison are
// reproducible.
using AttributeMap = absl::btree_map<std::string, AttributeValue>;

// Common attribute names.
inline constexpr char kAtomName[] = "atomname";
inline constexpr char kResName[] = "resname";
inline constexpr char kResId[] = "resid";
inline constexpr char kChain[] = "chain";
inline constexpr char kElement[] = "element";
inline constexpr char kPosition[] = "position";
inline constexpr char kPtmAtom[] = "PTM_atom";
inline constexpr char kModification[] = "modification";

// Convenience lookup, nullptr if absent.
const AttributeValue* FindAttribute(const AttributeMap& attributes, const std::string& key);

// Return the value of `key` as a string, empty if absent.
std::string AttributeAsString(const AttributeMap& attributes, const std::string& key);

int AttributeMapFromProto(const google::protobuf::Map<std::string, cgmap_data::AttributeValue>& proto,
                          AttributeMap& destination);
void AttributeMapToProto(const AttributeMap& attributes,
                         google::protobuf::Map<std::string, cgmap_data::AttributeValue>& destination);

}  // namespace cgmap

#endif  // CGMAP_LIB_ATTRIBUTE_H_
