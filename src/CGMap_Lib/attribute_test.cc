#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "google/protobuf/text_format.h"

#include "CGMap_Lib/attribute.h"

namespace {

using cgmap::AttributeKind;
using cgmap::AttributeMap;
using cgmap::AttributeValue;

TEST(TestAttributeValue, DefaultIsNull) {
  AttributeValue v;
  EXPECT_TRUE(v.is_null());
  EXPECT_EQ(v, AttributeValue::Null());
  EXPECT_EQ(v.ToString(), "null");
}

TEST(TestAttributeValue, IntAndFloatCompareNumerically) {
  EXPECT_EQ(AttributeValue(3), AttributeValue(3.0));
  EXPECT_NE(AttributeValue(3), AttributeValue(3.5));
  EXPECT_NE(AttributeValue(3), AttributeValue("3"));
  EXPECT_NE(AttributeValue(true), AttributeValue(1));
}

TEST(TestAttributeValue, CharPointerIsAString) {
  AttributeValue v("CA");
  EXPECT_EQ(v.kind(), AttributeKind::kString);
  EXPECT_EQ(v.string_value(), "CA");
}

TEST(TestAttributeValue, AsDouble) {
  double x = 0.0;
  EXPECT_TRUE(AttributeValue(2).AsDouble(x));
  EXPECT_DOUBLE_EQ(x, 2.0);
  EXPECT_TRUE(AttributeValue(2.5).AsDouble(x));
  EXPECT_DOUBLE_EQ(x, 2.5);
  EXPECT_FALSE(AttributeValue("2.5").AsDouble(x));
}

TEST(TestAttributeValue, Vector) {
  AttributeValue v(std::vector<double>{1.0, 2.5, -3.0});
  EXPECT_TRUE(v.is_vector());
  EXPECT_THAT(v.vector_value(), testing::ElementsAre(1.0, 2.5, -3.0));
  EXPECT_EQ(v.ToString(), "(1,2.5,-3)");
  EXPECT_NE(v, AttributeValue(std::vector<double>{1.0, 2.5}));
}

TEST(TestAttributeValue, OrderingPutsKindFirst) {
  EXPECT_LT(AttributeValue(true), AttributeValue(0));
  EXPECT_LT(AttributeValue("A"), AttributeValue("B"));
  EXPECT_FALSE(AttributeValue("B") < AttributeValue("A"));
}

TEST(TestAttributeValue, FromProto) {
  const std::string as_text = R"pb(
    vector_value {
      x: 1.5
      x: 2
    }
  )pb";

  cgmap_data::AttributeValue proto;
  ASSERT_TRUE(google::protobuf::TextFormat::ParseFromString(as_text, &proto));

  AttributeValue v;
  ASSERT_TRUE(v.BuildFromProto(proto));
  EXPECT_EQ(v, AttributeValue(std::vector<double>{1.5, 2.0}));

  cgmap_data::AttributeValue back;
  v.ToProto(back);
  EXPECT_EQ(back.vector_value().x_size(), 2);
}

TEST(TestAttributeMap, NullValuesAreNotWritten) {
  AttributeMap attributes;
  attributes[cgmap::kAtomName] = AttributeValue("CA");
  attributes[cgmap::kResId] = AttributeValue(12);
  attributes["charge"] = AttributeValue::Null();

  cgmap_data::Node node;
  cgmap::AttributeMapToProto(attributes, *node.mutable_attribute());
  EXPECT_EQ(node.attribute_size(), 2);
  EXPECT_EQ(node.attribute().count("charge"), 0);

  AttributeMap back;
  ASSERT_TRUE(cgmap::AttributeMapFromProto(node.attribute(), back));
  EXPECT_EQ(cgmap::AttributeAsString(back, cgmap::kAtomName), "CA");
  EXPECT_EQ(cgmap::AttributeAsString(back, cgmap::kResId), "12");
  EXPECT_EQ(cgmap::FindAttribute(back, "charge"), nullptr);
}

}  // namespace
