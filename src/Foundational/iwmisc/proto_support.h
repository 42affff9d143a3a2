#ifndef FOUNDATIONAL_IWMISC_PROTO_SUPPORT_H_
#define FOUNDATIONAL_IWMISC_PROTO_SUPPORT_H_
// Reading and writing text format protos.

#include <iostream>
#include <optional>
#include <ostream>
#include <string>

#include "google/protobuf/text_format.h"

namespace iwmisc {

using std::cerr;

// The whole of `fname` as a string. Reports the failure to cerr.
std::optional<std::string> FileContents(const std::string& fname);

// Parse the text format proto in `fname`.
template <typename Proto>
std::optional<Proto>
ReadTextProto(const std::string& fname) {
  std::optional<std::string> contents = FileContents(fname);
  if (! contents) {
    return std::nullopt;
  }

  Proto result;
  if (! google::protobuf::TextFormat::ParseFromString(*contents, &result)) {
    cerr << "ReadTextProto:cannot parse " << result.GetTypeName() << " from '" << fname << "'\n";
    return std::nullopt;
  }

  return result;
}

// Write `proto` in text format to an ostream, std::cout for example.
template <typename Proto>
int
WriteTextProto(const Proto& proto, std::ostream& output) {
  std::string s;
  if (! google::protobuf::TextFormat::PrintToString(proto, &s)) {
    cerr << "WriteTextProto:cannot format " << proto.GetTypeName() << '\n';
    return 0;
  }

  output << s;

  return output.good();
}

}  // namespace iwmisc

#endif // FOUNDATIONAL_IWMISC_PROTO_SUPPORT_H_
