#include <string>

#include "absl/strings/str_cat.h"
#include "re2/re2.h"

#include "CGMap_Lib/errors.h"
#include "CGMap_Lib/macro_table.h"

namespace cgmap {

namespace {

const RE2&
MacroReference() {
  static const RE2 rx(R"(\$([A-Za-z_][A-Za-z0-9_]*))");
  return rx;
}

}  // namespace

int
ValidMacroName(absl::string_view name) {
  static const RE2 rx("[A-Za-z_][A-Za-z0-9_]*");

  return RE2::FullMatch(re2::StringPiece(name.data(), name.size()), rx);
}

bool
MacroTable::contains(absl::string_view name) const {
  return _macros.contains(std::string(name));
}

const std::string*
MacroTable::Find(absl::string_view name) const {
  auto iter = _macros.find(std::string(name));
  if (iter == _macros.end()) {
    return nullptr;
  }

  return &iter->second;
}

absl::StatusOr<std::string>
MacroTable::Expand(absl::string_view text) const {
  std::string result;
  result.reserve(text.size());

  re2::StringPiece input(text.data(), text.size());
  re2::StringPiece name;

  // Start of text not yet copied to `result`.
  const char* pending = text.data();

  while (RE2::FindAndConsume(&input, MacroReference(), &name)) {
    // The match starts at the '$' just before the captured name.
    const char* dollar = name.data() - 1;
    result.append(pending, dollar - pending);

    const std::string* value = Find(absl::string_view(name.data(), name.size()));
    if (value == nullptr) {
      return MacroError(absl::StrCat("undefined macro '$", std::string(name.data(), name.size()), "'"));
    }
    result.append(*value);

    pending = input.data();
  }

  result.append(pending, text.data() + text.size() - pending);

  return result;
}

absl::Status
MacroTable::Define(absl::string_view name, absl::string_view value) {
  if (! ValidMacroName(name)) {
    return MacroError(absl::StrCat("invalid macro name '", name, "'"));
  }

  re2::StringPiece input(value.data(), value.size());
  re2::StringPiece ref;
  while (RE2::FindAndConsume(&input, MacroReference(), &ref)) {
    if (absl::string_view(ref.data(), ref.size()) == name) {
      return MacroError(absl::StrCat("macro '", name, "' refers to itself"));
    }
  }

  absl::StatusOr<std::string> expanded = Expand(value);
  if (! expanded.ok()) {
    return MacroError(absl::StrCat("in definition of '", name, "': ",
                                   expanded.status().message()));
  }

  _macros[std::string(name)] = *std::move(expanded);

  return absl::OkStatus();
}

}  // namespace cgmap
