#ifndef CGMAP_LIB_MACRO_TABLE_H_
#define CGMAP_LIB_MACRO_TABLE_H_

#include <string>

#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace cgmap {

// Textual macros defined in a [ macros ] section and referenced as
// $name in later lines.
// A table belongs to one parse session. Values are stored already
// expanded, so a definition may use macros defined before it.
class MacroTable {
  private:
    absl::btree_map<std::string, std::string> _macros;

  public:
    // Fails with a MacroError if `value` refers to `name` itself, or
    // to a macro not yet defined. A redefinition replaces the old value.
    absl::Status Define(absl::string_view name, absl::string_view value);

    // Replace every $name in `text`. An undefined reference is a MacroError.
    absl::StatusOr<std::string> Expand(absl::string_view text) const;

    bool contains(absl::string_view name) const;

    // nullptr if not defined.
    const std::string* Find(absl::string_view name) const;

    int size() const { return _macros.size();}
    bool empty() const { return _macros.empty();}

    void clear() { _macros.clear();}

    const absl::btree_map<std::string, std::string>& macros() const { return _macros;}
};

// Return 1 if `name` is usable as a macro name.
int ValidMacroName(absl::string_view name);

}  // namespace cgmap

#endif  // CGMAP_LIB_MACRO_TABLE_H_
