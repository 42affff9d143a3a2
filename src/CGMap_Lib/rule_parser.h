#ifndef CGMAP_LIB_RULE_PARSER_H_
#define CGMAP_LIB_RULE_PARSER_H_

#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

#include "CGMap_Lib/macro_table.h"
#include "CGMap_Lib/rule_records.h"

namespace cgmap {

// Reads the rule file grammar.
//   [ macros ]        name value
//   [ modification ]  name, then [ atoms ] [ edges ]
//   [ link ]          optional name, then [ atoms ] [ edges ]
//   [ block ]         name, then [ from ] [ to ] [ from blocks ] [ to blocks ]
//                     [ from nodes ] [ from edges ] [ to nodes ] [ to edges ]
//                     [ mapping ] [ reference atoms ]
// Section names are case insensitive. ';' starts a comment.
// An atom line is `name {json}`, the object being optional.
//
// Records are added to a RuleSet, which may accumulate the contents of
// several files. Macros go into the MacroTable passed in, which is
// owned by the caller and lives for one parse session.
class RuleParser {
  private:
    MacroTable& _macros;

    int _verbose;

    // An entry line of the current record, comment removed and macros
    // expanded.
    struct EntryLine {
      int line_number;
      std::string section;
      std::string text;
    };

    enum class State {
      kOutside,
      kMacros,
      kRecord
    };

    // Parse state, reset by Parse.
    std::string _source_name;
    State _state;
    RecordKind _kind;
    std::string _name;
    bool _expect_name;
    int _header_line;
    std::string _section;
    std::vector<EntryLine> _lines;

  // private functions

    absl::Status _Header(const std::string& section, int line_number, RuleSet& rules);
    absl::Status _Entry(absl::string_view line, int line_number);
    absl::Status _FinishRecord(RuleSet& rules);
    absl::Status _BuildBlock(RuleSet& rules);
    absl::Status _BuildPatternRule(RuleSet& rules);

    std::string _Context(int line_number, const std::string& section) const;
    absl::Status _Error(const EntryLine& line, absl::string_view message) const;

  public:
    explicit RuleParser(MacroTable& macros);

    void set_verbose(int s) { _verbose = s;}

    // `source_name` is used in error messages. On failure, records read
    // before the failing one remain in `rules`.
    absl::Status Parse(absl::string_view text, RuleSet& rules,
                       absl::string_view source_name = "<input>");

    absl::Status ParseFile(const std::string& fname, RuleSet& rules);
};

// Lowercase, internal whitespace collapsed to single spaces.
std::string NormaliseSectionName(absl::string_view s);

}  // namespace cgmap

#endif  // CGMAP_LIB_RULE_PARSER_H_
