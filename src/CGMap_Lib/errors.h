#ifndef CGMAP_LIB_ERRORS_H_
#define CGMAP_LIB_ERRORS_H_

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace cgmap {

// The kinds of failure that callers need to tell apart. The kind
// travels with an absl::Status as a payload.
enum class ErrorKind {
  kNone = 0,
  kGrammar,
  kMacro,
  kNoMatch,
  kAmbiguousMatch,
  kStructuralInconsistency,
  kOther
};

absl::Status GrammarError(absl::string_view message);
absl::Status MacroError(absl::string_view message);
absl::Status NoMatchError(absl::string_view message);
absl::Status AmbiguousMatchError(absl::string_view message);
absl::Status StructuralInconsistencyError(absl::string_view message);

// kNone for an ok status, kOther for a status not made by the
// functions above.
ErrorKind KindOf(const absl::Status& status);

const char* ErrorKindName(ErrorKind kind);

// A status of the same kind and code, with `context` placed in front
// of the original message.
absl::Status AddContext(const absl::Status& status, absl::string_view context);

}  // namespace cgmap

#endif  // CGMAP_LIB_ERRORS_H_
