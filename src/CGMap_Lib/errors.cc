#include <string>

#include "absl/strings/cord.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/types/optional.h"

#include "CGMap_Lib/errors.h"

namespace cgmap {

namespace {

constexpr char kErrorKindPayload[] = "cgmap/error_kind";

absl::Status
WithKind(absl::Status status, ErrorKind kind) {
  status.SetPayload(kErrorKindPayload, absl::Cord(ErrorKindName(kind)));
  return status;
}

}  // namespace

const char*
ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kNone:
      return "None";
    case ErrorKind::kGrammar:
      return "GrammarError";
    case ErrorKind::kMacro:
      return "MacroError";
    case ErrorKind::kNoMatch:
      return "NoMatchError";
    case ErrorKind::kAmbiguousMatch:
      return "AmbiguousMatchError";
    case ErrorKind::kStructuralInconsistency:
      return "StructuralInconsistencyError";
    case ErrorKind::kOther:
      return "Other";
  }

  return "Other";
}

absl::Status
GrammarError(absl::string_view message) {
  return WithKind(absl::InvalidArgumentError(absl::StrCat("GrammarError:", message)),
                  ErrorKind::kGrammar);
}

absl::Status
MacroError(absl::string_view message) {
  return WithKind(absl::InvalidArgumentError(absl::StrCat("MacroError:", message)),
                  ErrorKind::kMacro);
}

absl::Status
NoMatchError(absl::string_view message) {
  return WithKind(absl::NotFoundError(absl::StrCat("NoMatchError:", message)),
                  ErrorKind::kNoMatch);
}

absl::Status
AmbiguousMatchError(absl::string_view message) {
  return WithKind(absl::FailedPreconditionError(absl::StrCat("AmbiguousMatchError:", message)),
                  ErrorKind::kAmbiguousMatch);
}

absl::Status
StructuralInconsistencyError(absl::string_view message) {
  return WithKind(absl::FailedPreconditionError(
                      absl::StrCat("StructuralInconsistencyError:", message)),
                  ErrorKind::kStructuralInconsistency);
}

ErrorKind
KindOf(const absl::Status& status) {
  if (status.ok()) {
    return ErrorKind::kNone;
  }

  absl::optional<absl::Cord> payload = status.GetPayload(kErrorKindPayload);
  if (! payload.has_value()) {
    return ErrorKind::kOther;
  }

  const std::string name(*payload);
  for (ErrorKind kind : {ErrorKind::kGrammar, ErrorKind::kMacro, ErrorKind::kNoMatch,
                         ErrorKind::kAmbiguousMatch,
                         ErrorKind::kStructuralInconsistency}) {
    if (name == ErrorKindName(kind)) {
      return kind;
    }
  }

  return ErrorKind::kOther;
}

absl::Status
AddContext(const absl::Status& status, absl::string_view context) {
  if (status.ok()) {
    return status;
  }

  const ErrorKind kind = KindOf(status);
  absl::string_view message = status.message();

  const std::string prefix = absl::StrCat(ErrorKindName(kind), ":");
  if (absl::StartsWith(message, prefix)) {
    message.remove_prefix(prefix.size());
  }

  const std::string with_context = absl::StrCat(context, ": ", message);

  switch (kind) {
    case ErrorKind::kGrammar:
      return GrammarError(with_context);
    case ErrorKind::kMacro:
      return MacroError(with_context);
    case ErrorKind::kNoMatch:
      return NoMatchError(with_context);
    case ErrorKind::kAmbiguousMatch:
      return AmbiguousMatchError(with_context);
    case ErrorKind::kStructuralInconsistency:
      return StructuralInconsistencyError(with_context);
    default:
      break;
  }

  return absl::Status(status.code(), with_context);
}

}  // namespace cgmap
