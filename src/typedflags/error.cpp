#include "./error.hpp"
#include "./util.hpp"

namespace typedflags {

char const *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::DUPLICATE_FLAG:        return "DuplicateFlag";
  case ErrorKind::INVALID_DEFAULT:       return "InvalidDefault";
  case ErrorKind::INVALID_FLAG_NAME:     return "InvalidFlagName";
  case ErrorKind::INVALID_PREFIX:        return "InvalidPrefix";
  case ErrorKind::UNKNOWN_FLAG:          return "UnknownFlag";
  case ErrorKind::MISSING_VALUE:         return "MissingValue";
  case ErrorKind::INVALID_VALUE:         return "InvalidValue";
  case ErrorKind::MISSING_REQUIRED_FLAG: return "MissingRequiredFlag";
  case ErrorKind::HELP_REQUESTED:        return "HelpRequested";
  case ErrorKind::UNKNOWN_FLAG_NAME:     return "UnknownFlagName";
  case ErrorKind::TYPE_MISMATCH:         return "TypeMismatch";
  }
  throw std::logic_error("Invalid error kind encountered");
}

CoercionError::CoercionError(FlagKind kind, string_view text)
  : std::invalid_argument(string("invalid ") + kind_name(kind) + " value: " + repr(text)),
    kind_(kind), text_(text)
{}

/**
 * Registration errors
 **/

RegistrationError RegistrationError::duplicate_flag(string const &name) {
  return RegistrationError(ErrorKind::DUPLICATE_FLAG, {name}, "conflicting flag name: " + repr(name));
}

RegistrationError RegistrationError::invalid_default(string const &name, string const &reason) {
  return RegistrationError(ErrorKind::INVALID_DEFAULT, {name}, "invalid default for flag " + repr(name) + ": " + reason);
}

RegistrationError RegistrationError::invalid_flag_name(string const &name, string const &reason) {
  return RegistrationError(ErrorKind::INVALID_FLAG_NAME, {name}, "invalid flag name " + repr(name) + ": " + reason);
}

RegistrationError RegistrationError::invalid_prefix() {
  return RegistrationError(ErrorKind::INVALID_PREFIX, {}, "flag prefix must be non-empty");
}

/**
 * Parse errors
 **/

ParseError ParseError::unknown_flag(string const &name, vector<string> const &suggestions) {
  string msg = "unrecognized flag: " + repr(name);
  if (!suggestions.empty())
    msg += " (did you mean " + util::join(", ", suggestions) + "?)";
  return ParseError(ErrorKind::UNKNOWN_FLAG, {name}, msg);
}

ParseError ParseError::missing_value(string const &name, string const &option) {
  return ParseError(ErrorKind::MISSING_VALUE, {name}, "argument " + option + ": expected one argument");
}

ParseError ParseError::invalid_value(string const &name, string const &option, CoercionError const &cause) {
  return ParseError(ErrorKind::INVALID_VALUE, {name}, "argument " + option + ": " + cause.what(),
                    cause.text(), kind_name(cause.kind()));
}

ParseError ParseError::duplicate_flag(string const &name, string const &option) {
  return ParseError(ErrorKind::DUPLICATE_FLAG, {name}, "argument " + option + ": given more than once");
}

ParseError ParseError::missing_required(vector<string> names, string const &prefix) {
  string msg = "the following flags are required: " +
               util::join(", ", names, [&](string const &name) { return prefix + name; });
  return ParseError(ErrorKind::MISSING_REQUIRED_FLAG, std::move(names), msg);
}

ParseError ParseError::help_requested(string const &option) {
  return ParseError(ErrorKind::HELP_REQUESTED, {}, "help requested with " + option);
}

/**
 * Retrieval errors
 **/

RetrievalError RetrievalError::unknown_flag_name(string const &name) {
  return RetrievalError(ErrorKind::UNKNOWN_FLAG_NAME, {name}, "no flag registered with name " + repr(name));
}

RetrievalError RetrievalError::type_mismatch(string const &name, FlagKind requested, FlagKind stored) {
  return RetrievalError(ErrorKind::TYPE_MISMATCH, {name},
                        "flag " + repr(name) + " holds a " + kind_name(stored) + " value, not " + kind_name(requested));
}

} // namespace typedflags
