#ifndef HEADER_GUARD_c7de4732dbb3b77c3b924645ef6d6fc5
#define HEADER_GUARD_c7de4732dbb3b77c3b924645ef6d6fc5

#include <stdexcept>
#include <string>
#include <vector>

#include "./value.hpp"

namespace typedflags {

using std::vector;

/**
 * \brief Identifies the kind of a \ref Error
 **/
enum class ErrorKind : int {
  /**
   * \brief A flag name was registered twice, or a flag was given twice on the command line.
   **/
  DUPLICATE_FLAG,
  /**
   * \brief The default of an optional flag cannot be represented in the kind of the flag.
   **/
  INVALID_DEFAULT,
  /**
   * \brief A flag name is empty, contains whitespace, or starts with the flag prefix.
   **/
  INVALID_FLAG_NAME,
  /**
   * \brief The flag prefix is empty.
   **/
  INVALID_PREFIX,
  /**
   * \brief A token does not name a registered flag.
   **/
  UNKNOWN_FLAG,
  /**
   * \brief A flag that takes a value was the last token.
   **/
  MISSING_VALUE,
  /**
   * \brief The value given for a flag could not be converted to the kind of the flag.
   **/
  INVALID_VALUE,
  /**
   * \brief One or more required flags were not given.
   **/
  MISSING_REQUIRED_FLAG,
  /**
   * \brief The help flag was given.
   **/
  HELP_REQUESTED,
  /**
   * \brief A value was requested for a name that was never registered.
   **/
  UNKNOWN_FLAG_NAME,
  /**
   * \brief A value was requested with a type other than the kind of the flag.
   **/
  TYPE_MISMATCH,
};

/**
 * \brief Returns the symbolic name of \p kind, e.g. \p "MissingRequiredFlag"
 **/
char const *to_string(ErrorKind kind);

/**
 * \brief Raised when a token cannot be converted to a value of the requested kind
 **/
class CoercionError : public std::invalid_argument {
  FlagKind kind_;
  string text_;
public:
  CoercionError(FlagKind kind, string_view text);

  FlagKind kind() const { return kind_; }

  /**
   * \brief The text that failed to convert
   **/
  string const &text() const { return text_; }
};

/**
 * \brief Common base of all errors reported by registration, parsing and retrieval
 *
 * \ref what() is a diagnostic suitable for showing to the user.
 **/
class Error : public std::invalid_argument {
  ErrorKind kind_;
  vector<string> flags_;
public:
  Error(ErrorKind kind, vector<string> flags, string const &message)
    : std::invalid_argument(message), kind_(kind), flags_(std::move(flags))
  {}

  ErrorKind kind() const { return kind_; }

  /**
   * \brief Names (without prefix) of the flags the error is attributed to
   *
   * For \ref ErrorKind::MISSING_REQUIRED_FLAG this lists every missing flag in registration order.
   **/
  vector<string> const &flags() const { return flags_; }
};

/**
 * \brief Raised by \ref ProgramBuilder when a flag registration is rejected
 **/
class RegistrationError : public Error {
public:
  using Error::Error;

  static RegistrationError duplicate_flag(string const &name);
  static RegistrationError invalid_default(string const &name, string const &reason);
  static RegistrationError invalid_flag_name(string const &name, string const &reason);
  static RegistrationError invalid_prefix();
};

/**
 * \brief Raised by \ref Program::parse when the tokens do not match the schema
 **/
class ParseError : public Error {
  string text_;
  string type_name_;
public:
  ParseError(ErrorKind kind, vector<string> flags, string const &message, string text = {}, string type_name = {})
    : Error(kind, std::move(flags), message), text_(std::move(text)), type_name_(std::move(type_name))
  {}

  /**
   * \brief For \ref ErrorKind::INVALID_VALUE, the token that failed to convert
   **/
  string const &text() const { return text_; }

  /**
   * \brief For \ref ErrorKind::INVALID_VALUE, the display name of the expected kind
   **/
  string const &type_name() const { return type_name_; }

  static ParseError unknown_flag(string const &name, vector<string> const &suggestions = {});
  static ParseError missing_value(string const &name, string const &option);
  static ParseError invalid_value(string const &name, string const &option, CoercionError const &cause);
  static ParseError duplicate_flag(string const &name, string const &option);
  static ParseError missing_required(vector<string> names, string const &prefix);
  static ParseError help_requested(string const &option);
};

/**
 * \brief Raised by \ref ParseResult::get
 **/
class RetrievalError : public Error {
public:
  using Error::Error;

  static RetrievalError unknown_flag_name(string const &name);
  static RetrievalError type_mismatch(string const &name, FlagKind requested, FlagKind stored);
};

} // namespace typedflags

#endif /* HEADER GUARD */
