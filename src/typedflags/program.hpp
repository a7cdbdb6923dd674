#ifndef HEADER_GUARD_172a6b74da81537b72e833fab57972ab
#define HEADER_GUARD_172a6b74da81537b72e833fab57972ab

#include <cstddef>
#include <initializer_list>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <vector>
#include <experimental/optional>
#include <experimental/string_view>

#include <boost/numeric/conversion/cast.hpp>

#include "./error.hpp"
#include "./value.hpp"

namespace typedflags {

using std::experimental::optional;
using std::experimental::nullopt;
using std::shared_ptr;

namespace detail {

template <class Value, class U>
using is_numeric_default = std::integral_constant<bool,
                                                  std::is_arithmetic<Value>::value && !std::is_same<Value, bool>::value &&
                                                  std::is_arithmetic<U>::value && !std::is_same<U, bool>::value>;

// Numeric defaults are range-checked against the flag type rather than wrapped
template <class Value, class U>
std::enable_if_t<is_numeric_default<Value, U>::value, Value> convert_default(U value) {
  return boost::numeric_cast<Value>(value);
}

template <class Value, class U>
std::enable_if_t<!is_numeric_default<Value, U>::value, Value> convert_default(U value) {
  return Value(std::move(value));
}

} // namespace detail

/**
 * \class typedflags::ProgramBuilder
 **/
class ProgramBuilder;

/**
 * \class typedflags::Program
 **/
class Program;

/**
 * \brief Schema entry describing a single flag
 **/
struct FlagSpec {
  /**
   * \brief Name of the flag, without the prefix
   **/
  string name;

  FlagKind kind = FlagKind::STRING;

  /**
   * \brief Number of tokens consumed after the flag token.
   *
   * This is 0 for boolean switches, whose presence alone means \p true, and 1 for all other flags.
   **/
  std::size_t nargs = 1;

  bool required = false;

  /**
   * \brief Value used when the flag is not given.  Engaged if, and only if, the flag is optional.
   **/
  optional<FlagValue> default_value;

  string description;

  bool is_switch() const { return nargs == 0; }
};

/**
 * \brief Parameters controlling the layout of help and usage messages
 **/
struct HelpFormatterParameters {
  HelpFormatterParameters() = default;

  HelpFormatterParameters(int width) : width(width) {}

  /**
   * \brief Program name shown in the usage line.  Defaults to the name given to \ref ProgramBuilder::prog.
   **/
  string prog;

  /**
   * \brief Number of spaces by which flag entries are indented.
   **/
  int indent_increment = 2;

  /**
   * \brief Maximum column at which flag descriptions start.
   **/
  int max_help_position = 24;

  /**
   * \brief Total width of the output.  If 0, a width of 80 is used.
   **/
  int width = 80;

  /**
   * \brief Minimum width allotted to wrapped text.
   **/
  int min_text_width = 11;
};

/**
 * \brief Stores the command-line parsing result
 *
 * This maps the name of every flag registered with the \ref Program to its value: the parsed value if the flag was
 * given, and its default otherwise.
 **/
class ParseResult {
public:
  using Values = std::unordered_map<string, FlagValue>;

  /**
   * \brief Retrieves the value of the flag \p name, which must have been registered with type \p T
   * \throws RetrievalError with kind \ref ErrorKind::UNKNOWN_FLAG_NAME or \ref ErrorKind::TYPE_MISMATCH
   **/
  template <class T>
  typename FlagTraits<T>::value_type get(string const &name) const {
    using Value = typename FlagTraits<T>::value_type;
    auto const &value = at(name);
    if (auto p = boost::get<Value>(&value))
      return *p;
    throw RetrievalError::type_mismatch(name, FlagTraits<T>::kind(), kind_of(value));
  }

  /**
   * \brief Retrieves the value of the flag \p name, rendered as text
   * \throws RetrievalError with kind \ref ErrorKind::UNKNOWN_FLAG_NAME
   **/
  string text(string const &name) const;

  /**
   * \throws RetrievalError with kind \ref ErrorKind::UNKNOWN_FLAG_NAME
   **/
  FlagKind kind(string const &name) const;

  bool contains(string const &name) const { return values_.count(name) != 0; }

  std::size_t size() const { return values_.size(); }

  Values const &values() const { return values_; }

private:
  friend class Program;
  explicit ParseResult(Values values) : values_(std::move(values)) {}

  FlagValue const &at(string const &name) const;

  Values values_;
};

/**
 * \brief An immutable flag schema, ready for parsing
 *
 * Programs are created by \ref ProgramBuilder::build.  Copies share the same schema, and a program may be used to
 * parse from several threads at once.
 **/
class Program {
public:

  /**
   * \brief Parses \p args, which must not include the program name
   *
   * Every token must be a prefixed flag name.  Flags that take a value consume the following token, whatever it
   * looks like.  Flags that are not given receive their default; if any required flags are not given, all of them
   * are reported in a single error.
   *
   * \throws ParseError
   **/
  ParseResult parse(vector<string_view> const &args) const;

  ParseResult parse(vector<string> const &args) const;

  ParseResult parse(std::initializer_list<string_view> args) const {
    return parse(vector<string_view>(args));
  }

  /**
   * \brief Returns the complete help message
   **/
  string help_string(HelpFormatterParameters const &params = {}) const;

  /**
   * \brief Returns the usage line.  This is empty if no program name is known.
   **/
  string usage_string(HelpFormatterParameters const &params = {}) const;

  string const &prog() const;
  string const &description() const;
  string const &epilog() const;
  string const &prefix() const;
  bool has_help_flag() const;

  /**
   * \brief Registered flags, in registration order
   **/
  vector<FlagSpec> const &flags() const;

  /**
   * \returns The flag named \p name, or \p nullptr if there is none
   **/
  FlagSpec const *find(string_view name) const;

  struct Impl;

private:
  friend class ProgramBuilder;
  explicit Program(shared_ptr<Impl const> impl) : impl(std::move(impl)) {}

  FlagSpec const &match(string_view token) const;

  shared_ptr<Impl const> impl;
};

/**
 * \brief Accumulates flag registrations and produces a \ref Program
 *
 * Each registration is validated immediately and throws \ref RegistrationError if rejected, leaving the builder
 * unchanged.
 **/
class ProgramBuilder {
public:
  explicit ProgramBuilder(string description = {});

  ProgramBuilder &description(string s);

  /**
   * \brief Specify the program name shown in the usage line
   **/
  ProgramBuilder &prog(string s);

  /**
   * \brief Specify text shown after the flag list in the help message
   **/
  ProgramBuilder &epilog(string s);

  /**
   * \brief Specify the string that introduces a flag token.  Defaults to \p "--".
   * \throws RegistrationError if \p s is empty, or if an already registered flag name starts with \p s
   **/
  ProgramBuilder &prefix(string s);

  /**
   * \brief Reserve the flag \p help
   *
   * When given on the command line, \ref Program::parse throws \ref ParseError with kind
   * \ref ErrorKind::HELP_REQUESTED.  It is listed first in the help message.
   **/
  ProgramBuilder &add_help_flag(string description = "show this help message and exit");

  /**
   * \brief Register a flag that must be given, with a value of type \p T
   **/
  template <class T>
  ProgramBuilder &with_required_flag(string name, string description) {
    FlagSpec spec;
    spec.name = std::move(name);
    spec.kind = FlagTraits<T>::kind();
    spec.required = true;
    spec.description = std::move(description);
    add_flag(std::move(spec));
    return *this;
  }

  /**
   * \brief Register a flag that may be omitted, with a value of type \p T
   *
   * Boolean flags registered this way take an explicit \p true or \p false value; see \ref with_switch for a flag
   * that takes no value.
   *
   * \throws RegistrationError with kind \ref ErrorKind::INVALID_DEFAULT if a numeric \p default_value is out of
   *         the range of \p T
   **/
  template <class T, class U>
  ProgramBuilder &with_optional_flag(string name, U default_value, string description) {
    using Value = typename FlagTraits<T>::value_type;
    check_name(name);

    FlagSpec spec;
    spec.kind = FlagTraits<T>::kind();
    try {
      spec.default_value = FlagValue(detail::convert_default<Value>(std::move(default_value)));
    } catch (boost::numeric::bad_numeric_cast &) {
      throw RegistrationError::invalid_default(name, string("out of range for ") + kind_name(spec.kind));
    }
    spec.name = std::move(name);
    spec.description = std::move(description);
    add_flag(std::move(spec));
    return *this;
  }

  /**
   * \brief Register an optional flag of \p kind whose default is given as text
   * \throws RegistrationError with kind \ref ErrorKind::INVALID_DEFAULT if \p default_text does not convert to \p kind
   **/
  ProgramBuilder &with_optional_flag(string name, FlagKind kind, string_view default_text, string description);

  /**
   * \brief Register a boolean flag that takes no value: \p true if given, \p false otherwise
   **/
  ProgramBuilder &with_switch(string name, string description);

  Program build() const;

private:
  void check_name(string const &name) const;
  void add_flag(FlagSpec spec);

  string prog_;
  string description_;
  string epilog_;
  string prefix_ = "--";
  optional<string> help_;
  vector<FlagSpec> flags_;
};

} // namespace typedflags

#endif /* HEADER GUARD */
