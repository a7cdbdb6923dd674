#include "./program.hpp"
#include "./program_impl.hpp"
#include "./util.hpp"

#include <cctype>

namespace typedflags {

/**
 * Builder
 **/

ProgramBuilder::ProgramBuilder(string description)
  : description_(std::move(description))
{}

ProgramBuilder &ProgramBuilder::description(string s) {
  description_ = std::move(s);
  return *this;
}

ProgramBuilder &ProgramBuilder::prog(string s) {
  prog_ = std::move(s);
  return *this;
}

ProgramBuilder &ProgramBuilder::epilog(string s) {
  epilog_ = std::move(s);
  return *this;
}

ProgramBuilder &ProgramBuilder::prefix(string s) {
  if (s.empty())
    throw RegistrationError::invalid_prefix();
  for (auto const &flag : flags_) {
    if (util::starts_with(flag.name, s))
      throw RegistrationError::invalid_flag_name(flag.name, "must not start with the prefix " + repr(s));
  }
  prefix_ = std::move(s);
  return *this;
}

ProgramBuilder &ProgramBuilder::add_help_flag(string description) {
  for (auto const &flag : flags_) {
    if (flag.name == "help")
      throw RegistrationError::duplicate_flag(flag.name);
  }
  help_ = std::move(description);
  return *this;
}

ProgramBuilder &ProgramBuilder::with_optional_flag(string name, FlagKind kind, string_view default_text, string description) {
  check_name(name);

  FlagSpec spec;
  spec.kind = kind;
  try {
    spec.default_value = parse_token(kind, default_text);
  } catch (CoercionError &e) {
    throw RegistrationError::invalid_default(name, e.what());
  }
  spec.name = std::move(name);
  spec.description = std::move(description);
  add_flag(std::move(spec));
  return *this;
}

ProgramBuilder &ProgramBuilder::with_switch(string name, string description) {
  FlagSpec spec;
  spec.name = std::move(name);
  spec.kind = FlagKind::BOOL;
  spec.nargs = 0;
  spec.default_value = FlagValue(false);
  spec.description = std::move(description);
  add_flag(std::move(spec));
  return *this;
}

void ProgramBuilder::check_name(string const &name) const {
  if (name.empty())
    throw RegistrationError::invalid_flag_name(name, "must be non-empty");
  for (char c : name) {
    if (std::isspace(static_cast<unsigned char>(c)))
      throw RegistrationError::invalid_flag_name(name, "must not contain whitespace");
  }
  if (util::starts_with(name, prefix_))
    throw RegistrationError::invalid_flag_name(name, "must not start with the prefix " + repr(prefix_));

  if (help_ && name == "help")
    throw RegistrationError::duplicate_flag(name);
  for (auto const &flag : flags_) {
    if (flag.name == name)
      throw RegistrationError::duplicate_flag(name);
  }
}

void ProgramBuilder::add_flag(FlagSpec spec) {
  check_name(spec.name);

  if (spec.required == bool(spec.default_value))
    throw std::logic_error("flag " + repr(spec.name) + ": a default must be given if, and only if, the flag is optional");

  if (spec.default_value && kind_of(*spec.default_value) != spec.kind) {
    throw RegistrationError::invalid_default(spec.name,
                                             string("expected a ") + kind_name(spec.kind) + " value, got " +
                                             kind_name(kind_of(*spec.default_value)));
  }

  flags_.push_back(std::move(spec));
}

Program ProgramBuilder::build() const {
  auto impl = std::make_shared<Program::Impl>();
  impl->prog = prog_;
  impl->description = description_;
  impl->epilog = epilog_;
  impl->prefix = prefix_;
  impl->help = help_;
  impl->flags = flags_;
  for (std::size_t i = 0; i < impl->flags.size(); ++i)
    impl->index.emplace(impl->flags[i].name, i);
  return Program(std::move(impl));
}

/**
 * Program accessors
 **/

string const &Program::prog() const { return impl->prog; }
string const &Program::description() const { return impl->description; }
string const &Program::epilog() const { return impl->epilog; }
string const &Program::prefix() const { return impl->prefix; }
bool Program::has_help_flag() const { return bool(impl->help); }
vector<FlagSpec> const &Program::flags() const { return impl->flags; }

FlagSpec const *Program::find(string_view name) const {
  auto it = impl->index.find(string(name));
  if (it == impl->index.end())
    return nullptr;
  return &impl->flags[it->second];
}

/**
 * Parsing
 **/

FlagSpec const &Program::match(string_view token) const {
  if (!util::starts_with(token, impl->prefix))
    throw ParseError::unknown_flag(string(token));

  string_view name = token.substr(impl->prefix.size());
  if (impl->help && name == "help")
    throw ParseError::help_requested(string(token));

  if (auto spec = find(name))
    return *spec;

  vector<string> names;
  for (auto const &flag : impl->flags)
    names.push_back(flag.name);
  vector<string> suggestions;
  for (auto const &s : util::suggest(name, names))
    suggestions.push_back(impl->prefix + s);
  throw ParseError::unknown_flag(string(name), suggestions);
}

ParseResult Program::parse(vector<string_view> const &args) const {
  ParseResult::Values values;

  for (std::size_t i = 0; i < args.size(); ++i) {
    auto const &spec = match(args[i]);
    string option = impl->prefix + spec.name;

    FlagValue value = true;
    if (!spec.is_switch()) {
      if (i + 1 == args.size())
        throw ParseError::missing_value(spec.name, option);
      try {
        value = parse_token(spec.kind, args[++i]);
      } catch (CoercionError &e) {
        throw ParseError::invalid_value(spec.name, option, e);
      }
    }

    if (!values.emplace(spec.name, std::move(value)).second)
      throw ParseError::duplicate_flag(spec.name, option);
  }

  vector<string> missing;
  for (auto const &spec : impl->flags) {
    if (values.count(spec.name))
      continue;
    if (spec.required)
      missing.push_back(spec.name);
    else
      values.emplace(spec.name, *spec.default_value);
  }

  if (!missing.empty())
    throw ParseError::missing_required(std::move(missing), impl->prefix);

  return ParseResult(std::move(values));
}

ParseResult Program::parse(vector<string> const &args) const {
  vector<string_view> views;
  views.reserve(args.size());
  for (auto const &x : args)
    views.push_back(x);
  return parse(views);
}

/**
 * Result access
 **/

FlagValue const &ParseResult::at(string const &name) const {
  auto it = values_.find(name);
  if (it == values_.end())
    throw RetrievalError::unknown_flag_name(name);
  return it->second;
}

string ParseResult::text(string const &name) const {
  return format(at(name));
}

FlagKind ParseResult::kind(string const &name) const {
  return kind_of(at(name));
}

} // namespace typedflags
