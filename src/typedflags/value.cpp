#include "./value.hpp"
#include "./error.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include <boost/lexical_cast.hpp>

namespace typedflags {

string repr(string_view s) {
  string x;
  x += '\'';
  for (char c : s) {
    switch (c) {
    case '\'':
      x += "\\'";
      break;
    case '\\':
      x += "\\\\";
      break;
    case '\n':
      x += "\\n";
      break;
    case '\t':
      x += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20) {
        static char const hex[] = "0123456789abcdef";
        x += "\\x";
        x += hex[(c >> 4) & 0xf];
        x += hex[c & 0xf];
      } else {
        x += c;
      }
    }
  }
  x += '\'';
  return x;
}

char const *kind_name(FlagKind kind) {
  switch (kind) {
  case FlagKind::BOOL:   return "bool";
  case FlagKind::INT8:   return "int8";
  case FlagKind::INT16:  return "int16";
  case FlagKind::INT32:  return "int32";
  case FlagKind::INT64:  return "int64";
  case FlagKind::UINT8:  return "uint8";
  case FlagKind::UINT16: return "uint16";
  case FlagKind::UINT32: return "uint32";
  case FlagKind::UINT64: return "uint64";
  case FlagKind::FLOAT:  return "float";
  case FlagKind::DOUBLE: return "double";
  case FlagKind::STRING: return "string";
  }
  throw std::logic_error("Invalid flag kind encountered");
}

FlagKind kind_of(FlagValue const &value) {
  return FlagKind(value.which());
}

namespace {

template <class T>
T parse_integer(FlagKind kind, string_view s) {
  using limits = std::numeric_limits<T>;
  // Read through the widest type of the same signedness so that 8-bit types are not read as characters
  using Wide = std::conditional_t<limits::is_signed, std::int64_t, std::uint64_t>;

  if (s.empty())
    throw CoercionError(kind, s);

  // boost::lexical_cast accepts "-1" for unsigned targets and wraps it around
  if (!limits::is_signed && s[0] == '-')
    throw CoercionError(kind, s);

  Wide wide;
  try {
    wide = boost::lexical_cast<Wide>(s.data(), s.size());
  } catch (boost::bad_lexical_cast &) {
    throw CoercionError(kind, s);
  }

  if (wide < static_cast<Wide>(limits::min()) || wide > static_cast<Wide>(limits::max()))
    throw CoercionError(kind, s);
  return static_cast<T>(wide);
}

template <class T>
T parse_floating(FlagKind kind, string_view s) {
  if (s.empty())
    throw CoercionError(kind, s);
  try {
    return boost::lexical_cast<T>(s.data(), s.size());
  } catch (boost::bad_lexical_cast &) {
    throw CoercionError(kind, s);
  }
}

bool parse_bool(string_view s) {
  if (s == "true")
    return true;
  if (s == "false")
    return false;
  throw CoercionError(FlagKind::BOOL, s);
}

struct FormatVisitor : public boost::static_visitor<string> {
  string operator()(bool value) const { return value ? "true" : "false"; }

  // Promote so that 8-bit values are printed as numbers
  string operator()(std::int8_t value) const { return boost::lexical_cast<string>(int(value)); }
  string operator()(std::uint8_t value) const { return boost::lexical_cast<string>(unsigned(value)); }

  template <class T>
  std::enable_if_t<std::is_integral<T>::value, string> operator()(T value) const {
    return boost::lexical_cast<string>(value);
  }

  template <class T>
  std::enable_if_t<std::is_floating_point<T>::value, string> operator()(T value) const {
    std::ostringstream ostr;
    ostr.precision(std::numeric_limits<T>::digits10);
    ostr << value;
    return ostr.str();
  }

  string operator()(string const &value) const { return value; }
};

} // namespace

FlagValue parse_token(FlagKind kind, string_view text) {
  switch (kind) {
  case FlagKind::BOOL:   return parse_bool(text);
  case FlagKind::INT8:   return parse_integer<std::int8_t>(kind, text);
  case FlagKind::INT16:  return parse_integer<std::int16_t>(kind, text);
  case FlagKind::INT32:  return parse_integer<std::int32_t>(kind, text);
  case FlagKind::INT64:  return parse_integer<std::int64_t>(kind, text);
  case FlagKind::UINT8:  return parse_integer<std::uint8_t>(kind, text);
  case FlagKind::UINT16: return parse_integer<std::uint16_t>(kind, text);
  case FlagKind::UINT32: return parse_integer<std::uint32_t>(kind, text);
  case FlagKind::UINT64: return parse_integer<std::uint64_t>(kind, text);
  case FlagKind::FLOAT:  return parse_floating<float>(kind, text);
  case FlagKind::DOUBLE: return parse_floating<double>(kind, text);
  case FlagKind::STRING: return string(text);
  }
  throw std::logic_error("Invalid flag kind encountered");
}

string format(FlagValue const &value) {
  return boost::apply_visitor(FormatVisitor(), value);
}

} // namespace typedflags
