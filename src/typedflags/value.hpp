#ifndef HEADER_GUARD_848195f34d693edc27d98a1f3dca2061
#define HEADER_GUARD_848195f34d693edc27d98a1f3dca2061

#include <cstdint>
#include <string>
#include <experimental/string_view>

#include <boost/variant.hpp>

namespace typedflags {

using std::string;
using std::experimental::string_view;

/**
 * \brief Closed set of value types a flag may hold
 *
 * The enumerators are listed in the same order as the alternatives of \ref FlagValue, so that
 * <tt>FlagKind(value.which())</tt> is the kind of a value.
 **/
enum class FlagKind : int {
  BOOL,
  INT8,
  INT16,
  INT32,
  INT64,
  UINT8,
  UINT16,
  UINT32,
  UINT64,
  FLOAT,
  DOUBLE,
  STRING,
};

/**
 * \brief A typed flag value: the parsed value of a token, or the default of an optional flag.
 **/
using FlagValue = boost::variant<bool,
                                 std::int8_t,
                                 std::int16_t,
                                 std::int32_t,
                                 std::int64_t,
                                 std::uint8_t,
                                 std::uint16_t,
                                 std::uint32_t,
                                 std::uint64_t,
                                 float,
                                 double,
                                 string>;

/**
 * \brief Maps a C++ type to its \ref FlagKind and to the type stored in a \ref FlagValue
 *
 * Only the types listed below are valid flag types; any other type fails to compile.
 **/
template <class T>
struct FlagTraits;

#ifndef DOXYGEN
template <class T, FlagKind Kind>
struct FlagTraitsBase {
  using value_type = T;
  static constexpr FlagKind kind() { return Kind; }
};

template <> struct FlagTraits<bool> : FlagTraitsBase<bool, FlagKind::BOOL> {};
template <> struct FlagTraits<std::int8_t> : FlagTraitsBase<std::int8_t, FlagKind::INT8> {};
template <> struct FlagTraits<std::int16_t> : FlagTraitsBase<std::int16_t, FlagKind::INT16> {};
template <> struct FlagTraits<std::int32_t> : FlagTraitsBase<std::int32_t, FlagKind::INT32> {};
template <> struct FlagTraits<std::int64_t> : FlagTraitsBase<std::int64_t, FlagKind::INT64> {};
template <> struct FlagTraits<std::uint8_t> : FlagTraitsBase<std::uint8_t, FlagKind::UINT8> {};
template <> struct FlagTraits<std::uint16_t> : FlagTraitsBase<std::uint16_t, FlagKind::UINT16> {};
template <> struct FlagTraits<std::uint32_t> : FlagTraitsBase<std::uint32_t, FlagKind::UINT32> {};
template <> struct FlagTraits<std::uint64_t> : FlagTraitsBase<std::uint64_t, FlagKind::UINT64> {};
template <> struct FlagTraits<float> : FlagTraitsBase<float, FlagKind::FLOAT> {};
template <> struct FlagTraits<double> : FlagTraitsBase<double, FlagKind::DOUBLE> {};
template <> struct FlagTraits<string> : FlagTraitsBase<string, FlagKind::STRING> {};

// String literals are stored as std::string
template <>
struct FlagTraits<char const *> : FlagTraits<string> {};

template <>
struct FlagTraits<char *> : FlagTraits<string> {};
#endif

/**
 * \brief Returns the display name of \p kind, e.g. \p "uint16"
 **/
char const *kind_name(FlagKind kind);

/**
 * \brief Returns the kind of the alternative held by \p value
 **/
FlagKind kind_of(FlagValue const &value);

/**
 * \brief Converts a single token to a value of the specified kind
 *
 * Integers are read in base 10 and must fit the width of \p kind; unsigned kinds reject a leading minus sign.
 * Booleans accept exactly \p "true" and \p "false".  Strings accept any token.
 *
 * \throws CoercionError if \p text is not a valid representation of \p kind
 **/
FlagValue parse_token(FlagKind kind, string_view text);

/**
 * \brief Converts a single token to a value of type \p T
 * \throws CoercionError if \p text is not a valid representation of \p T
 **/
template <class T>
typename FlagTraits<T>::value_type parse_token(string_view text) {
  using Value = typename FlagTraits<T>::value_type;
  return boost::get<Value>(parse_token(FlagTraits<T>::kind(), text));
}

/**
 * \brief Renders \p value as text, in the form accepted by \ref parse_token
 **/
string format(FlagValue const &value);

template <class T>
string format(T const &value) {
  using Value = typename FlagTraits<T>::value_type;
  return format(FlagValue(Value(value)));
}

/**
 * Returns a representation of a string in string literal syntax
 **/
string repr(string_view s);

} // namespace typedflags

#endif /* HEADER GUARD */
