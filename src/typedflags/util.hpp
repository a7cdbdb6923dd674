#ifndef HEADER_GUARD_b910422fd6d6aee4e42732e9c40c383a
#define HEADER_GUARD_b910422fd6d6aee4e42732e9c40c383a

// Internal helpers shared by the implementation files; not installed.

#include <algorithm>
#include <cstring>
#include <ostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include <experimental/string_view>

namespace typedflags {
namespace util {

using std::string;
using std::vector;
using std::experimental::string_view;

inline bool starts_with(string_view s, string_view prefix) {
  return s.size() >= prefix.size() && std::memcmp(s.data(), prefix.data(), prefix.size()) == 0;
}

struct identity {
  template <class T>
  T &&operator()(T &&x) const { return std::forward<T>(x); }
};

template <class Range, class Transform = identity>
void join(std::ostream &os, string_view sep, Range const &args, Transform &&t = {}) {
  bool first = true;
  for (auto const &x : args) {
    if (!first)
      os << sep;
    first = false;
    os << t(x);
  }
}

template <class Range, class Transform = identity>
string join(string_view sep, Range const &args, Transform &&t = {}) {
  std::ostringstream ostr;
  join(ostr, sep, args, std::forward<Transform>(t));
  return ostr.str();
}

inline std::size_t edit_distance(string_view a, string_view b) {
  vector<std::size_t> prev(b.size() + 1), cur(b.size() + 1);
  for (std::size_t j = 0; j <= b.size(); ++j)
    prev[j] = j;
  for (std::size_t i = 1; i <= a.size(); ++i) {
    cur[0] = i;
    for (std::size_t j = 1; j <= b.size(); ++j) {
      std::size_t cost = a[i - 1] == b[j - 1] ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    prev.swap(cur);
  }
  return prev[b.size()];
}

/**
 * Returns the candidates within an edit distance of 2 from \p input, closest first.
 **/
inline vector<string> suggest(string_view input, vector<string> const &candidates, std::size_t max_results = 3) {
  vector<std::pair<std::size_t, string>> scored;
  for (auto const &c : candidates) {
    auto d = edit_distance(input, c);
    if (d <= 2)
      scored.emplace_back(d, c);
  }
  std::sort(scored.begin(), scored.end());

  vector<string> result;
  for (auto const &s : scored) {
    if (result.size() == max_results)
      break;
    result.push_back(s.second);
  }
  return result;
}

} // namespace util
} // namespace typedflags

#endif /* HEADER GUARD */
