#ifndef HEADER_GUARD_c763fe8d715c406d4e6d0b26447e9178
#define HEADER_GUARD_c763fe8d715c406d4e6d0b26447e9178

// Internal definition of the shared program state; not installed.

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "./program.hpp"

namespace typedflags {

struct Program::Impl {
  string prog;
  string description;
  string epilog;
  string prefix;

  // Description of the help flag, if enabled
  optional<string> help;

  vector<FlagSpec> flags;

  // Maps a flag name to its position in flags
  std::unordered_map<string, std::size_t> index;
};

} // namespace typedflags

#endif /* HEADER GUARD */
