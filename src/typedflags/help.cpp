#include "./program.hpp"
#include "./program_impl.hpp"
#include "./util.hpp"

#include <algorithm>
#include <sstream>

namespace typedflags {

namespace {

/* Greedy word wrap; any run of whitespace separates words.  A word longer than width gets a line of its own. */
vector<string> wrap_words(string const &text, size_t width) {
  vector<string> lines;
  std::istringstream words(text);
  string word, line;
  while (words >> word) {
    if (!line.empty() && line.size() + 1 + word.size() > width) {
      lines.push_back(line);
      line.clear();
    }
    if (!line.empty())
      line += ' ';
    line += word;
  }
  if (!line.empty())
    lines.push_back(line);
  return lines;
}

string format_invocation(string const &prefix, FlagSpec const &spec) {
  string x = prefix + spec.name;
  if (!spec.is_switch()) {
    x += " <";
    x += kind_name(spec.kind);
    x += '>';
  }
  return x;
}

string format_entry_help(FlagSpec const &spec) {
  string marker;
  if (spec.required)
    marker = "(required)";
  else if (spec.is_switch())
    marker = "(switch)";
  else
    marker = "(default: " + format(*spec.default_value) + ")";

  if (spec.description.empty())
    return marker;
  return spec.description + " " + marker;
}

struct HelpEntry {
  string invocation;
  string help;
};

vector<HelpEntry> get_help_entries(Program::Impl const &impl) {
  vector<HelpEntry> entries;
  if (impl.help)
    entries.push_back({impl.prefix + "help", *impl.help});
  for (auto const &spec : impl.flags)
    entries.push_back({format_invocation(impl.prefix, spec), format_entry_help(spec)});
  return entries;
}

vector<string> get_usage_parts(Program::Impl const &impl) {
  vector<string> parts;
  if (impl.help)
    parts.push_back("[" + impl.prefix + "help]");
  for (auto const &spec : impl.flags) {
    auto part = format_invocation(impl.prefix, spec);
    if (!spec.required)
      part = '[' + part + ']';
    parts.push_back(std::move(part));
  }
  return parts;
}

/**
 * Renders the blocks of a help message.  Each block is either empty or a sequence of complete lines; the
 * message is the non-empty blocks separated by blank lines.
 **/
class HelpFormatter : public HelpFormatterParameters {
public:
  HelpFormatter(HelpFormatterParameters p)
    : HelpFormatterParameters(std::move(p))
  {
    if (width <= 0)
      width = 80;
    max_help_position = std::min(max_help_position, std::max(width - 20, indent_increment * 2));
  }

  // Parts are placed on one line while they fit; continuation lines are aligned after the program name
  string usage(vector<string> const &parts) const {
    if (prog.empty())
      return {};

    std::ostringstream os;
    string lead = "usage: " + prog;
    string line = lead;
    bool line_has_part = false;
    for (auto const &part : parts) {
      if (line_has_part && line.size() + 1 + part.size() > size_t(width)) {
        os << line << '\n';
        line.assign(lead.size(), ' ');
      }
      line += ' ';
      line += part;
      line_has_part = true;
    }
    os << line << '\n';
    return os.str();
  }

  string paragraph(string const &text) const {
    string out;
    for (auto const &line : wrap_words(text, size_t(std::max(width, min_text_width)))) {
      out += line;
      out += '\n';
    }
    return out;
  }

  /**
   * Help text starts in a common column after the longest invocation, but no further right than
   * max_help_position; invocations that reach past that column put their help on the following lines.
   **/
  string flag_list(vector<HelpEntry> const &entries) const {
    string const indent(size_t(indent_increment), ' ');
    string out = "flags:\n";
    if (entries.empty())
      return out + indent + "(no flags)\n";

    size_t longest = 0;
    for (auto const &entry : entries)
      longest = std::max(longest, entry.invocation.size());
    size_t help_column = std::min(longest + size_t(indent_increment) + 2, size_t(max_help_position));
    size_t help_width = size_t(std::max(width - int(help_column), min_text_width));

    for (auto const &entry : entries) {
      string line = indent + entry.invocation;
      auto help_lines = wrap_words(entry.help, help_width);
      bool first_on_same_line = line.size() + 2 <= help_column;
      if (help_lines.empty() || !first_on_same_line) {
        out += line;
        out += '\n';
        line.clear();
      }
      for (auto const &help_line : help_lines) {
        line.resize(help_column, ' ');
        out += line + help_line + '\n';
        line.clear();
      }
    }
    return out;
  }

  static string join_blocks(std::initializer_list<string> blocks) {
    vector<string> non_empty;
    for (auto const &block : blocks) {
      if (!block.empty())
        non_empty.push_back(block);
    }
    return util::join("\n", non_empty);
  }
};

HelpFormatterParameters with_default_prog(HelpFormatterParameters params, string const &prog) {
  if (params.prog.empty())
    params.prog = prog;
  return params;
}

} // namespace

string Program::help_string(HelpFormatterParameters const &params) const {
  HelpFormatter formatter(with_default_prog(params, impl->prog));
  return HelpFormatter::join_blocks({
    formatter.usage(get_usage_parts(*impl)),
    formatter.paragraph(impl->description),
    formatter.flag_list(get_help_entries(*impl)),
    formatter.paragraph(impl->epilog),
  });
}

string Program::usage_string(HelpFormatterParameters const &params) const {
  HelpFormatter formatter(with_default_prog(params, impl->prog));
  return formatter.usage(get_usage_parts(*impl));
}

} // namespace typedflags
