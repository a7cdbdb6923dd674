#include "typedflags/program.hpp"

#include <algorithm>
#include <cstdint>
#include <string>

#include <gtest/gtest.h>

namespace typedflags {

namespace {

::testing::AssertionResult check_help_eq(string const &expected, string const &actual) {
  if (expected == actual)
    return ::testing::AssertionSuccess();
  size_t mismatch_pos = std::mismatch(expected.begin(), expected.end(), actual.begin(), actual.end()).first - expected.begin();
  ::testing::AssertionResult msg = ::testing::AssertionFailure();
  msg << "Mismatch starts at position " << mismatch_pos << '\n';
  msg << "expected: " << ::testing::PrintToString(expected.substr(mismatch_pos)) << '\n';
  msg << "actual:   " << ::testing::PrintToString(actual.substr(mismatch_pos)) << '\n';
  return msg;
}

#define ASSERT_HELP_EQ(expected, actual) \
  ASSERT_TRUE(check_help_eq(expected, actual)) \
  /**/

Program http_server() {
  return ProgramBuilder("An HTTP server")
      .prog("server")
      .with_required_flag<std::uint16_t>("port", "Port number")
      .with_optional_flag<bool>("use-tls", false, "TLS PLS?")
      .build();
}

TEST(HelpTest, RequiredAndOptionalFlags) {
  ASSERT_HELP_EQ("usage: server --port <uint16> [--use-tls <bool>]\n"
                 "\n"
                 "An HTTP server\n"
                 "\n"
                 "flags:\n"
                 "  --port <uint16>   Port number (required)\n"
                 "  --use-tls <bool>  TLS PLS? (default: false)\n",
                 http_server().help_string());
}

TEST(HelpTest, ProgNameFromParameters) {
  HelpFormatterParameters params;
  params.prog = "srv";
  ASSERT_HELP_EQ("usage: srv --port <uint16> [--use-tls <bool>]\n", http_server().usage_string(params));
}

TEST(HelpTest, EmptyProgram) {
  auto program = ProgramBuilder("A boring tool that does nothing").build();
  ASSERT_HELP_EQ("A boring tool that does nothing\n"
                 "\n"
                 "flags:\n"
                 "  (no flags)\n",
                 program.help_string());
  EXPECT_EQ("", program.usage_string());
}

TEST(HelpTest, HelpFlagSwitchesAndEpilog) {
  auto program = ProgramBuilder("Bunny observer")
                     .prog("bunny")
                     .add_help_flag()
                     .with_required_flag<std::string>("rabbit-name", "Name of the rabbit to observe")
                     .with_optional_flag<bool>("closing-pats", true, "Pat the rabbit when finished?")
                     .with_switch("verbose", "Chatty output")
                     .epilog("Be gentle.")
                     .build();
  ASSERT_HELP_EQ("usage: bunny [--help] --rabbit-name <string> [--closing-pats <bool>] [--verbose]\n"
                 "\n"
                 "Bunny observer\n"
                 "\n"
                 "flags:\n"
                 "  --help                show this help message and exit\n"
                 "  --rabbit-name <string>\n"
                 "                        Name of the rabbit to observe (required)\n"
                 "  --closing-pats <bool>\n"
                 "                        Pat the rabbit when finished? (default: true)\n"
                 "  --verbose             Chatty output (switch)\n"
                 "\n"
                 "Be gentle.\n",
                 program.help_string());
}

TEST(HelpTest, WrapsToWidth) {
  auto program = ProgramBuilder("one two three four five six seven eight nine ten eleven")
                     .with_required_flag<std::int32_t>("count", "How many times to repeat the greeting before giving up")
                     .build();
  ASSERT_HELP_EQ("one two three four five six seven eight\n"
                 "nine ten eleven\n"
                 "\n"
                 "flags:\n"
                 "  --count <int32>  How many times to\n"
                 "                   repeat the greeting\n"
                 "                   before giving up\n"
                 "                   (required)\n",
                 program.help_string(40));
}

TEST(HelpTest, WhitespaceRunsAndLongWords) {
  auto program = ProgramBuilder("first\n\tsecond   third  ")
                     .with_required_flag<std::string>("path", "averyveryverylongwordthatdoesnotfit short")
                     .build();
  ASSERT_HELP_EQ("first second third\n"
                 "\n"
                 "flags:\n"
                 "  --path <string>\n"
                 "    averyveryverylongwordthatdoesnotfit\n"
                 "    short (required)\n",
                 program.help_string(20));
}

TEST(HelpTest, WhitespaceOnlyTextIsOmitted) {
  auto program = ProgramBuilder(" \n ").prog("quiet").epilog("\t").build();
  ASSERT_HELP_EQ("usage: quiet\n"
                 "\n"
                 "flags:\n"
                 "  (no flags)\n",
                 program.help_string());
}

TEST(HelpTest, WrapsUsage) {
  auto program = ProgramBuilder()
                     .prog("compress")
                     .with_required_flag<std::string>("input", "")
                     .with_required_flag<std::string>("output", "")
                     .with_optional_flag<std::uint8_t>("level", 6, "")
                     .with_optional_flag<std::uint32_t>("threads", 1, "")
                     .with_switch("dry-run", "")
                     .build();
  ASSERT_HELP_EQ("usage: compress --input <string> --output <string>\n"
                 "                [--level <uint8>]\n"
                 "                [--threads <uint32>] [--dry-run]\n",
                 program.usage_string(50));
}

TEST(HelpTest, EntriesWithoutDescription) {
  auto program = ProgramBuilder()
                     .with_optional_flag<double>("ratio", 0.5, "")
                     .with_optional_flag<std::string>("name", "", "")
                     .build();
  ASSERT_HELP_EQ("flags:\n"
                 "  --ratio <double>  (default: 0.5)\n"
                 "  --name <string>   (default: )\n",
                 program.help_string());
}

TEST(HelpTest, CustomPrefix) {
  auto program = ProgramBuilder("Windows style")
                     .prog("tool")
                     .prefix("/")
                     .add_help_flag("show help")
                     .with_required_flag<std::int32_t>("n", "Count")
                     .build();
  ASSERT_HELP_EQ("usage: tool [/help] /n <int32>\n"
                 "\n"
                 "Windows style\n"
                 "\n"
                 "flags:\n"
                 "  /help       show help\n"
                 "  /n <int32>  Count (required)\n",
                 program.help_string());
}

TEST(HelpTest, GenerationIsPure) {
  auto program = http_server();
  auto first = program.help_string();
  program.parse({"--port", "1"});
  EXPECT_EQ(first, program.help_string());
}

} // anon namespace

} // namespace typedflags

int main(int argc, char **argv) {
  testing::InitGoogleTest(&argc, argv);

  return RUN_ALL_TESTS();
}
