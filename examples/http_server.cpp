// Command-line front end of a toy HTTP server.
//
// The library never prints or exits; this host turns parse errors into the usual
// "usage + prog: error: message" output and exit codes.

#include "typedflags/program.hpp"

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace {

struct Config {
  std::uint16_t port;
  std::string host;
  bool use_tls;
  double timeout;
  bool verbose;
};

[[noreturn]] void handle(typedflags::Program const &program, typedflags::ParseError const &e) {
  if (e.kind() == typedflags::ErrorKind::HELP_REQUESTED) {
    std::cout << program.help_string();
    std::exit(0);
  }
  std::cerr << program.usage_string();
  std::cerr << program.prog() << ": error: " << e.what() << std::endl;
  std::exit(1);
}

} // namespace

int main(int argc, char **argv) {
  auto program = typedflags::ProgramBuilder("An HTTP server")
                     .prog(argc > 0 ? argv[0] : "http_server")
                     .add_help_flag()
                     .with_required_flag<std::uint16_t>("port", "Port number")
                     .with_optional_flag<std::string>("host", "0.0.0.0", "Address to bind")
                     .with_optional_flag<bool>("use-tls", false, "TLS PLS?")
                     .with_optional_flag<double>("timeout", 30.0, "Request timeout in seconds")
                     .with_switch("verbose", "Log every request")
                     .epilog("Example: http_server --port 8080 --use-tls true")
                     .build();

  std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);

  Config config;
  try {
    auto result = program.parse(args);
    config.port = result.get<std::uint16_t>("port");
    config.host = result.get<std::string>("host");
    config.use_tls = result.get<bool>("use-tls");
    config.timeout = result.get<double>("timeout");
    config.verbose = result.get<bool>("verbose");
  } catch (typedflags::ParseError &e) {
    handle(program, e);
  }

  std::cout << (config.use_tls ? "https" : "http") << "://" << config.host << ':' << config.port
            << " (timeout " << config.timeout << "s" << (config.verbose ? ", verbose" : "") << ")\n";
  return 0;
}
