#include <exception>
#include <iostream>
#include <string>

#include <args.hxx>
#include <redlog.hpp>

#include "g1dap/cli/verbosity.hpp"
#include "g1dap/util/env_config.hpp"

#include "commands/parse_mi.hpp"
#include "commands/serve.hpp"

namespace cli {
args::Group arguments("arguments");
args::HelpFlag help_flag(arguments, "help", "help", {'h', "help"});
args::CounterFlag verbosity_flag(arguments, "verbosity", "verbosity level", {'v'});

void apply_verbosity() { g1dap::cli::apply_verbosity(args::get(verbosity_flag), static_cast<bool>(verbosity_flag)); }
} // namespace cli

namespace {
auto log_main = redlog::get_logger("g1dap");
int g_exit_code = 0;
} // namespace

void cmd_serve(args::Subparser& parser) {
  cli::apply_verbosity();

  args::ValueFlag<std::string> debugger_flag(parser, "path", "debugger executable (default: gdb)", {'d', "debugger"});
  args::Flag trace_flag(parser, "trace", "log every request and engine event", {"trace"});
  parser.Parse();

  g1dap::util::env_config env("G1DAP");

  g1dap::commands::serve_options options;
  options.debugger_path = debugger_flag ? args::get(debugger_flag) : env.get<std::string>("DEBUGGER", "gdb");
  options.trace = trace_flag ? true : env.get<bool>("TRACE", false);

  if (options.debugger_path.empty()) {
    log_main.err("debugger path required");
    std::cerr << "error: --debugger must not be empty" << std::endl;
    g_exit_code = 1;
    return;
  }

  g_exit_code = g1dap::commands::serve(options);
}

void cmd_parse_mi(args::Subparser& parser) {
  cli::apply_verbosity();

  args::Positional<std::string> input_arg(parser, "file", "file of gdb/mi output lines (default: stdin)");
  parser.Parse();

  g1dap::commands::parse_mi_options options;
  options.input_path = input_arg ? args::get(input_arg) : "";

  g_exit_code = g1dap::commands::parse_mi(options);
}

int main(int argc, char* argv[]) {
  args::ArgumentParser parser("g1dap - debug adapter for gdb/mi", "bridges debug adapter protocol clients to gdb");
  parser.helpParams.showTerminator = false;

  args::GlobalOptions globals(parser, cli::arguments);
  args::Group commands(parser, "commands");

  args::Command serve_cmd(commands, "serve", "run a debug session over stdin/stdout", &cmd_serve);
  args::Command parse_mi_cmd(commands, "parse-mi", "decode gdb/mi output lines", &cmd_parse_mi);

  try {
    parser.ParseCLI(argc, argv);
  } catch (args::Help) {
    std::cout << parser;
    return 0;
  } catch (args::Error& e) {
    std::cerr << e.what() << std::endl << parser;
    return 1;
  } catch (const std::exception& e) {
    log_main.err("unhandled exception", redlog::field("what", e.what()));
    std::cerr << "error: " << e.what() << std::endl;
    return 1;
  }

  return g_exit_code;
}
