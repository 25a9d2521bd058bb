#include <argparse/argparse.hpp>
#include <exception>
#include <iostream>

#include "commands.hpp"
#include "print.hpp"

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("lumen", "0.1.0");
  program.add_description(
      "Fixed-point code generator for LED controller shaders");

  // Subcommand: symbols
  argparse::ArgumentParser symbols_cmd("symbols");
  symbols_cmd.add_description(
      "List the builtin symbols an embedding application must supply");
  lumen::driver::AddCommonFlags(symbols_cmd);

  // Subcommand: eval
  argparse::ArgumentParser eval_cmd("eval");
  eval_cmd.add_description("JIT one builtin call on the host and print it");
  lumen::driver::AddCommonFlags(eval_cmd);
  eval_cmd.add_argument("builtin").help("Builtin name (sin, mul, ...)");
  eval_cmd.add_argument("args").remaining().help("Arguments");

  // Subcommand: emit
  argparse::ArgumentParser emit_cmd("emit");
  emit_cmd.add_description("Emit one builtin call as an embedded object");
  lumen::driver::AddCommonFlags(emit_cmd);
  emit_cmd.add_argument("-o").help("Output object file").metavar("file");
  emit_cmd.add_argument("builtin").help("Builtin name (sin, mul, ...)");

  program.add_subparser(symbols_cmd);
  program.add_subparser(eval_cmd);
  program.add_subparser(emit_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    lumen::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  if (program.is_subcommand_used("symbols")) {
    return lumen::driver::SymbolsCommand(symbols_cmd);
  }

  if (program.is_subcommand_used("eval")) {
    return lumen::driver::EvalCommand(eval_cmd);
  }

  if (program.is_subcommand_used("emit")) {
    return lumen::driver::EmitCommand(emit_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
