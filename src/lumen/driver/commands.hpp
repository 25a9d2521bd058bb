#pragma once

#include <argparse/argparse.hpp>

namespace lumen::driver {

// Flags shared by every subcommand (--config, -v, --dump-ir, --fast-math,
// --target).
void AddCommonFlags(argparse::ArgumentParser& cmd);

auto SymbolsCommand(const argparse::ArgumentParser& cmd) -> int;
auto EvalCommand(const argparse::ArgumentParser& cmd) -> int;
auto EmitCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace lumen::driver
