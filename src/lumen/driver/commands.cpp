#include "commands.hpp"

#include <cstdint>
#include <exception>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "call_program.hpp"
#include "lumen/builtins/builtin_id.hpp"
#include "lumen/builtins/external_symbols.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"
#include "lumen/config/project_config.hpp"
#include "lumen/fixed/q32.hpp"
#include "lumen/llvm_backend/emit_object.hpp"
#include "lumen/llvm_backend/execution.hpp"
#include "lumen/llvm_backend/lower.hpp"
#include "lumen/target/target_descriptor.hpp"
#include "print.hpp"

namespace lumen::driver {

namespace {

namespace fs = std::filesystem;

struct Settings {
  config::ProjectConfig config;
  bool dump_ir = false;
};

// Each -v raises the log level one step above the configured one.
void ConfigureLogging(const std::string& configured, int verbosity) {
  auto level = spdlog::level::from_str(configured);
  for (int i = 0; i < verbosity && level > spdlog::level::trace; ++i) {
    level = static_cast<spdlog::level::level_enum>(level - 1);
  }
  spdlog::set_level(level);
  spdlog::set_pattern("[%l] %v");
}

auto LoadSettings(const argparse::ArgumentParser& cmd) -> Result<Settings> {
  Settings settings;
  std::optional<fs::path> config_path;
  if (auto explicit_path = cmd.present<std::string>("--config")) {
    config_path = fs::path(*explicit_path);
  } else {
    config_path = config::FindConfig();
  }
  if (config_path) {
    auto loaded = config::LoadConfig(*config_path);
    if (!loaded) {
      return std::unexpected(std::move(loaded).error());
    }
    settings.config = std::move(*loaded);
  }

  if (auto isa = cmd.present<std::string>("--target")) {
    settings.config.isa = *isa;
  }
  if (cmd.get<bool>("--fast-math")) {
    settings.config.fast_math = true;
  }
  settings.dump_ir = cmd.get<bool>("--dump-ir");
  ConfigureLogging(
      settings.config.log_level, static_cast<int>(cmd.get<bool>("-v")));
  if (config_path) {
    spdlog::debug("using config {}", config_path->string());
  }
  return settings;
}

auto FindBuiltinOrReport(const std::string& name)
    -> std::optional<builtins::BuiltinId> {
  auto id = builtins::FindBuiltinByName(name);
  if (!id) {
    PrintError(fmt::format("unknown builtin '{}'", name));
  }
  return id;
}

auto CompileCall(
    builtins::BuiltinId id, const target::TargetDescriptor& target,
    const Settings& settings) -> Result<llvm_backend::LoweringResult> {
  auto func = BuildCallFunction(id);
  if (!func) {
    return std::unexpected(std::move(func).error());
  }
  auto options = config::ToCompileOptions(settings.config);
  options.dump_ir = settings.dump_ir;
  return llvm_backend::LowerToLlvm(
      {std::move(*func)}, target, builtins::BuiltinRegistry::Default(),
      options);
}

// Arguments are real numbers except ldexp's exponent, which is an int.
auto EncodeArguments(
    builtins::BuiltinId id, const std::vector<std::string>& text)
    -> std::optional<std::vector<int32_t>> {
  std::vector<int32_t> args;
  for (size_t i = 0; i < text.size(); ++i) {
    try {
      if (id == builtins::BuiltinId::kLdexp && i == 1) {
        args.push_back(static_cast<int32_t>(std::stol(text[i])));
      } else {
        args.push_back(fixed::FromDouble(std::stod(text[i])));
      }
    } catch (const std::exception&) {
      PrintError(fmt::format("'{}' is not a number", text[i]));
      return std::nullopt;
    }
  }
  return args;
}

auto Invoke(void* address, const std::vector<int32_t>& args) -> int32_t {
  switch (args.size()) {
    case 1:
      return reinterpret_cast<int32_t (*)(int32_t)>(address)(args[0]);
    case 2:
      return reinterpret_cast<int32_t (*)(int32_t, int32_t)>(address)(
          args[0], args[1]);
    case 3:
      return reinterpret_cast<int32_t (*)(int32_t, int32_t, int32_t)>(
          address)(args[0], args[1], args[2]);
    default:
      break;
  }
  throw common::InternalError(
      "Invoke", fmt::format("no call shape for {} arguments", args.size()));
}

}  // namespace

void AddCommonFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--config").help("Path to lumen.toml").metavar("file");
  cmd.add_argument("-v", "--verbose")
      .default_value(false)
      .implicit_value(true)
      .help("Raise the log level");
  cmd.add_argument("--dump-ir")
      .default_value(false)
      .implicit_value(true)
      .help("Print LLVM IR to stderr");
  cmd.add_argument("--fast-math")
      .default_value(false)
      .implicit_value(true)
      .help("Wrapping add/sub instead of saturating");
  cmd.add_argument("--target")
      .help("host or rv32i[m][a][c][f][d] (overrides lumen.toml)")
      .metavar("isa");
}

auto SymbolsCommand(const argparse::ArgumentParser& cmd) -> int {
  auto settings = LoadSettings(cmd);
  if (!settings) {
    PrintDiagnostic(settings.error());
    return 1;
  }
  auto target = config::ResolveTarget(settings->config);
  if (!target) {
    PrintDiagnostic(target.error());
    return 1;
  }

  const auto& registry = builtins::BuiltinRegistry::Default();
  auto entries = registry.ExternalEntries(target->Mode());
  if (entries.empty()) {
    fmt::print(
        "{} binds every builtin locally; nothing to supply\n", target->Name());
    return 0;
  }
  for (const builtins::BuiltinEntry* entry : entries) {
    fmt::print(
        "{}/{}\n", builtins::SymbolOf(entry->impl),
        static_cast<int>(entry->arity));
  }
  return 0;
}

auto EvalCommand(const argparse::ArgumentParser& cmd) -> int {
  auto settings = LoadSettings(cmd);
  if (!settings) {
    PrintDiagnostic(settings.error());
    return 1;
  }
  auto id = FindBuiltinOrReport(cmd.get<std::string>("builtin"));
  if (!id) {
    return 1;
  }
  const auto& info = builtins::GetBuiltinInfo(*id);
  auto text = cmd.present<std::vector<std::string>>("args").value_or(
      std::vector<std::string>{});
  if (text.size() != info.arity) {
    PrintError(fmt::format(
        "'{}' takes {} argument(s), got {}", info.name, info.arity,
        text.size()));
    return 1;
  }
  auto args = EncodeArguments(*id, text);
  if (!args) {
    return 1;
  }

  if (settings->config.isa != "host") {
    PrintWarning(fmt::format(
        "eval runs in-process; ignoring target '{}'", settings->config.isa));
  }
  auto lowered = CompileCall(*id, target::TargetDescriptor::Host(), *settings);
  if (!lowered) {
    PrintDiagnostic(lowered.error());
    return 1;
  }
  auto session = llvm_backend::CompileJit(
      *lowered, builtins::BuiltinRegistry::Default(), nullptr,
      settings->config.opt_level);
  if (!session) {
    PrintDiagnostic(session.error());
    return 1;
  }
  auto address = session->Lookup(fmt::format("call_{}", info.name));
  if (!address) {
    PrintDiagnostic(address.error());
    return 1;
  }

  fixed::Fixed result = Invoke(*address, *args);
  fmt::print("{}\n", fixed::Describe(result));
  return 0;
}

auto EmitCommand(const argparse::ArgumentParser& cmd) -> int {
  auto settings = LoadSettings(cmd);
  if (!settings) {
    PrintDiagnostic(settings.error());
    return 1;
  }
  if (!cmd.is_used("--target") && settings->config.isa == "host") {
    settings->config.isa = target::TargetDescriptor::DefaultEmbedded().Name();
  }
  auto target = config::ResolveTarget(settings->config);
  if (!target) {
    PrintDiagnostic(target.error());
    return 1;
  }
  if (target->Kind() != target::TargetKind::kEmbeddedIsa) {
    PrintError("emit needs an embedded target (e.g. --target rv32imac)");
    return 1;
  }
  auto id = FindBuiltinOrReport(cmd.get<std::string>("builtin"));
  if (!id) {
    return 1;
  }

  auto lowered = CompileCall(*id, *target, *settings);
  if (!lowered) {
    PrintDiagnostic(lowered.error());
    return 1;
  }
  auto object = llvm_backend::EmitObject(*lowered, settings->config.opt_level);
  if (!object) {
    PrintDiagnostic(object.error());
    return 1;
  }

  auto output = cmd.present<std::string>("-o").value_or(
      fmt::format("{}.o", builtins::GetBuiltinInfo(*id).name));
  if (auto written = llvm_backend::WriteObjectFile(*object, output);
      !written) {
    PrintDiagnostic(written.error());
    return 1;
  }
  fmt::print(
      "wrote {} ({} bytes, {})\n", output, object->bytes.size(),
      target->Name());
  for (const std::string& symbol : object->undefined_symbols) {
    fmt::print("  needs {}\n", symbol);
  }

  // Nothing has been supplied yet, so this lists what the embedding
  // application must provide and rejects anything that is not a builtin.
  builtins::ExternalSymbolTable none;
  auto linked = llvm_backend::VerifyLinkedBuiltins(
      *object, builtins::BuiltinRegistry::Default(), target->Mode(), none);
  if (!linked &&
      linked.error().code != ErrorCode::kUnlinkedExternalSymbol) {
    PrintDiagnostic(linked.error());
    return 1;
  }
  return 0;
}

}  // namespace lumen::driver
