#include "lumen/config/project_config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "lumen/common/diagnostic.hpp"
#include "lumen/common/opt_level.hpp"
#include "lumen/fixed/q32.hpp"
#include "lumen/llvm_backend/context.hpp"
#include "lumen/target/target_descriptor.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace lumen::config {

namespace fs = std::filesystem;

namespace {

constexpr int64_t kMaxOptLevel = 3;

auto Invalid(std::string_view source, std::string_view key, std::string msg)
    -> Diagnostic {
  return Diagnostic::HostError(
      fmt::format("{}: invalid '{}': {}", source, key, msg));
}

auto IsKnownLogLevel(std::string_view level) -> bool {
  return level == "trace" || level == "debug" || level == "info" ||
         level == "warn" || level == "error" || level == "off";
}

auto FromTable(const toml::table& tbl, std::string_view source)
    -> Result<ProjectConfig> {
  ProjectConfig config;

  // [target] section
  if (auto target_section = tbl["target"]) {
    if (auto isa_node = target_section["isa"]) {
      auto isa = isa_node.value<std::string>();
      if (!isa) {
        return std::unexpected(
            Invalid(source, "target.isa", "expected a string"));
      }
      config.isa = *isa;
    }
    if (auto pic_node = target_section["pic"]) {
      auto pic = pic_node.value<bool>();
      if (!pic) {
        return std::unexpected(
            Invalid(source, "target.pic", "expected a boolean"));
      }
      config.pic = *pic;
    }
  }

  // [transform] section
  if (auto transform = tbl["transform"]) {
    if (auto fast_node = transform["fast_math"]) {
      auto fast = fast_node.value<bool>();
      if (!fast) {
        return std::unexpected(
            Invalid(source, "transform.fast_math", "expected a boolean"));
      }
      config.fast_math = *fast;
    }
    if (auto opt_node = transform["opt_level"]) {
      auto level = opt_node.value<int64_t>();
      if (!level || *level < 0 || *level > kMaxOptLevel) {
        return std::unexpected(Invalid(
            source, "transform.opt_level", "expected an integer in 0..3"));
      }
      config.opt_level = static_cast<OptLevel>(*level);
    }
  }

  // [log] section
  if (auto log = tbl["log"]) {
    if (auto level_node = log["level"]) {
      auto level = level_node.value<std::string>();
      if (!level || !IsKnownLogLevel(*level)) {
        return std::unexpected(Invalid(
            source, "log.level",
            "expected one of trace, debug, info, warn, error, off"));
      }
      config.log_level = *level;
    }
  }

  // Reject bad ISA strings at load time rather than at first compile.
  if (auto resolved = ResolveTarget(config); !resolved) {
    return std::unexpected(std::move(resolved).error().WithNote(
        fmt::format("while reading '{}'", source)));
  }
  return config;
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / "lumen.toml";
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  std::ifstream in(config_path);
  if (!in) {
    return std::unexpected(Diagnostic::HostError(
        fmt::format("cannot open '{}'", config_path.string())));
  }
  std::stringstream contents;
  contents << in.rdbuf();

  auto config = ParseConfig(contents.str(), config_path.string());
  if (config) {
    config->root_dir = config_path.parent_path();
  }
  return config;
}

auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<ProjectConfig> {
  toml::table tbl;
  try {
    tbl = toml::parse(text, source_name);
  } catch (const toml::parse_error& e) {
    return std::unexpected(Diagnostic::HostError(fmt::format(
        "failed to parse {}: {}", source_name, e.description())));
  }
  return FromTable(tbl, source_name);
}

auto ResolveTarget(const ProjectConfig& config)
    -> Result<target::TargetDescriptor> {
  auto descriptor = target::TargetDescriptor::Parse(config.isa);
  if (!descriptor) {
    return descriptor;
  }
  if (config.pic.has_value() &&
      descriptor->Kind() == target::TargetKind::kEmbeddedIsa) {
    return descriptor->WithPositionIndependence(*config.pic);
  }
  return descriptor;
}

auto ToCompileOptions(const ProjectConfig& config)
    -> llvm_backend::CompileOptions {
  return llvm_backend::CompileOptions{
      .arith_mode = config.fast_math ? fixed::ArithMode::kFast
                                     : fixed::ArithMode::kPrecise,
      .opt_level = config.opt_level,
      .dump_ir = false,
  };
}

}  // namespace lumen::config
