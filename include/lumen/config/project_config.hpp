#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "lumen/common/diagnostic.hpp"
#include "lumen/common/opt_level.hpp"
#include "lumen/llvm_backend/context.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::config {

struct ProjectConfig {
  // [target]
  std::string isa = "host";
  std::optional<bool> pic;  // Unset: embedded targets default to PIC

  // [transform]
  bool fast_math = false;
  OptLevel opt_level = OptLevel::kO2;

  // [log]
  std::string log_level = "info";

  // Directory where lumen.toml was found (empty for defaults)
  std::filesystem::path root_dir;
};

// Search for lumen.toml starting from dir, going up to parent dirs
// Returns nullopt if not found
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse lumen.toml. Unknown keys are ignored; malformed values are
// HostError diagnostics naming the file and key.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// Parse a configuration held in memory (source_name is used in messages).
auto ParseConfig(std::string_view text, std::string_view source_name)
    -> Result<ProjectConfig>;

// Target descriptor for [target], with pic applied when set.
auto ResolveTarget(const ProjectConfig& config)
    -> Result<target::TargetDescriptor>;

auto ToCompileOptions(const ProjectConfig& config)
    -> llvm_backend::CompileOptions;

}  // namespace lumen::config
