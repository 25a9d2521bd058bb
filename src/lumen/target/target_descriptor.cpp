#include "lumen/target/target_descriptor.hpp"

#include <cstddef>
#include <expected>
#include <iterator>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "lumen/common/diagnostic.hpp"
#include "lumen/common/internal_error.hpp"

namespace lumen::target {

namespace {

constexpr std::string_view kEmbeddedBase = "rv32i";
constexpr unsigned kEmbeddedPointerWidth = 32;
constexpr unsigned kEmbeddedMaxIntegerWidth = 64;
constexpr unsigned kHostMaxIntegerWidth = 128;

}  // namespace

auto ExtensionLetter(Extension ext) -> std::string_view {
  switch (ext) {
    case Extension::kMultiplyDivide:
      return "m";
    case Extension::kAtomics:
      return "a";
    case Extension::kCompressed:
      return "c";
    case Extension::kSingleFloat:
      return "f";
    case Extension::kDoubleFloat:
      return "d";
  }
  throw common::InternalError("ExtensionLetter", "unknown extension");
}

auto ToString(TargetKind kind) -> std::string_view {
  switch (kind) {
    case TargetKind::kHostExecution:
      return "host-execution";
    case TargetKind::kEmbeddedIsa:
      return "embedded-isa";
  }
  return "unknown";
}

auto ToString(TargetMode mode) -> std::string_view {
  switch (mode) {
    case TargetMode::kHosted:
      return "hosted";
    case TargetMode::kFreestanding:
      return "freestanding";
  }
  return "unknown";
}

auto TargetDescriptor::Host() -> TargetDescriptor {
  return TargetDescriptor(
      TargetKind::kHostExecution, ExtensionSet::All(), false);
}

auto TargetDescriptor::Embedded(
    ExtensionSet extensions, bool position_independent) -> TargetDescriptor {
  return TargetDescriptor(
      TargetKind::kEmbeddedIsa, extensions, position_independent);
}

auto TargetDescriptor::DefaultEmbedded() -> TargetDescriptor {
  return Embedded(
      ExtensionSet{}
          .With(Extension::kMultiplyDivide)
          .With(Extension::kAtomics)
          .With(Extension::kCompressed),
      true);
}

auto TargetDescriptor::Parse(std::string_view isa) -> Result<TargetDescriptor> {
  if (isa == "host") {
    return Host();
  }
  if (!isa.starts_with(kEmbeddedBase)) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "unknown target '{}' (expected 'host' or 'rv32i...')", isa)));
  }

  // Extensions must appear at most once and in canonical order.
  ExtensionSet extensions;
  size_t next_allowed = 0;
  for (char letter : isa.substr(kEmbeddedBase.size())) {
    bool matched = false;
    for (size_t i = next_allowed; i < std::size(kAllExtensions); ++i) {
      if (ExtensionLetter(kAllExtensions[i]).front() == letter) {
        extensions = extensions.With(kAllExtensions[i]);
        next_allowed = i + 1;
        matched = true;
        break;
      }
    }
    if (!matched) {
      return std::unexpected(
          Diagnostic::HostError(
              fmt::format(
                  "invalid ISA string '{}': unexpected extension '{}'", isa,
                  letter))
              .WithNote("extensions are m, a, c, f, d in that order"));
    }
  }
  if (extensions.Has(Extension::kDoubleFloat) &&
      !extensions.Has(Extension::kSingleFloat)) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("invalid ISA string '{}': 'd' requires 'f'", isa)));
  }
  return Embedded(extensions, true);
}

auto TargetDescriptor::Mode() const -> TargetMode {
  return kind_ == TargetKind::kHostExecution ? TargetMode::kHosted
                                             : TargetMode::kFreestanding;
}

auto TargetDescriptor::HasWideMultiply() const -> bool {
  return kind_ == TargetKind::kHostExecution ||
         extensions_.Has(Extension::kMultiplyDivide);
}

auto TargetDescriptor::MaxIntegerWidth() const -> unsigned {
  return kind_ == TargetKind::kHostExecution ? kHostMaxIntegerWidth
                                             : kEmbeddedMaxIntegerWidth;
}

auto TargetDescriptor::PointerWidth() const -> unsigned {
  return kind_ == TargetKind::kHostExecution
             ? static_cast<unsigned>(sizeof(void*) * 8)
             : kEmbeddedPointerWidth;
}

auto TargetDescriptor::Name() const -> std::string {
  if (kind_ == TargetKind::kHostExecution) {
    return "host";
  }
  std::string name(kEmbeddedBase);
  for (Extension ext : kAllExtensions) {
    if (extensions_.Has(ext)) {
      name += ExtensionLetter(ext);
    }
  }
  return name;
}

auto TargetDescriptor::FeatureString() const -> std::string {
  if (kind_ == TargetKind::kHostExecution) {
    return "";
  }
  std::string features;
  for (Extension ext : kAllExtensions) {
    if (!features.empty()) {
      features += ',';
    }
    features += extensions_.Has(ext) ? '+' : '-';
    features += ExtensionLetter(ext);
  }
  return features;
}

auto TargetDescriptor::WithPositionIndependence(bool pic) const
    -> TargetDescriptor {
  return TargetDescriptor(kind_, extensions_, pic);
}

}  // namespace lumen::target
