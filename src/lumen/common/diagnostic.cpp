#include "lumen/common/diagnostic.hpp"

#include <cstdio>
#include <string>
#include <string_view>

#include <fmt/color.h>
#include <fmt/core.h>

namespace lumen {

namespace {

auto GetKindString(DiagKind kind) -> std::string_view {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error";
    case DiagKind::kWarning:
      return "warning";
    case DiagKind::kNote:
      return "note";
  }
  return "unknown";
}

auto GetKindColor(DiagKind kind) -> fmt::terminal_color {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::terminal_color::bright_red;
    case DiagKind::kWarning:
      return fmt::terminal_color::bright_yellow;
    case DiagKind::kNote:
      return fmt::terminal_color::bright_black;
  }
  return fmt::terminal_color::white;
}

auto FormatContext(const DiagContext& ctx) -> std::string {
  std::string out;
  auto append = [&](std::string_view key, const std::string& value) {
    if (value.empty()) {
      return;
    }
    out += out.empty() ? " (" : ", ";
    out += fmt::format("{}: {}", key, value);
  };
  append("operation", ctx.operation);
  append("target", ctx.target);
  append("instruction", ctx.instruction);
  append("requires", ctx.required_extension);
  append("symbol", ctx.symbol);
  if (!out.empty()) {
    out += ")";
  }
  return out;
}

}  // namespace

auto ToString(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::kUnresolvedBuiltin:
      return "UnresolvedBuiltin";
    case ErrorCode::kUnsupportedInstruction:
      return "UnsupportedInstruction";
    case ErrorCode::kInvalidLValueAccess:
      return "InvalidLValueAccess";
    case ErrorCode::kUnlinkedExternalSymbol:
      return "UnlinkedExternalSymbol";
    case ErrorCode::kMalformedIr:
      return "MalformedIr";
    case ErrorCode::kHostError:
      return "HostError";
  }
  return "Unknown";
}

auto FormatDiagnostic(const Diagnostic& diag) -> std::string {
  std::string out = fmt::format(
      "{}[{}]: {}{}", GetKindString(diag.primary.kind), ToString(diag.code),
      diag.primary.message, FormatContext(diag.context));
  for (const auto& note : diag.notes) {
    out += fmt::format("\n  {}: {}", GetKindString(note.kind), note.message);
  }
  return out;
}

void PrintDiagnostic(const Diagnostic& diag, bool colors) {
  if (!colors) {
    fmt::print(stderr, "{}\n", FormatDiagnostic(diag));
    return;
  }

  auto header = fmt::format(
      "{}[{}]", GetKindString(diag.primary.kind), ToString(diag.code));
  fmt::print(
      stderr, "{}: {}{}\n",
      fmt::styled(
          header,
          fmt::fg(GetKindColor(diag.primary.kind)) | fmt::emphasis::bold),
      diag.primary.message, FormatContext(diag.context));
  for (const auto& note : diag.notes) {
    fmt::print(
        stderr, "  {}: {}\n",
        fmt::styled(GetKindString(note.kind), fmt::fg(GetKindColor(note.kind))),
        note.message);
  }
}

}  // namespace lumen
