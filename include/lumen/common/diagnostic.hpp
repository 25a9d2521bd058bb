#pragma once

#include <cstdint>
#include <exception>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace lumen {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Structural program/target mismatch
  kHostError,  // I/O, malformed external input
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Machine-readable classification of a compile or link failure.
enum class ErrorCode : uint8_t {
  kUnresolvedBuiltin,       // No registry entry for {op, arity, target mode}
  kUnsupportedInstruction,  // Validator rejection
  kInvalidLValueAccess,     // Offset outside the declared shape
  kUnlinkedExternalSymbol,  // External builtin used before being supplied
  kMalformedIr,             // Frontend handed over inconsistent IR
  kHostError,               // Config, I/O, LLVM target setup
};

auto ToString(ErrorCode code) -> std::string_view;

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Structured context carried alongside the message so callers can react
// without parsing text (e.g. enable the missing extension).
struct DiagContext {
  std::string operation;
  std::string target;
  std::string instruction;
  std::string required_extension;
  std::string symbol;

  auto operator==(const DiagContext&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  ErrorCode code;
  DiagItem primary;
  DiagContext context;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  // Factory: no registry entry (or no linkable symbol) for a builtin
  static auto UnresolvedBuiltin(
      std::string operation, std::string target, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .code = ErrorCode::kUnresolvedBuiltin,
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .context =
            {.operation = std::move(operation), .target = std::move(target)},
        .notes = {},
    };
  }

  // Factory: instruction the target cannot execute.
  // required_extension is empty when no extension would make it legal
  // (e.g. an operand wider than the target supports).
  static auto UnsupportedInstruction(
      std::string instruction, std::string required_extension,
      std::string target, std::string msg) -> Diagnostic {
    return Diagnostic{
        .code = ErrorCode::kUnsupportedInstruction,
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .context =
            {.target = std::move(target),
             .instruction = std::move(instruction),
             .required_extension = std::move(required_extension)},
        .notes = {},
    };
  }

  static auto InvalidLValueAccess(std::string msg) -> Diagnostic {
    return Diagnostic{
        .code = ErrorCode::kInvalidLValueAccess,
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .context = {},
        .notes = {},
    };
  }

  static auto UnlinkedExternalSymbol(std::string symbol, std::string msg)
      -> Diagnostic {
    return Diagnostic{
        .code = ErrorCode::kUnlinkedExternalSymbol,
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .context = {.symbol = std::move(symbol)},
        .notes = {},
    };
  }

  static auto MalformedIr(std::string msg) -> Diagnostic {
    return Diagnostic{
        .code = ErrorCode::kMalformedIr,
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .context = {},
        .notes = {},
    };
  }

  // Factory: host error (config files, LLVM target lookup, JIT setup)
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .code = ErrorCode::kHostError,
        .primary = {.kind = DiagKind::kHostError, .message = std::move(msg)},
        .context = {},
        .notes = {},
    };
  }

  // Attach the operation name after the fact (e.g. by the caller that
  // knows which IR instruction was being lowered).
  auto WithOperation(std::string operation) && -> Diagnostic {
    if (context.operation.empty()) {
      context.operation = std::move(operation);
    }
    return std::move(*this);
  }

  // Add a note
  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

class DiagnosticException : public std::exception {
 public:
  explicit DiagnosticException(Diagnostic diag) : diag_(std::move(diag)) {
  }

  [[nodiscard]] auto GetDiagnostic() const -> const Diagnostic& {
    return diag_;
  }
  [[nodiscard]] auto what() const noexcept -> const char* override {
    return diag_.primary.message.c_str();
  }

 private:
  Diagnostic diag_;
};

// Render "error[Code]: message" plus indented notes (no trailing newline).
auto FormatDiagnostic(const Diagnostic& diag) -> std::string;

// Print to stderr, optionally colored.
void PrintDiagnostic(const Diagnostic& diag, bool colors);

}  // namespace lumen
