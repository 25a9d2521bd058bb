#include "lumen/llvm_backend/isa_validator.hpp"

#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <llvm/ADT/SmallVector.h>
#include <llvm/ADT/StringRef.h>
#include <llvm/IR/Attributes.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/InstrTypes.h>
#include <llvm/IR/Instruction.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/IntrinsicInst.h>
#include <llvm/IR/Intrinsics.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Type.h>
#include <llvm/Support/raw_ostream.h>

#include "lumen/builtins/builtin_id.hpp"
#include "lumen/builtins/registry.hpp"
#include "lumen/common/diagnostic.hpp"
#include "lumen/target/target_descriptor.hpp"

namespace lumen::llvm_backend {

namespace {

using target::Extension;
using target::TargetDescriptor;

// level, module pointer and length, message pointer and length
constexpr size_t kHostLogArgCount = 5;

// One-line rendering of an instruction for diagnostics.
auto Render(const llvm::Instruction& inst) -> std::string {
  std::string text;
  llvm::raw_string_ostream os(text);
  inst.print(os);
  os.flush();
  auto first = text.find_first_not_of(' ');
  return first == std::string::npos ? text : text.substr(first);
}

auto Reject(
    const llvm::Instruction& inst, const TargetDescriptor& target,
    std::optional<Extension> required, std::string msg) -> Diagnostic {
  std::string ext =
      required ? std::string(target::ExtensionLetter(*required)) : "";
  return Diagnostic::UnsupportedInstruction(
             Render(inst), ext, target.Name(), std::move(msg))
      .WithNote(fmt::format(
          "in function '{}'", inst.getFunction()->getName().str()));
}

// False if the target cannot hold a value of this type. *missing is the
// extension that would make it legal, or nullopt if none would.
auto CheckType(
    llvm::Type* type, const TargetDescriptor& target,
    std::optional<Extension>* missing, std::string* reason) -> bool {
  if (auto* vec = llvm::dyn_cast<llvm::VectorType>(type)) {
    type = vec->getElementType();
  }
  if (auto* int_type = llvm::dyn_cast<llvm::IntegerType>(type)) {
    if (int_type->getBitWidth() > target.MaxIntegerWidth()) {
      *missing = std::nullopt;
      *reason = fmt::format(
          "i{} exceeds the widest integer {} supports (i{})",
          int_type->getBitWidth(), target.Name(), target.MaxIntegerWidth());
      return false;
    }
    return true;
  }
  if (type->isFloatTy()) {
    if (!target.Has(Extension::kSingleFloat)) {
      *missing = Extension::kSingleFloat;
      *reason = "single-precision floating point";
      return false;
    }
    return true;
  }
  if (type->isDoubleTy()) {
    if (!target.Has(Extension::kDoubleFloat)) {
      *missing = Extension::kDoubleFloat;
      *reason = "double-precision floating point";
      return false;
    }
    return true;
  }
  if (type->isFloatingPointTy() &&
      target.Kind() != target::TargetKind::kHostExecution) {
    *missing = std::nullopt;
    *reason = "floating-point format with no hardware support";
    return false;
  }
  return true;
}

auto IsAllowedIntrinsic(llvm::Intrinsic::ID id) -> bool {
  switch (id) {
    case llvm::Intrinsic::sadd_sat:
    case llvm::Intrinsic::ssub_sat:
    case llvm::Intrinsic::smin:
    case llvm::Intrinsic::smax:
    case llvm::Intrinsic::umin:
    case llvm::Intrinsic::umax:
    case llvm::Intrinsic::abs:
    case llvm::Intrinsic::fshl:
    case llvm::Intrinsic::fshr:
    case llvm::Intrinsic::ctlz:
    case llvm::Intrinsic::cttz:
    case llvm::Intrinsic::ctpop:
    case llvm::Intrinsic::bswap:
    case llvm::Intrinsic::assume:
    case llvm::Intrinsic::expect:
    case llvm::Intrinsic::experimental_noalias_scope_decl:
    case llvm::Intrinsic::lifetime_start:
    case llvm::Intrinsic::lifetime_end:
    case llvm::Intrinsic::dbg_declare:
    case llvm::Intrinsic::dbg_value:
    case llvm::Intrinsic::dbg_label:
      return true;
    default:
      return false;
  }
}

auto CheckCall(
    const llvm::CallBase& call, const TargetDescriptor& target,
    const builtins::BuiltinRegistry& registry) -> Result<void> {
  const llvm::Function* callee = call.getCalledFunction();
  if (callee == nullptr) {
    return std::unexpected(Reject(
        call, target, std::nullopt,
        "indirect calls are not produced by the code generator"));
  }
  if (callee->isIntrinsic()) {
    if (IsAllowedIntrinsic(callee->getIntrinsicID())) {
      return {};
    }
    return std::unexpected(Reject(
        call, target, std::nullopt,
        fmt::format(
            "intrinsic '{}' has no lowering on {}", callee->getName().str(),
            target.Name())));
  }
  if (!callee->isDeclaration()) {
    return {};
  }

  // A declared callee must be a builtin this target can bind.
  std::string_view symbol(callee->getName().data(), callee->getName().size());
  const auto* entry = registry.FindBySymbol(symbol, target.Mode());
  if (entry == nullptr) {
    return std::unexpected(
        Diagnostic::UnresolvedBuiltin(
            std::string(symbol), target.Name(),
            fmt::format(
                "call to '{}' which is not a {} builtin", symbol,
                target::ToString(target.Mode())))
            .WithNote(fmt::format(
                "in function '{}'", call.getFunction()->getName().str())));
  }
  size_t expected = entry->id == builtins::BuiltinId::kHostLog
                        ? kHostLogArgCount
                        : entry->arity;
  if (call.arg_size() != expected) {
    return std::unexpected(Reject(
        call, target, std::nullopt,
        fmt::format(
            "'{}' called with {} arguments, expected {}", symbol,
            call.arg_size(), expected)));
  }
  return {};
}

auto CheckFunctionFeatures(
    const llvm::Function& func, const TargetDescriptor& target)
    -> Result<void> {
  if (!func.hasFnAttribute("target-features")) {
    return {};
  }
  llvm::StringRef features =
      func.getFnAttribute("target-features").getValueAsString();
  llvm::SmallVector<llvm::StringRef, 8> parts;
  features.split(parts, ',', -1, false);
  for (llvm::StringRef part : parts) {
    if (!part.startswith("+")) {
      continue;
    }
    llvm::StringRef name = part.drop_front();
    for (Extension ext : target::kAllExtensions) {
      auto letter = target::ExtensionLetter(ext);
      if (name != llvm::StringRef(letter.data(), letter.size()) ||
          target.Has(ext)) {
        continue;
      }
      auto diag = Diagnostic::UnsupportedInstruction(
          fmt::format("function {} [{}]", func.getName().str(), part.str()),
          std::string(target::ExtensionLetter(ext)), target.Name(),
          fmt::format(
              "function '{}' requires the '{}' extension",
              func.getName().str(), target::ExtensionLetter(ext)));
      return std::unexpected(std::move(diag));
    }
  }
  return {};
}

auto CheckInstruction(
    const llvm::Instruction& inst, const TargetDescriptor& target,
    const builtins::BuiltinRegistry& registry) -> Result<void> {
  std::optional<Extension> missing;
  std::string reason;
  if (!CheckType(inst.getType(), target, &missing, &reason)) {
    return std::unexpected(Reject(inst, target, missing, reason));
  }
  for (const llvm::Use& use : inst.operands()) {
    if (!CheckType(use->getType(), target, &missing, &reason)) {
      return std::unexpected(Reject(inst, target, missing, reason));
    }
  }

  switch (inst.getOpcode()) {
    case llvm::Instruction::Mul:
    case llvm::Instruction::SDiv:
    case llvm::Instruction::UDiv:
    case llvm::Instruction::SRem:
    case llvm::Instruction::URem:
      if (!target.Has(Extension::kMultiplyDivide)) {
        return std::unexpected(Reject(
            inst, target, Extension::kMultiplyDivide,
            fmt::format(
                "{} needs the multiply/divide extension",
                inst.getOpcodeName())));
      }
      return {};
    case llvm::Instruction::AtomicRMW:
    case llvm::Instruction::AtomicCmpXchg:
    case llvm::Instruction::Fence:
      if (!target.Has(Extension::kAtomics)) {
        return std::unexpected(Reject(
            inst, target, Extension::kAtomics,
            fmt::format(
                "{} needs the atomics extension", inst.getOpcodeName())));
      }
      return {};
    case llvm::Instruction::Load:
      if (llvm::cast<llvm::LoadInst>(inst).isAtomic() &&
          !target.Has(Extension::kAtomics)) {
        return std::unexpected(Reject(
            inst, target, Extension::kAtomics,
            "atomic load needs the atomics extension"));
      }
      return {};
    case llvm::Instruction::Store:
      if (llvm::cast<llvm::StoreInst>(inst).isAtomic() &&
          !target.Has(Extension::kAtomics)) {
        return std::unexpected(Reject(
            inst, target, Extension::kAtomics,
            "atomic store needs the atomics extension"));
      }
      return {};
    case llvm::Instruction::Call:
    case llvm::Instruction::Invoke:
      return CheckCall(llvm::cast<llvm::CallBase>(inst), target, registry);
    default:
      return {};
  }
}

}  // namespace

auto ValidateFunction(
    const llvm::Function& func, const target::TargetDescriptor& target,
    const builtins::BuiltinRegistry& registry) -> Result<void> {
  if (auto r = CheckFunctionFeatures(func, target); !r) {
    return r;
  }
  std::optional<Extension> missing;
  std::string reason;
  for (const llvm::Argument& arg : func.args()) {
    if (!CheckType(arg.getType(), target, &missing, &reason)) {
      return std::unexpected(Diagnostic::UnsupportedInstruction(
          fmt::format(
              "argument {} of {}", arg.getArgNo(), func.getName().str()),
          missing ? std::string(target::ExtensionLetter(*missing)) : "",
          target.Name(), reason));
    }
  }
  for (const llvm::BasicBlock& block : func) {
    for (const llvm::Instruction& inst : block) {
      if (auto r = CheckInstruction(inst, target, registry); !r) {
        return r;
      }
    }
  }
  return {};
}

auto ValidateModule(
    const llvm::Module& module, const target::TargetDescriptor& target,
    const builtins::BuiltinRegistry& registry) -> Result<void> {
  for (const llvm::Function& func : module) {
    if (func.isDeclaration()) {
      continue;
    }
    if (auto r = ValidateFunction(func, target, registry); !r) {
      return r;
    }
  }
  return {};
}

}  // namespace lumen::llvm_backend
