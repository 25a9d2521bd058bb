#include <cstddef>
#include <cstdint>
#include <string_view>

#include <spdlog/spdlog.h>

#include "lumen/builtins/q32_builtins.hpp"

namespace {

auto ToSpdlogLevel(uint8_t level) -> spdlog::level::level_enum {
  switch (level) {
    case 0:
      return spdlog::level::err;
    case 1:
      return spdlog::level::warn;
    case 2:
      return spdlog::level::info;
    case 3:
      return spdlog::level::debug;
    default:
      return spdlog::level::trace;
  }
}

}  // namespace

extern "C" void LumenHostLog(
    uint8_t level, const char* module_path, size_t module_len,
    const char* message, size_t message_len) {
  std::string_view module =
      module_path != nullptr ? std::string_view(module_path, module_len)
                             : std::string_view("shader");
  std::string_view text = message != nullptr
                              ? std::string_view(message, message_len)
                              : std::string_view();
  spdlog::log(ToSpdlogLevel(level), "[{}] {}", module, text);
}
