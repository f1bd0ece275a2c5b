#include "config.h"

#include <charconv>
#include <cstdlib>

namespace shortmint::cli {

std::optional<int> parse_int(std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  int value = 0;
  const auto* first = text.data();
  const auto* last = text.data() + text.size();  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return value;
}

core::Result<int, std::string> resolve_machine_id(const std::optional<std::string>& flag_value,
                                                  const std::optional<std::string>& env_value) {
  const auto pick = [](const std::string& text,
                       const std::string& source) -> core::Result<int, std::string> {
    const auto parsed = parse_int(text);
    if (!parsed.has_value()) {
      return core::Result<int, std::string>::err("Error: " + source + " '" + text +
                                                 "' is not an integer");
    }
    return core::Result<int, std::string>::ok(parsed.value());
  };

  if (flag_value.has_value()) {
    return pick(flag_value.value(), "--machine-id");
  }
  if (env_value.has_value()) {
    return pick(env_value.value(), kMachineIdEnvVar);
  }
  return core::Result<int, std::string>::ok(kDefaultMachineId);
}

std::optional<std::string> read_env(const char* name) {
  const char* value = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

}  // namespace shortmint::cli
