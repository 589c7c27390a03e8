#pragma once

#include <cstdlib>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace devflow::core {

// EnvLookup reads one environment variable; empty values read as unset.
// Production code passes process_env(); tests pass map_env({...}).
using EnvLookup = std::function<std::optional<std::string>(const std::string& name)>;

inline EnvLookup process_env() {
  return [](const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr || value[0] == '\0') {
      return std::nullopt;
    }
    return std::string(value);
  };
}

inline EnvLookup map_env(std::map<std::string, std::string> values) {
  return [values = std::move(values)](const std::string& name) -> std::optional<std::string> {
    const auto it = values.find(name);
    if (it == values.end() || it->second.empty()) {
      return std::nullopt;
    }
    return it->second;
  };
}

}  // namespace devflow::core
