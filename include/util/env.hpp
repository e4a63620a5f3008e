#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace xfer::config {

// Environment lookup, injectable for tests. Empty values read as unset.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;
EnvLookup ProcessEnv();

// true/false, 1/0, yes/no, on/off (case-insensitive).
std::optional<bool> ParseBool(std::string_view s);

} // namespace xfer::config
