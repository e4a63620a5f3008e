#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace xfer::config::detail {

// Parses `path` as a JSON document whose root is an object.
bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err);

// Settings accept either a string ("50MB", "1h") or a non-negative integer,
// which is rendered in decimal. Returns nullopt when `key` is absent; a value
// of any other type sets `err` and also returns nullopt.
std::optional<std::string> ScalarSetting(const nlohmann::json& obj, const char* key, std::string& err);

} // namespace xfer::config::detail
