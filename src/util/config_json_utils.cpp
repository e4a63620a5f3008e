#include "util/config_json_utils.hpp"

#include <fstream>

namespace xfer::config::detail {

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is) {
        err = "cannot open config file " + path;
        return false;
    }

    out = nlohmann::json::parse(is, nullptr, /*allow_exceptions=*/false);
    if (out.is_discarded()) {
        err = "config file " + path + " is not valid JSON";
        return false;
    }
    if (!out.is_object()) {
        err = "config file " + path + " must contain a JSON object";
        return false;
    }
    return true;
}

std::optional<std::string> ScalarSetting(const nlohmann::json& obj, const char* key, std::string& err) {
    const auto it = obj.find(key);
    if (it == obj.end()) return std::nullopt;

    switch (it->type()) {
        case nlohmann::json::value_t::string:
            return it->get<std::string>();
        case nlohmann::json::value_t::number_unsigned:
            return std::to_string(it->get<std::uint64_t>());
        case nlohmann::json::value_t::number_integer:
            if (it->get<std::int64_t>() >= 0) return std::to_string(it->get<std::int64_t>());
            break;
        default:
            break;
    }
    err = std::string(key) + " must be a string or a non-negative integer";
    return std::nullopt;
}

} // namespace xfer::config::detail
