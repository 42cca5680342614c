#pragma once
#include <nlohmann/json.hpp>

#include <string>

namespace brewsource::util::json
{

using json = nlohmann::json;

/// Read an optional string member; missing or non-string values yield the default.
inline std::string string_or(const json& obj, const char* key, const std::string& defv = "")
{
    if (!obj.is_object())
        return defv;
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return defv;
    return it->get<std::string>();
}

} // namespace brewsource::util::json
