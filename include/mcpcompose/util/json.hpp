#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mcpcompose::util::json
{

using json = nlohmann::json;

inline json parse(const std::string& s)
{
    return json::parse(s);
}
inline std::string dump(const json& j)
{
    return j.dump();
}
inline std::string dump_pretty(const json& j, int indent = 2)
{
    return j.dump(indent);
}

/// Parse without throwing; nullopt on malformed input
inline std::optional<json> try_parse(const std::string& s)
{
    auto j = json::parse(s, nullptr, false);
    if (j.is_discarded())
        return std::nullopt;
    return j;
}

/// True if the string holds only spaces, tabs, CR or LF
inline bool is_blank(const std::string& s)
{
    return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

} // namespace mcpcompose::util::json
