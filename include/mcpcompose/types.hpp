#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace mcpcompose
{

using Json = nlohmann::json;

/// Category of a composed component. Names are unique per kind.
enum class ComponentKind
{
    Tool,
    Prompt,
    Resource
};

inline std::string to_string(ComponentKind kind)
{
    switch (kind)
    {
    case ComponentKind::Tool:
        return "tool";
    case ComponentKind::Prompt:
        return "prompt";
    case ComponentKind::Resource:
        return "resource";
    }
    return "tool";
}

inline std::optional<ComponentKind> component_kind_from_string(const std::string& s)
{
    if (s == "tool")
        return ComponentKind::Tool;
    if (s == "prompt")
        return ComponentKind::Prompt;
    if (s == "resource")
        return ComponentKind::Resource;
    return std::nullopt;
}

} // namespace mcpcompose
