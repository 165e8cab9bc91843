#include "mcpcompose/compose/namespace_registry.hpp"

#include "mcpcompose/exceptions.hpp"

#include <mutex>

namespace mcpcompose::compose
{

Json ComposedComponent::exported_definition() const
{
    Json out = definition.is_object() ? definition : Json::object();
    out["name"] = resolved_name;
    return out;
}

NamespaceRegistry::Table& NamespaceRegistry::table(ComponentKind kind)
{
    switch (kind)
    {
    case ComponentKind::Prompt:
        return prompts_;
    case ComponentKind::Resource:
        return resources_;
    case ComponentKind::Tool:
        break;
    }
    return tools_;
}

const NamespaceRegistry::Table& NamespaceRegistry::table(ComponentKind kind) const
{
    return const_cast<NamespaceRegistry*>(this)->table(kind);
}

void NamespaceRegistry::register_component(ComposedComponent component)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& t = table(component.kind);
    if (t.entries.count(component.resolved_name))
        throw ValidationError(to_string(component.kind) + " already registered: " +
                              component.resolved_name);
    t.order.push_back(component.resolved_name);
    const std::string key = component.resolved_name;
    t.entries.emplace(key, std::move(component));
}

void NamespaceRegistry::replace(ComposedComponent component)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto& t = table(component.kind);
    auto it = t.entries.find(component.resolved_name);
    if (it == t.entries.end())
        throw NotFoundError(to_string(component.kind) + " not registered: " +
                            component.resolved_name);
    it->second = std::move(component);
}

std::optional<ComposedComponent> NamespaceRegistry::lookup(ComponentKind kind,
                                                           const std::string& name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto& t = table(kind);
    auto it = t.entries.find(name);
    if (it == t.entries.end())
        return std::nullopt;
    return it->second;
}

bool NamespaceRegistry::contains(ComponentKind kind, const std::string& name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return table(kind).entries.count(name) > 0;
}

std::optional<std::string> NamespaceRegistry::source_of(ComponentKind kind,
                                                        const std::string& name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto& t = table(kind);
    auto it = t.entries.find(name);
    if (it == t.entries.end())
        return std::nullopt;
    return it->second.server_name;
}

std::vector<ComposedComponent> NamespaceRegistry::list(ComponentKind kind) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    const auto& t = table(kind);
    std::vector<ComposedComponent> out;
    out.reserve(t.order.size());
    for (const auto& name : t.order)
        out.push_back(t.entries.at(name));
    return out;
}

std::vector<std::string> NamespaceRegistry::names(ComponentKind kind) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return table(kind).order;
}

std::size_t NamespaceRegistry::size(ComponentKind kind) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return table(kind).entries.size();
}

Json NamespaceRegistry::counts_for(const std::string& server_name) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto count = [&server_name](const Table& t)
    {
        int n = 0;
        for (const auto& [name, c] : t.entries)
            if (c.server_name == server_name)
                ++n;
        return n;
    };
    return Json{{"tools", count(tools_)},
                {"prompts", count(prompts_)},
                {"resources", count(resources_)}};
}

} // namespace mcpcompose::compose
