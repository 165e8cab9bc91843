#pragma once
/// @file compose/namespace_registry.hpp
/// @brief The unified tool/prompt/resource namespace of a composition.

#include "mcpcompose/compose/invoker.hpp"
#include "mcpcompose/types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace mcpcompose::compose
{

struct ComposedComponent
{
    ComponentKind kind{ComponentKind::Tool};
    std::string resolved_name;
    std::string original_name;
    std::string server_name;
    Json definition; ///< as discovered from the source server
    std::shared_ptr<const Invoker> invoker;

    /// The definition as clients of the composition see it: `name` is the
    /// resolved name
    Json exported_definition() const;
};

/// Resolved names are unique per kind; every entry maps to exactly one
/// source server. Readers take a shared lock, mutations an exclusive one.
class NamespaceRegistry
{
  public:
    /// @throws ValidationError if the resolved name is already registered
    void register_component(ComposedComponent component);

    /// Swap the entry under component.resolved_name, keeping its position
    /// @throws NotFoundError if nothing is registered under that name
    void replace(ComposedComponent component);

    std::optional<ComposedComponent> lookup(ComponentKind kind, const std::string& name) const;
    bool contains(ComponentKind kind, const std::string& name) const;
    std::optional<std::string> source_of(ComponentKind kind, const std::string& name) const;

    /// Entries of one kind in registration order
    std::vector<ComposedComponent> list(ComponentKind kind) const;
    std::vector<std::string> names(ComponentKind kind) const;
    std::size_t size(ComponentKind kind) const;

    /// Component counts of one server: {"tools": n, "prompts": n, "resources": n}
    Json counts_for(const std::string& server_name) const;

  private:
    struct Table
    {
        std::map<std::string, ComposedComponent> entries;
        std::vector<std::string> order;
    };

    Table& table(ComponentKind kind);
    const Table& table(ComponentKind kind) const;

    mutable std::shared_mutex mutex_;
    Table tools_;
    Table prompts_;
    Table resources_;
};

} // namespace mcpcompose::compose
