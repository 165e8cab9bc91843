#pragma once
/// @file compose/conflict.hpp
/// @brief Name conflict strategies and the append-only conflict log.

#include "mcpcompose/types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace mcpcompose::compose
{

enum class ConflictStrategy
{
    Prefix,   ///< {server}_{name}
    Suffix,   ///< {name}_{server}
    Ignore,   ///< later component dropped
    Override, ///< later component replaces the earlier one
    Error     ///< composition aborts
};

std::string to_string(ConflictStrategy strategy);
std::optional<ConflictStrategy> conflict_strategy_from_string(const std::string& s);

struct ConflictRecord
{
    ComponentKind kind{ComponentKind::Tool};
    std::string original_name;
    std::string resolved_name;
    std::string server_name; ///< server whose component triggered the conflict
    ConflictStrategy strategy{ConflictStrategy::Prefix};
    std::optional<std::string> previous_source; ///< override only
};

void to_json(Json& j, const ConflictRecord& record);

/// Outcome of resolving one incoming name against a category
struct Resolution
{
    enum class Action
    {
        Register, ///< add under resolved_name (no conflict, or prefix/suffix)
        Replace,  ///< override the existing entry under resolved_name
        Skip      ///< drop the incoming component
    };

    Action action{Action::Register};
    std::string resolved_name;
    std::optional<ConflictRecord> record;
};

/// Decides the resolved name for an incoming component.
///
/// The resolver is pure: `taken` answers whether a name is already occupied
/// in the category and `source_of` returns the owner of an occupied name.
/// Under ConflictStrategy::Error it throws ConflictError.
class ConflictResolver
{
  public:
    using TakenFn = std::function<bool(const std::string&)>;
    using SourceFn = std::function<std::string(const std::string&)>;

    explicit ConflictResolver(ConflictStrategy strategy) : strategy_(strategy) {}

    ConflictStrategy strategy() const
    {
        return strategy_;
    }

    Resolution resolve(ComponentKind kind, const std::string& name, const std::string& server,
                       const TakenFn& taken, const SourceFn& source_of) const;

  private:
    ConflictStrategy strategy_;
};

} // namespace mcpcompose::compose
