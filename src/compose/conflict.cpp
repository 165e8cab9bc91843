#include "mcpcompose/compose/conflict.hpp"

#include "mcpcompose/exceptions.hpp"

namespace mcpcompose::compose
{

std::string to_string(ConflictStrategy strategy)
{
    switch (strategy)
    {
    case ConflictStrategy::Prefix:
        return "prefix";
    case ConflictStrategy::Suffix:
        return "suffix";
    case ConflictStrategy::Ignore:
        return "ignore";
    case ConflictStrategy::Override:
        return "override";
    case ConflictStrategy::Error:
        return "error";
    }
    return "prefix";
}

std::optional<ConflictStrategy> conflict_strategy_from_string(const std::string& s)
{
    if (s == "prefix")
        return ConflictStrategy::Prefix;
    if (s == "suffix")
        return ConflictStrategy::Suffix;
    if (s == "ignore")
        return ConflictStrategy::Ignore;
    if (s == "override")
        return ConflictStrategy::Override;
    if (s == "error")
        return ConflictStrategy::Error;
    return std::nullopt;
}

void to_json(Json& j, const ConflictRecord& record)
{
    j = Json{{"type", to_string(record.strategy)},
             {"component_type", to_string(record.kind)},
             {"original_name", record.original_name},
             {"resolved_name", record.resolved_name},
             {"server_name", record.server_name}};
    if (record.previous_source)
        j["previous_source"] = *record.previous_source;
}

Resolution ConflictResolver::resolve(ComponentKind kind, const std::string& name,
                                     const std::string& server, const TakenFn& taken,
                                     const SourceFn& source_of) const
{
    Resolution out;
    if (!taken(name))
    {
        out.resolved_name = name;
        return out;
    }

    switch (strategy_)
    {
    case ConflictStrategy::Error:
        throw ConflictError(kind, name, source_of(name), server);

    case ConflictStrategy::Ignore:
        out.action = Resolution::Action::Skip;
        out.resolved_name = name;
        return out;

    case ConflictStrategy::Override:
    {
        out.action = Resolution::Action::Replace;
        out.resolved_name = name;
        ConflictRecord record;
        record.kind = kind;
        record.original_name = name;
        record.resolved_name = name;
        record.server_name = server;
        record.strategy = strategy_;
        record.previous_source = source_of(name);
        out.record = std::move(record);
        return out;
    }

    case ConflictStrategy::Prefix:
    case ConflictStrategy::Suffix:
    {
        const std::string base =
            strategy_ == ConflictStrategy::Prefix ? server + "_" + name : name + "_" + server;
        std::string candidate = base;
        for (int counter = 1; taken(candidate); ++counter)
            candidate = base + "_" + std::to_string(counter);

        out.resolved_name = candidate;
        ConflictRecord record;
        record.kind = kind;
        record.original_name = name;
        record.resolved_name = candidate;
        record.server_name = server;
        record.strategy = strategy_;
        out.record = std::move(record);
        return out;
    }
    }
    out.resolved_name = name;
    return out;
}

} // namespace mcpcompose::compose
