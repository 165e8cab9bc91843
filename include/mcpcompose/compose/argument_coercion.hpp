#pragma once
#include "mcpcompose/types.hpp"

namespace mcpcompose::compose
{

/// Coerce `value` towards the JSON Schema type of `schema`:
/// numeric and boolean strings become numbers and booleans, JSON-encoded
/// arrays and objects are decoded, and a scalar given for an array becomes a
/// one-element array. Types given as a list or through anyOf/oneOf use the
/// first non-null alternative. Values that cannot be coerced pass through.
Json coerce_value(const Json& schema, const Json& value);

/// Apply coerce_value to each argument named in `input_schema.properties`;
/// other arguments pass through untouched
Json coerce_arguments(const Json& input_schema, const Json& arguments);

} // namespace mcpcompose::compose
