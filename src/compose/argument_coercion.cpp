#include "mcpcompose/compose/argument_coercion.hpp"

#include "mcpcompose/util/json.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string>

namespace mcpcompose::compose
{

namespace
{

std::string lowercase(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s)
{
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
        return {};
    auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

/// `type` of a schema when it is a single string, else empty
std::string type_name(const Json& schema)
{
    auto it = schema.find("type");
    if (it == schema.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

/// Effective schema of a property: the first non-null alternative of a type
/// list or of anyOf/oneOf
Json effective_schema(const Json& schema)
{
    if (!schema.is_object())
        return Json::object();

    if (schema.contains("type") && schema["type"].is_array())
    {
        Json out = schema;
        out["type"] = "string";
        for (const auto& t : schema["type"])
        {
            if (t.is_string() && t.get<std::string>() != "null")
            {
                out["type"] = t;
                return out;
            }
        }
        return out;
    }

    for (const char* key : {"anyOf", "oneOf"})
    {
        if (!schema.contains(key) || !schema[key].is_array())
            continue;
        for (const auto& alt : schema[key])
        {
            if (alt.is_object() && type_name(alt) != "null")
                return effective_schema(alt);
        }
    }
    return schema;
}

bool parse_integer(const std::string& s, long long& out)
{
    if (s.empty())
        return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(s.c_str(), &end, 10);
    if (errno != 0 || end != s.c_str() + s.size())
        return false;
    out = v;
    return true;
}

bool parse_number(const std::string& s, double& out)
{
    if (s.empty())
        return false;
    char* end = nullptr;
    double v = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size())
        return false;
    out = v;
    return true;
}

} // namespace

Json coerce_value(const Json& schema, const Json& value)
{
    if (value.is_null())
        return value;

    const Json eff = effective_schema(schema);
    const std::string type = type_name(eff);

    if (type == "integer")
    {
        if (value.is_string())
        {
            long long i = 0;
            if (parse_integer(trim(value.get<std::string>()), i))
                return i;
        }
        else if (value.is_number_float())
        {
            // [-2^63, 2^63) is exactly the range a long long holds
            double d = value.get<double>();
            if (std::isfinite(d) && std::trunc(d) == d && d >= -9223372036854775808.0 &&
                d < 9223372036854775808.0)
                return static_cast<long long>(d);
        }
        return value;
    }

    if (type == "number")
    {
        if (value.is_string())
        {
            const std::string s = trim(value.get<std::string>());
            long long i = 0;
            if (parse_integer(s, i))
                return i;
            double d = 0;
            if (parse_number(s, d))
                return d;
        }
        return value;
    }

    if (type == "boolean")
    {
        if (value.is_string())
        {
            const std::string s = lowercase(trim(value.get<std::string>()));
            if (s == "true" || s == "1")
                return true;
            if (s == "false" || s == "0")
                return false;
        }
        else if (value.is_number_integer())
        {
            auto i = value.get<long long>();
            if (i == 0 || i == 1)
                return i == 1;
        }
        return value;
    }

    if (type == "array")
    {
        Json arr;
        if (value.is_array())
        {
            arr = value;
        }
        else if (value.is_string())
        {
            auto decoded = util::json::try_parse(value.get<std::string>());
            arr = decoded && decoded->is_array() ? *decoded : Json::array({value});
        }
        else
        {
            arr = Json::array({value});
        }
        if (eff.contains("items") && eff["items"].is_object())
            for (auto& item : arr)
                item = coerce_value(eff["items"], item);
        return arr;
    }

    if (type == "object")
    {
        Json obj = value;
        if (value.is_string())
        {
            auto decoded = util::json::try_parse(value.get<std::string>());
            if (!decoded || !decoded->is_object())
                return value;
            obj = *decoded;
        }
        if (obj.is_object() && eff.contains("properties"))
            return coerce_arguments(eff, obj);
        return obj;
    }

    return value;
}

Json coerce_arguments(const Json& input_schema, const Json& arguments)
{
    if (!arguments.is_object())
        return arguments.is_null() ? Json::object() : arguments;
    if (!input_schema.is_object() || !input_schema.contains("properties") ||
        !input_schema["properties"].is_object())
        return arguments;

    const auto& props = input_schema["properties"];
    Json out = arguments;
    for (auto it = out.begin(); it != out.end(); ++it)
    {
        auto prop = props.find(it.key());
        if (prop != props.end())
            *it = coerce_value(*prop, *it);
    }
    return out;
}

} // namespace mcpcompose::compose
