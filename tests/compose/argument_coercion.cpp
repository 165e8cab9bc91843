#include "mcpcompose/compose/argument_coercion.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using mcpcompose::Json;
using mcpcompose::compose::coerce_arguments;
using mcpcompose::compose::coerce_value;

int main()
{
    Json schema = {
        {"type", "object"},
        {"properties",
         {{"a", {{"type", "integer"}}},
          {"ratio", {{"type", "number"}}},
          {"flag", {{"type", "boolean"}}},
          {"tags", {{"type", "array"}, {"items", {{"type", "integer"}}}}},
          {"opts", {{"type", "object"}, {"properties", {{"depth", {{"type", "integer"}}}}}}},
          {"maybe", {{"type", Json::array({"null", "integer"})}}},
          {"either", {{"anyOf", Json::array({Json{{"type", "null"}}, Json{{"type", "boolean"}}})}}},
          {"name", {{"type", "string"}}}}}};

    // Strings from loosely typed clients
    {
        Json out = coerce_arguments(schema, Json{{"a", "2"},
                                                 {"ratio", " 1.5 "},
                                                 {"flag", "TRUE"},
                                                 {"tags", "[1, \"2\"]"},
                                                 {"opts", "{\"depth\": \"3\"}"},
                                                 {"maybe", "7"},
                                                 {"either", "false"},
                                                 {"name", "42"},
                                                 {"extra", "x"}});
        assert(out["a"] == 2);
        assert(out["ratio"] == 1.5);
        assert(out["flag"] == true);
        assert(out["tags"] == Json::array({1, 2}));
        assert(out["opts"]["depth"] == 3);
        assert(out["maybe"] == 7);
        assert(out["either"] == false);
        assert(out["name"] == "42");
        assert(out["extra"] == "x");
        std::cout << "[PASS] string coercion" << std::endl;
    }

    // Values that do not convert are passed through unchanged
    {
        Json out = coerce_arguments(schema, Json{{"a", "two"}, {"flag", "maybe"}, {"a2", 1}});
        assert(out["a"] == "two");
        assert(out["flag"] == "maybe");
        assert(coerce_value(Json{{"type", "integer"}}, 2.5) == 2.5);
        assert(coerce_value(Json{{"type", "integer"}}, 4.0) == 4);
        assert(coerce_value(Json{{"type", "integer"}}, nullptr).is_null());
        std::cout << "[PASS] pass-through" << std::endl;
    }

    // Scalars wrap into single-element arrays
    {
        assert(coerce_value(Json{{"type", "array"}}, "solo") == Json::array({"solo"}));
        assert(coerce_value(Json{{"type", "array"}, {"items", {{"type", "integer"}}}}, "5") ==
               Json::array({5}));
        std::cout << "[PASS] array wrapping" << std::endl;
    }

    // Union alternatives whose type is itself a list
    {
        Json s = {{"anyOf", Json::array({Json{{"type", Json::array({"string", "null"})}},
                                          Json{{"type", "integer"}}})}};
        assert(coerce_value(s, "5") == "5");
        assert(coerce_value(s, 3) == 3);
        Json nested = {{"oneOf", Json::array({Json{{"type", "null"}},
                                               Json{{"type", Json::array({"null", "integer"})}}})}};
        assert(coerce_value(nested, "8") == 8);
        assert(coerce_value(Json{{"type", 7}}, "8") == "8");
        std::cout << "[PASS] list-typed alternatives" << std::endl;
    }

    // Floats outside the integer range stay floats
    {
        Json integer = {{"type", "integer"}};
        Json big = coerce_arguments(Json{{"properties", {{"n", integer}}}}, Json{{"n", 1e300}});
        assert(big["n"].is_number_float());
        assert(big["n"] == 1e300);
        assert(coerce_value(integer, -1e19).is_number_float());
        assert(coerce_value(integer, 9223372036854775808.0).is_number_float());
        assert(coerce_value(integer, -9223372036854775808.0) ==
               std::numeric_limits<long long>::min());
        Json inf = coerce_value(integer, std::numeric_limits<double>::infinity());
        assert(inf.is_number_float());
        Json nan = coerce_value(integer, std::numeric_limits<double>::quiet_NaN());
        assert(nan.is_number_float() && std::isnan(nan.get<double>()));
        std::cout << "[PASS] out-of-range floats" << std::endl;
    }

    // No schema, no change; null arguments become an empty object
    {
        Json args = {{"a", "1"}};
        assert(coerce_arguments(Json::object(), args) == args);
        assert(coerce_arguments(schema, nullptr) == Json::object());
        std::cout << "[PASS] schema-less" << std::endl;
    }

    return 0;
}
