#include <catch2/catch_test_macros.hpp>
#include "agentreg/canonical_json.hpp"

using namespace agentreg::json;
using json = nlohmann::json;

TEST_CASE("Canonical JSON - key ordering", "[json]")
{
    json obj = {
        {"z", 3},
        {"a", 1},
        {"outer", {{"y", "last"}, {"b", "first"}}}};

    REQUIRE(Canonicalizer::canonicalize(obj) == R"({"a":1,"outer":{"b":"first","y":"last"},"z":3})");
}

TEST_CASE("Canonical JSON - scalars", "[json]")
{
    json obj = {
        {"int", 42},
        {"negative", -17},
        {"big", uint64_t{18446744073709551615ull}},
        {"half", 1.5},
        {"zero", 0.0},
        {"t", true},
        {"n", nullptr}};

    REQUIRE(Canonicalizer::canonicalize(obj) ==
            R"({"big":18446744073709551615,"half":1.5,"int":42,"n":null,"negative":-17,"t":true,"zero":0})");
}

TEST_CASE("Canonical JSON - string escaping", "[json]")
{
    json obj = {{"s", "quote\" slash\\ nl\n ctrl\x01"}};
    REQUIRE(Canonicalizer::canonicalize(obj) == R"({"s":"quote\" slash\\ nl\n ctrl\u0001"})");
}

TEST_CASE("Canonical JSON - empty structures", "[json]")
{
    REQUIRE(Canonicalizer::canonicalize(json::object()) == "{}");
    REQUIRE(Canonicalizer::canonicalize(json::array()) == "[]");
}

TEST_CASE("Canonical JSON - from text", "[json]")
{
    auto canonical = Canonicalizer::canonicalize_string(R"({ "b" : [1, 2], "a" : {} })");
    REQUIRE(canonical.has_value());
    REQUIRE(*canonical == R"({"a":{},"b":[1,2]})");

    auto bytes = Canonicalizer::canonical_bytes(json{{"k", "v"}});
    REQUIRE(std::string(bytes.begin(), bytes.end()) == R"({"k":"v"})");

    auto bad = Canonicalizer::canonicalize_string("{oops");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == agentreg::ErrorCode::ParsingError);
}
