// test_value.cpp - Tests for Value construction, equality and JSON I/O

#include <catch2/catch_all.hpp>
#include <struct_diff/serialization.h>
#include <struct_diff/value.h>

#include <string>

using namespace struct_diff;

// ============================================================
// Construction and access
// ============================================================

TEST_CASE("Value construction", "[value][construct]") {
    SECTION("scalars") {
        REQUIRE(Value{}.is_null());
        REQUIRE(Value{nullptr}.kind() == ValueKind::Null);
        REQUIRE(Value{true}.as_bool());
        REQUIRE(Value{42}.as_int64() == 42);
        REQUIRE(Value{2.5}.as_number() == 2.5);
        REQUIRE(Value{"text"}.as_string() == "text");
        REQUIRE(Value{std::string("s")}.is_string());
    }

    SECTION("integer and double are one kind") {
        REQUIRE(Value{1}.kind() == ValueKind::Number);
        REQUIRE(Value{1.0}.kind() == ValueKind::Number);
        REQUIRE(Value{1}.is_number());
    }

    SECTION("object factory keeps declaration order") {
        auto obj = Value::object({{"zeta", 1}, {"alpha", 2}, {"mid", 3}});
        const auto* fields = obj.get_if<ValueObject>();
        REQUIRE(fields != nullptr);
        REQUIRE(fields->size() == 3);
        REQUIRE((*fields)[0].name == "zeta");
        REQUIRE((*fields)[1].name == "alpha");
        REQUIRE((*fields)[2].name == "mid");
    }

    SECTION("array factory") {
        auto arr = Value::array({1, "two", Value::array({})});
        REQUIRE(arr.is_array());
        REQUIRE(arr.size() == 3);
        REQUIRE(arr.at(1).as_string() == "two");
        REQUIRE(arr.at(2).is_array());
    }
}

TEST_CASE("Value lookup", "[value][access]") {
    auto doc = Value::object({{"a", nullptr}, {"list", Value::array({10, 20})}});

    SECTION("find distinguishes absent from null") {
        REQUIRE(doc.find("a") != nullptr);
        REQUIRE(doc.find("a")->is_null());
        REQUIRE(doc.find("missing") == nullptr);
    }

    SECTION("find by index") {
        const Value* list = doc.find("list");
        REQUIRE(list != nullptr);
        REQUIRE(list->find(std::size_t{1})->as_int64() == 20);
        REQUIRE(list->find(std::size_t{2}) == nullptr);
    }

    SECTION("type mismatch yields absent") {
        REQUIRE(doc.find(std::size_t{0}) == nullptr);
        REQUIRE(doc.find("list")->find("x") == nullptr);
    }

    SECTION("at() returns null on a miss") {
        REQUIRE(doc.at("missing").is_null());
        REQUIRE(doc.at("list").at(std::size_t{5}).is_null());
    }
}

TEST_CASE("ValueObject set", "[value][object]") {
    ValueObject obj;
    obj = obj.set("first", ValueBox{Value{1}});
    obj = obj.set("second", ValueBox{Value{2}});
    auto rebound = obj.set("first", ValueBox{Value{9}});

    SECTION("rebinding keeps the first position and takes the last value") {
        REQUIRE(rebound.size() == 2);
        REQUIRE(rebound[0].name == "first");
        REQUIRE(rebound[0].value.get().as_int64() == 9);
    }

    SECTION("original is untouched") {
        REQUIRE(obj.find("first")->get().as_int64() == 1);
    }

    SECTION("contains") {
        REQUIRE(obj.contains("second"));
        REQUIRE_FALSE(obj.contains("third"));
    }
}

// ============================================================
// Equality
// ============================================================

TEST_CASE("Value equality", "[value][equality]") {
    SECTION("numbers compare numerically") {
        REQUIRE(Value{1} == Value{1.0});
        REQUIRE_FALSE(Value{1} == Value{1.5});
    }

    SECTION("different kinds are never equal") {
        REQUIRE_FALSE(Value{1} == Value{"1"});
        REQUIRE_FALSE(Value{} == Value{false});
        REQUIRE_FALSE(Value::object({}) == Value::array({}));
    }

    SECTION("object equality ignores field order") {
        auto a = Value::object({{"x", 1}, {"y", 2}});
        auto b = Value::object({{"y", 2}, {"x", 1}});
        REQUIRE(a == b);
    }

    SECTION("array equality is order sensitive") {
        REQUIRE(Value::array({1, 2}) == Value::array({1, 2}));
        REQUIRE_FALSE(Value::array({1, 2}) == Value::array({2, 1}));
    }

    SECTION("nested") {
        auto a = parse_json(R"({"a":[{"b":1}],"c":null})");
        auto b = parse_json(R"({"c":null,"a":[{"b":1.0}]})");
        REQUIRE(a == b);
    }
}

TEST_CASE("Value utilities", "[value][utils]") {
    SECTION("format_number") {
        REQUIRE(format_number(2.0) == "2");
        REQUIRE(format_number(-0.0) == "0");
        REQUIRE(format_number(0.5) == "0.5");
        REQUIRE(format_number(0.1) == "0.1");
    }

    SECTION("value_to_string") {
        REQUIRE(value_to_string(Value{}) == "null");
        REQUIRE(value_to_string(Value{"x"}) == "\"x\"");
        REQUIRE(value_to_string(Value{3}) == "3");
        REQUIRE(value_to_string(Value::array({1, true})) == "[1,true]");
    }

    SECTION("count_leaves") {
        auto doc = parse_json(R"({"a":1,"b":[2,3],"c":{},"d":{"e":null}})");
        // 1, 2, 3, {}, null
        REQUIRE(count_leaves(doc) == 5);
    }
}

// ============================================================
// JSON
// ============================================================

TEST_CASE("JSON parsing", "[value][json]") {
    SECTION("object order is preserved") {
        auto doc = parse_json(R"({"b":1,"a":2})");
        REQUIRE(to_json(doc) == R"({"b":1,"a":2})");
    }

    SECTION("duplicate names keep first position and last value") {
        auto doc = parse_json(R"({"a":1,"b":2,"a":3})");
        REQUIRE(to_json(doc) == R"({"a":3,"b":2})");
    }

    SECTION("numbers") {
        auto doc = parse_json(R"([0,-7,1.5,1e3,9223372036854775807])");
        REQUIRE(doc.at(std::size_t{0}).is<std::int64_t>());
        REQUIRE(doc.at(std::size_t{1}).as_int64() == -7);
        REQUIRE(doc.at(std::size_t{2}).is<double>());
        REQUIRE(doc.at(std::size_t{3}).as_number() == 1000.0);
        REQUIRE(doc.at(std::size_t{4}).as_int64() == 9223372036854775807LL);
    }

    SECTION("string escapes and unicode") {
        auto doc = parse_json(R"(["a\"b\\c\n", "\u00e9", "\ud83d\ude00"])");
        REQUIRE(doc.at(std::size_t{0}).as_string() == "a\"b\\c\n");
        REQUIRE(doc.at(std::size_t{1}).as_string() == "\xC3\xA9");
        REQUIRE(doc.at(std::size_t{2}).as_string() == "\xF0\x9F\x98\x80");
    }

    SECTION("literals and whitespace") {
        auto doc = parse_json(" { \"t\" : true , \"f\" : false , \"n\" : null } ");
        REQUIRE(doc.at("t").as_bool());
        REQUIRE_FALSE(doc.at("f").as_bool(true));
        REQUIRE(doc.at("n").is_null());
    }
}

TEST_CASE("JSON parse errors", "[value][json][error]") {
    SECTION("parse_json throws with an offset") {
        try {
            (void)parse_json(R"({"a":1,})");
            FAIL("expected JsonParseError");
        } catch (const JsonParseError& e) {
            REQUIRE(e.offset() == 7);
        }
    }

    SECTION("trailing content is rejected") {
        REQUIRE_THROWS_AS(parse_json("1 2"), JsonParseError);
    }

    SECTION("empty input") {
        REQUIRE_THROWS_AS(parse_json("   "), JsonParseError);
    }

    SECTION("from_json reports instead of throwing") {
        std::string error;
        auto val = from_json("[1,", &error);
        REQUIRE(val.is_null());
        REQUIRE_FALSE(error.empty());
    }

    SECTION("from_json leaves the error untouched on success") {
        std::string error;
        auto val = from_json("[1]", &error);
        REQUIRE(val.is_array());
        REQUIRE(error.empty());
    }
}

TEST_CASE("JSON serialization", "[value][json]") {
    auto doc = parse_json(R"({"name":"a\tb","list":[1,2.5,null],"empty":{}})");

    SECTION("compact") {
        REQUIRE(to_json(doc) == R"({"name":"a\tb","list":[1,2.5,null],"empty":{}})");
    }

    SECTION("pretty output parses back to an equal value") {
        auto pretty = to_json(doc, false);
        REQUIRE(pretty.find('\n') != std::string::npos);
        REQUIRE(parse_json(pretty) == doc);
    }
}
