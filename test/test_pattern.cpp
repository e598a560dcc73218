// test_pattern.cpp - Tests for generalization, pattern matching and the ignore list

#include <catch2/catch_all.hpp>
#include <struct_diff/pattern.h>
#include <struct_diff/serialization.h>

#include <string>

using namespace struct_diff;

namespace {

IdentityAddress id(const char* text)
{
    return IdentityAddress::parse(text);
}

PositionAddress at(const char* text)
{
    return PositionAddress::parse(text);
}

} // namespace

// ============================================================
// Generalization
// ============================================================

TEST_CASE("generalize", "[pattern][generalize]") {
    SECTION("identity addresses") {
        REQUIRE(generalize(id("items[id=b].tags[0].x")).to_string() == "items[].tags[].x");
        REQUIRE(generalize(id("items[org=x,id=1::2]")).to_string() == "items[]");
        REQUIRE(generalize(IdentityAddress{}).is_root());
    }

    SECTION("position addresses") {
        REQUIRE(generalize(at("a[1].b[2]")).to_string() == "a[].b[]");
        REQUIRE(generalize(at("[0]")).to_string() == "[]");
    }

    SECTION("equivalent locations share a pattern") {
        REQUIRE(generalize(id("g[name=a].members")) == generalize(id("g[name=b].members")));
        REQUIRE(generalize(id("g[name=a].members")) == generalize(at("g[3].members")));
    }
}

TEST_CASE("Identity keys grouped by pattern", "[pattern][group]") {
    auto doc = parse_json(R"({
        "groups": [
            {"name": "g1", "members": [{"uid": 1}, {"uid": 2}]},
            {"name": "g2", "members": [{"uid": 3}, {"uid": 4}]}
        ]
    })");
    auto keys = detect_identity_keys(doc);

    REQUIRE(element_pattern(keys[0]).to_string() == "groups[]");
    REQUIRE(element_pattern(keys[1]).to_string() == "groups[].members[]");

    auto groups = group_identity_keys(keys);
    REQUIRE(groups.size() == 2);
    REQUIRE(groups["groups[]"].size() == 1);
    REQUIRE(groups["groups[].members[]"].size() == 2);
    REQUIRE(groups["groups[].members[]"][0].identity_address.to_string() == "groups[name=g1].members");

    auto pattern = ArrayPattern::parse("groups[].members[]");
    REQUIRE(pattern.target_array_field() == std::optional<std::string>{"members"});
    REQUIRE(pattern.parent_array()->to_string() == "groups[]");
}

// ============================================================
// Matching
// ============================================================

TEST_CASE("Segment wildcards", "[pattern][match]") {
    SECTION("* matches exactly one segment") {
        REQUIRE(matches(id("items[id=b].v"), "items.*.v"));
        REQUIRE(matches(id("items.meta.v"), "items.*.v"));
        REQUIRE_FALSE(matches(id("items[id=b]"), "items.*.v"));
        REQUIRE_FALSE(matches(id("items[id=b].id"), "items.*.v"));
        REQUIRE_FALSE(matches(id("items[id=b].x.v"), "items.*.v"));
        REQUIRE(matches(at("items[1].v"), "items.*.v"));
    }

    SECTION("[] matches one array segment") {
        REQUIRE(matches(id("items[id=b].v"), "items[].v"));
        REQUIRE(matches(id("items[3].v"), "items[*].v"));
        REQUIRE(matches(at("items[0].v"), "items[].v"));
        REQUIRE_FALSE(matches(id("items.x.v"), "items[].v"));
    }

    SECTION("a lone * matches any single segment") {
        REQUIRE(matches(id("a"), "*"));
        REQUIRE(matches(at("[4]"), "*"));
        REQUIRE_FALSE(matches(IdentityAddress{}, "*"));
        REQUIRE_FALSE(matches(id("a.b"), "*"));
    }

    SECTION("the empty pattern matches the root only") {
        REQUIRE(matches(IdentityAddress{}, ""));
        REQUIRE_FALSE(matches(id("a"), ""));
    }
}

TEST_CASE("Literal segments", "[pattern][match]") {
    REQUIRE(matches(id("items[id=b].v"), "items[id=b].v"));
    REQUIRE_FALSE(matches(id("items[id=c].v"), "items[id=b].v"));
    REQUIRE_FALSE(matches(id("items[id=b::1].v"), "items[id=b].v"));
    REQUIRE(matches(id("rows[2]"), "rows[2]"));
    REQUIRE_FALSE(matches(id("rows[id=2]"), "rows[2]"));

    SECTION("selectors never match position addresses") {
        REQUIRE_FALSE(matches(at("items[1].v"), "items[id=b].v"));
        REQUIRE(matches(at("items[1].v"), "items[1].v"));
    }
}

TEST_CASE("Trailing prefix wildcard", "[pattern][match][prefix]") {
    SECTION("field prefix") {
        REQUIRE(matches(id("meta.updated"), "meta.updated*"));
        REQUIRE(matches(id("meta.updated.at[0]"), "meta.updated*"));
        REQUIRE_FALSE(matches(id("meta"), "meta.updated*"));
        // segment-wise, not textual
        REQUIRE_FALSE(matches(id("meta.updatedAt"), "meta.updated*"));
    }

    SECTION("bracket prefix") {
        REQUIRE(matches(id("items[id=b]"), "items[id=b]*"));
        REQUIRE(matches(id("items[id=b].v"), "items[id=b]*"));
        REQUIRE_FALSE(matches(id("items[id=c].v"), "items[id=b]*"));
    }

    SECTION("compiled pattern") {
        auto pattern = AddressPattern::parse("items[]*");
        REQUIRE(pattern.open_ended());
        REQUIRE(pattern.text() == "items[]*");
        REQUIRE(pattern.segments().size() == 2);
        REQUIRE(matches(id("items[id=x].deep.path"), pattern));
        REQUIRE(matches(at("items[7]"), pattern));
        REQUIRE_FALSE(matches(id("items"), pattern));
    }
}

TEST_CASE("Malformed patterns", "[pattern][error]") {
    REQUIRE_FALSE(matches(id("items[id=b]"), "items[id=b"));
    REQUIRE_FALSE(matches(at("a"), "a..b"));

    auto result = validate_pattern("items[id=b");
    REQUIRE_FALSE(result);
    REQUIRE(result.error_code == AddressErrorCode::UnterminatedBracket);
    REQUIRE(result.error_offset == 5);

    REQUIRE_THROWS_AS(AddressPattern::parse("a.b*c"), AddressError);
    REQUIRE(validate_pattern("items.*.v"));
}

// ============================================================
// IgnoreList
// ============================================================

TEST_CASE("IgnoreList management", "[pattern][ignore]") {
    IgnoreList ignore;
    REQUIRE(ignore.empty());

    ignore.add("timestamps", "meta.updated*");
    auto generated = ignore.add("items.*.rev");
    REQUIRE(generated == "pattern_1");
    REQUIRE(ignore.size() == 2);
    REQUIRE(ignore.contains("timestamps"));
    REQUIRE(ignore.contains(generated));

    SECTION("add with an existing id replaces the pattern") {
        ignore.add("timestamps", "meta.created");
        REQUIRE(ignore.size() == 2);
        REQUIRE(ignore.entries()[0].pattern.text() == "meta.created");
    }

    SECTION("update and remove") {
        REQUIRE(ignore.update(generated, "items.*.etag"));
        REQUIRE(ignore.is_ignored(id("items[id=a].etag")));
        REQUIRE_FALSE(ignore.is_ignored(id("items[id=a].rev")));
        REQUIRE_FALSE(ignore.update("unknown", "x"));

        REQUIRE(ignore.remove("timestamps"));
        REQUIRE_FALSE(ignore.remove("timestamps"));
        REQUIRE(ignore.size() == 1);
    }

    SECTION("malformed patterns leave the list unchanged") {
        REQUIRE_THROWS_AS(ignore.add("bad", "a["), AddressError);
        REQUIRE_FALSE(ignore.contains("bad"));
        REQUIRE_THROWS_AS(ignore.update("timestamps", "a..b"), AddressError);
        REQUIRE(ignore.entries()[0].pattern.text() == "meta.updated*");
        REQUIRE(ignore.size() == 2);
    }

    SECTION("generated ids skip taken ones") {
        ignore.add("pattern_2", "x");
        REQUIRE(ignore.add("y") == "pattern_3");
    }

    SECTION("clear") {
        ignore.clear();
        REQUIRE(ignore.empty());
    }
}

TEST_CASE("IgnoreList filtering", "[pattern][ignore][filter]") {
    auto left = parse_json(R"({"meta":{"updated":1},"items":[{"id":"a","v":1,"rev":1},{"id":"b","v":2,"rev":1}]})");
    auto right = parse_json(R"({"meta":{"updated":2},"items":[{"id":"b","v":3,"rev":2},{"id":"a","v":1,"rev":2}]})");
    auto result = compare(left, right);
    REQUIRE(result.diffs.size() == 4);

    SECTION("by identity address") {
        IgnoreList ignore;
        ignore.add("meta.updated*");
        ignore.add("items.*.rev");

        auto kept = ignore.filter(result.diffs);
        REQUIRE(kept.size() == 1);
        REQUIRE(kept[0].identity_address.to_string() == "items[id=b].v");
    }

    SECTION("by either position address") {
        IgnoreList ignore;
        ignore.add("left-second", "items[1]*");

        auto kept = ignore.filter(result.diffs);
        // items[id=b] sits at left items[1] and items[id=a] at right items[1]
        REQUIRE(kept.size() == 1);
        REQUIRE(kept[0].identity_address.to_string() == "meta.updated");
    }

    SECTION("empty list keeps everything") {
        REQUIRE(IgnoreList{}.filter(result.diffs).size() == result.diffs.size());
    }
}
