// test_address.cpp - Tests for address parsing, printing and validation

#include <catch2/catch_all.hpp>
#include <struct_diff/address.h>

#include <string>
#include <unordered_set>

using namespace struct_diff;

namespace {

template <typename Address>
void check_round_trip(const std::string& text)
{
    INFO("address: " << text);
    REQUIRE(Address::parse(text).to_string() == text);
}

template <typename Address, typename Validate>
void check_error(Validate validate, const std::string& text, AddressErrorCode code, std::size_t offset)
{
    INFO("address: " << text);
    auto result = validate(text);
    REQUIRE_FALSE(result);
    REQUIRE(error_code_name(result.error_code) == error_code_name(code));
    REQUIRE(result.error_offset == offset);
    REQUIRE_FALSE(result.error_message.empty());
    REQUIRE_THROWS_AS(Address::parse(text), AddressError);
}

} // namespace

// ============================================================
// PositionAddress
// ============================================================

TEST_CASE("PositionAddress parsing", "[address][position]") {
    SECTION("root is the empty string") {
        auto root = PositionAddress::parse("");
        REQUIRE(root.is_root());
        REQUIRE(root.to_string().empty());
    }

    SECTION("fields and indices") {
        auto addr = PositionAddress::parse("items[2].tags[0]");
        REQUIRE(addr.size() == 4);
        REQUIRE(std::get<std::string>(addr[0]) == "items");
        REQUIRE(std::get<std::size_t>(addr[1]) == 2);
        REQUIRE(std::get<std::string>(addr[2]) == "tags");
        REQUIRE(std::get<std::size_t>(addr[3]) == 0);
    }

    SECTION("round trips") {
        check_round_trip<PositionAddress>("a");
        check_round_trip<PositionAddress>("[0]");
        check_round_trip<PositionAddress>("[0][1].x");
        check_round_trip<PositionAddress>("a.b.c[10]");
        check_round_trip<PositionAddress>("a\\.b");
        check_round_trip<PositionAddress>("\"\"");
        check_round_trip<PositionAddress>("a.\"\".b");
        check_round_trip<PositionAddress>("x\\*\\[y\\]\\\"\\\\");
    }

    SECTION("escaped field names") {
        auto addr = PositionAddress::parse("a\\.b.c");
        REQUIRE(addr.size() == 2);
        REQUIRE(std::get<std::string>(addr[0]) == "a.b");
        REQUIRE(PositionAddress::parse("\"\"").segments()[0] == PositionSegment{std::string{}});
    }

    SECTION("building with child()") {
        auto addr = PositionAddress{}.child("items").child(std::size_t{2}).child("a.b");
        REQUIRE(addr.to_string() == "items[2].a\\.b");
        REQUIRE(addr == PositionAddress::parse("items[2].a\\.b"));
    }

    SECTION("parent and prefix") {
        auto addr = PositionAddress::parse("items[2].v");
        REQUIRE(addr.parent() == PositionAddress::parse("items[2]"));
        REQUIRE(PositionAddress{}.parent().is_root());
        REQUIRE(addr.starts_with(PositionAddress::parse("items")));
        REQUIRE_FALSE(addr.starts_with(PositionAddress::parse("items[3]")));
    }
}

TEST_CASE("PositionAddress errors", "[address][position][error]") {
    auto validate = [](const std::string& t) { return validate_position_address(t); };

    check_error<PositionAddress>(validate, "items..v", AddressErrorCode::EmptySegment, 6);
    check_error<PositionAddress>(validate, ".a", AddressErrorCode::EmptySegment, 0);
    check_error<PositionAddress>(validate, "items.", AddressErrorCode::EmptySegment, 6);
    check_error<PositionAddress>(validate, "items[01]", AddressErrorCode::InvalidIndex, 6);
    check_error<PositionAddress>(validate, "items[0", AddressErrorCode::UnterminatedBracket, 5);
    check_error<PositionAddress>(validate, "a\\x", AddressErrorCode::InvalidEscape, 1);
    check_error<PositionAddress>(validate, "a]", AddressErrorCode::UnexpectedCharacter, 1);
    check_error<PositionAddress>(validate, "items[0]x", AddressErrorCode::UnexpectedCharacter, 8);
    check_error<PositionAddress>(validate, "items[id=b]", AddressErrorCode::UnexpectedSegment, 5);
    check_error<PositionAddress>(validate, "items.*", AddressErrorCode::UnexpectedWildcard, 6);
    check_error<PositionAddress>(validate, "config*", AddressErrorCode::UnexpectedWildcard, 6);
}

// ============================================================
// IdentityAddress
// ============================================================

TEST_CASE("IdentityAddress parsing", "[address][identity]") {
    SECTION("simple selector") {
        auto addr = IdentityAddress::parse("items[id=b].v");
        REQUIRE(addr.size() == 3);
        const auto& selector = std::get<KeySelector>(addr[1]);
        REQUIRE(selector.components.size() == 1);
        REQUIRE(selector.components[0].field == "id");
        REQUIRE(selector.components[0].value == "b");
        REQUIRE_FALSE(selector.occurrence.has_value());
        REQUIRE_FALSE(selector.is_composite());
        REQUIRE(addr.has_selectors());
    }

    SECTION("composite selector with occurrence") {
        auto addr = IdentityAddress::parse("items[org=x,id=1::2]");
        const auto& selector = std::get<KeySelector>(addr[1]);
        REQUIRE(selector.is_composite());
        REQUIRE(selector.fields() == std::vector<std::string>{"org", "id"});
        REQUIRE(selector.components[1].value == "1");
        REQUIRE(selector.occurrence == std::optional<std::size_t>{2});
    }

    SECTION("indices are allowed") {
        auto addr = IdentityAddress::parse("rows[3][id=a]");
        REQUIRE(std::get<std::size_t>(addr[1]) == 3);
        REQUIRE(std::holds_alternative<KeySelector>(addr[2]));
    }

    SECTION("round trips") {
        check_round_trip<IdentityAddress>("items[id=b]");
        check_round_trip<IdentityAddress>("items[id=b::1].v");
        check_round_trip<IdentityAddress>("items[org=x,id=1]");
        check_round_trip<IdentityAddress>("[k=a\\=b\\,c\\:d\\]]");
        check_round_trip<IdentityAddress>("items[id=]");
        check_round_trip<IdentityAddress>("a[0][name=x].b");
    }

    SECTION("escaped selector text") {
        auto addr = IdentityAddress::parse("[k=a\\=b]");
        REQUIRE(std::get<KeySelector>(addr[0]).components[0].value == "a=b");

        KeySelector selector;
        selector.components.push_back({"na,me", "v]"});
        REQUIRE(selector_to_string(selector) == "[na\\,me=v\\]]");
    }

    SECTION("from_position keeps literal indices") {
        auto addr = IdentityAddress::from_position(PositionAddress::parse("items[1].v"));
        REQUIRE(addr == IdentityAddress::parse("items[1].v"));
        REQUIRE_FALSE(addr.has_selectors());
    }

    SECTION("child with selector") {
        KeySelector selector;
        selector.components.push_back({"id", "c"});
        auto addr = IdentityAddress{}.child("items").child(selector).child("v");
        REQUIRE(addr.to_string() == "items[id=c].v");
    }
}

TEST_CASE("IdentityAddress errors", "[address][identity][error]") {
    auto validate = [](const std::string& t) { return validate_identity_address(t); };

    check_error<IdentityAddress>(validate, "items[id]", AddressErrorCode::InvalidSelector, 6);
    check_error<IdentityAddress>(validate, "items[=b]", AddressErrorCode::InvalidSelector, 6);
    check_error<IdentityAddress>(validate, "items[id=a=b]", AddressErrorCode::InvalidSelector, 10);
    check_error<IdentityAddress>(validate, "items[id=b:1]", AddressErrorCode::InvalidOccurrence, 10);
    check_error<IdentityAddress>(validate, "items[id=b::]", AddressErrorCode::InvalidOccurrence, 11);
    check_error<IdentityAddress>(validate, "items[id=b::01]", AddressErrorCode::InvalidOccurrence, 12);
    check_error<IdentityAddress>(validate, "items[]", AddressErrorCode::UnexpectedWildcard, 5);
    check_error<IdentityAddress>(validate, "*.v", AddressErrorCode::UnexpectedWildcard, 0);
}

// ============================================================
// ScopedAddress
// ============================================================

TEST_CASE("ScopedAddress", "[address][scoped]") {
    SECTION("parse and print") {
        auto addr = ScopedAddress::parse("right:items[2].v");
        REQUIRE(addr.side == Side::Right);
        REQUIRE(addr.address == PositionAddress::parse("items[2].v"));
        REQUIRE(addr.to_string() == "right:items[2].v");
        REQUIRE(ScopedAddress::parse("left:").address.is_root());
    }

    SECTION("sides") {
        REQUIRE(side_name(Side::Left) == "left");
        REQUIRE(other_side(Side::Left) == Side::Right);
    }

    SECTION("errors carry offsets into the whole text") {
        auto validate = [](const std::string& t) { return validate_scoped_address(t); };
        check_error<ScopedAddress>(validate, "middle:items", AddressErrorCode::InvalidSide, 0);
        check_error<ScopedAddress>(validate, "items", AddressErrorCode::InvalidSide, 0);
        check_error<ScopedAddress>(validate, "right:items[", AddressErrorCode::UnterminatedBracket, 11);
    }

    SECTION("sides hash apart") {
        std::unordered_set<ScopedAddress> set;
        set.insert(ScopedAddress::parse("left:items"));
        set.insert(ScopedAddress::parse("right:items"));
        set.insert(ScopedAddress::parse("left:items"));
        REQUIRE(set.size() == 2);
    }
}

// ============================================================
// ArrayPattern
// ============================================================

TEST_CASE("ArrayPattern", "[address][array_pattern]") {
    SECTION("nested arrays") {
        auto pattern = ArrayPattern::parse("items[].tags[]");
        REQUIRE(pattern.array_depth() == 2);
        REQUIRE(pattern.is_valid_target());
        REQUIRE(pattern.target_array_field() == std::optional<std::string>{"tags"});
        REQUIRE(pattern.parent_array()->to_string() == "items[]");
        REQUIRE_FALSE(pattern.parent_array()->parent_array().has_value());
    }

    SECTION("[*] is the same as []") {
        REQUIRE(ArrayPattern::parse("items[*]") == ArrayPattern::parse("items[]"));
        REQUIRE(ArrayPattern::parse("items[*]").to_string() == "items[]");
    }

    SECTION("non-target patterns") {
        auto pattern = ArrayPattern::parse("items[].meta");
        REQUIRE_FALSE(pattern.is_valid_target());
        REQUIRE_FALSE(pattern.target_array_field().has_value());

        auto root_array = ArrayPattern::parse("[]");
        REQUIRE(root_array.is_valid_target());
        REQUIRE_FALSE(root_array.target_array_field().has_value());
    }

    SECTION("building") {
        auto pattern = ArrayPattern{}.child("groups").any_element().child("members").any_element();
        REQUIRE(pattern.to_string() == "groups[].members[]");
    }

    SECTION("literal array segments are rejected") {
        auto result = validate_array_pattern("items[0]");
        REQUIRE_FALSE(result);
        REQUIRE(result.error_code == AddressErrorCode::UnexpectedSegment);
        REQUIRE_THROWS_AS(validate_array_pattern("items[id=a]").get(), AddressError);
    }
}

// ============================================================
// ParseResult / hashing
// ============================================================

TEST_CASE("ParseResult", "[address][validate]") {
    SECTION("success") {
        auto result = validate_identity_address("items[id=a]");
        REQUIRE(result);
        REQUIRE(result.error_code == AddressErrorCode::Success);
        REQUIRE(result.get().to_string() == "items[id=a]");
    }

    SECTION("get() rethrows the error") {
        auto result = validate_position_address("a..b");
        try {
            (void)result.get();
            FAIL("expected AddressError");
        } catch (const AddressError& e) {
            REQUIRE(e.code() == AddressErrorCode::EmptySegment);
            REQUIRE(e.offset() == 2);
            REQUIRE(std::string(e.what()).find("offset 2") != std::string::npos);
        }
    }
}

TEST_CASE("Address hashing", "[address][hash]") {
    std::unordered_set<IdentityAddress> set;
    set.insert(IdentityAddress::parse("items[id=a]"));
    set.insert(IdentityAddress::parse("items[id=a]"));
    set.insert(IdentityAddress::parse("items[id=a::1]"));
    set.insert(IdentityAddress::parse("items[0]"));
    REQUIRE(set.size() == 3);
    REQUIRE(set.count(IdentityAddress::parse("items[0]")) == 1);
}
