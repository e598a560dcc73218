// pattern.cpp
// Address generalization, glob matching and the ignore list

#include <struct_diff/pattern.h>

#include <algorithm>
#include <type_traits>

namespace struct_diff {

// ============================================================
// Generalization
// ============================================================

ArrayPattern generalize(const IdentityAddress& address)
{
    ArrayPattern pattern;
    for (const auto& segment : address) {
        if (const auto* field = std::get_if<std::string>(&segment)) {
            pattern.push_back(*field);
        } else {
            pattern.push_back(AnyElement{});
        }
    }
    return pattern;
}

ArrayPattern generalize(const PositionAddress& address)
{
    return generalize(IdentityAddress::from_position(address));
}

ArrayPattern element_pattern(const IdentityKeyInfo& info)
{
    return generalize(info.identity_address).any_element();
}

std::map<std::string, std::vector<IdentityKeyInfo>> group_identity_keys(const std::vector<IdentityKeyInfo>& infos)
{
    std::map<std::string, std::vector<IdentityKeyInfo>> groups;
    for (const auto& info : infos) {
        groups[element_pattern(info).to_string()].push_back(info);
    }
    return groups;
}

// ============================================================
// AddressPattern
// ============================================================

namespace {

template <typename T, typename Variant>
struct variant_has;

template <typename T, typename... Ts>
struct variant_has<T, std::variant<Ts...>> : std::bool_constant<(std::is_same_v<T, Ts> || ...)> {};

template <typename Segment>
bool segment_matches(const PatternSegment& pattern, const Segment& segment)
{
    return std::visit([&segment](const auto& p) -> bool {
        using P = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<P, AnySegment>) {
            return true;
        } else if constexpr (std::is_same_v<P, AnyElement>) {
            return !std::holds_alternative<std::string>(segment);
        } else if constexpr (variant_has<P, Segment>::value) {
            const auto* literal = std::get_if<P>(&segment);
            return literal && *literal == p;
        } else {
            // e.g. a key selector against a position address
            return false;
        }
    }, pattern);
}

} // anonymous namespace

AddressPattern AddressPattern::parse(std::string_view text)
{
    auto scanned = detail::scan_address(text);

    AddressPattern pattern;
    pattern.segments_ = std::move(scanned.segments);
    pattern.open_ended_ = scanned.open_ended;
    pattern.text_ = std::string(text);
    return pattern;
}

template <typename Address>
bool AddressPattern::matches_segments(const Address& address) const
{
    const auto& segments = address.segments();
    if (open_ended_ ? segments.size() < segments_.size() : segments.size() != segments_.size()) {
        return false;
    }
    for (std::size_t i = 0; i < segments_.size(); ++i) {
        if (!segment_matches(segments_[i], segments[i])) {
            return false;
        }
    }
    return true;
}

bool AddressPattern::matches(const PositionAddress& address) const
{
    return matches_segments(address);
}

bool AddressPattern::matches(const IdentityAddress& address) const
{
    return matches_segments(address);
}

ParseResult<AddressPattern> validate_pattern(std::string_view text)
{
    ParseResult<AddressPattern> result;
    try {
        result.address = AddressPattern::parse(text);
        result.success = true;
    } catch (const AddressError& e) {
        result.error_code = e.code();
        result.error_message = e.description();
        result.error_offset = e.offset();
    }
    return result;
}

namespace {

template <typename Address>
bool matches_text(const Address& address, std::string_view pattern)
{
    auto parsed = validate_pattern(pattern);
    if (!parsed) {
        detail::log_pattern_error("matches", pattern, parsed.error_message);
        return false;
    }
    return parsed.address->matches(address);
}

} // anonymous namespace

bool matches(const PositionAddress& address, std::string_view pattern)
{
    return matches_text(address, pattern);
}

bool matches(const IdentityAddress& address, std::string_view pattern)
{
    return matches_text(address, pattern);
}

// ============================================================
// IgnoreList
// ============================================================

std::vector<IgnoreList::Entry>::iterator IgnoreList::find_entry(const std::string& id)
{
    return std::find_if(entries_.begin(), entries_.end(), [&id](const Entry& e) { return e.id == id; });
}

void IgnoreList::add(std::string id, std::string_view pattern)
{
    auto compiled = AddressPattern::parse(pattern);
    auto it = find_entry(id);
    if (it != entries_.end()) {
        it->pattern = std::move(compiled);
        return;
    }
    entries_.push_back(Entry{std::move(id), std::move(compiled)});
}

std::string IgnoreList::add(std::string_view pattern)
{
    std::string id;
    do {
        id = "pattern_" + std::to_string(next_id_++);
    } while (contains(id));
    add(id, pattern);
    return id;
}

bool IgnoreList::update(const std::string& id, std::string_view pattern)
{
    auto it = find_entry(id);
    if (it == entries_.end()) {
        return false;
    }
    it->pattern = AddressPattern::parse(pattern);
    return true;
}

bool IgnoreList::remove(const std::string& id)
{
    auto it = find_entry(id);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

bool IgnoreList::contains(const std::string& id) const
{
    return std::any_of(entries_.begin(), entries_.end(), [&id](const Entry& e) { return e.id == id; });
}

bool IgnoreList::is_ignored(const IdentityAddress& address) const
{
    return std::any_of(entries_.begin(), entries_.end(), [&address](const Entry& e) {
        return e.pattern.matches(address);
    });
}

bool IgnoreList::is_ignored(const PositionAddress& address) const
{
    return std::any_of(entries_.begin(), entries_.end(), [&address](const Entry& e) {
        return e.pattern.matches(address);
    });
}

bool IgnoreList::is_ignored(const DiffRecord& record) const
{
    return is_ignored(record.identity_address)
        || (record.left_address && is_ignored(*record.left_address))
        || (record.right_address && is_ignored(*record.right_address));
}

std::vector<DiffRecord> IgnoreList::filter(const std::vector<DiffRecord>& diffs) const
{
    std::vector<DiffRecord> kept;
    kept.reserve(diffs.size());
    std::copy_if(diffs.begin(), diffs.end(), std::back_inserter(kept), [this](const DiffRecord& d) {
        return !is_ignored(d);
    });
    return kept;
}

} // namespace struct_diff
