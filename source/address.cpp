// address.cpp
// Address grammar: scanning, validation and text rendering

#include <struct_diff/address.h>

#include <algorithm>
#include <charconv>

namespace struct_diff {

std::string_view error_code_name(AddressErrorCode code) noexcept
{
    switch (code) {
        case AddressErrorCode::Success:             return "Success";
        case AddressErrorCode::EmptySegment:        return "EmptySegment";
        case AddressErrorCode::UnexpectedCharacter: return "UnexpectedCharacter";
        case AddressErrorCode::InvalidEscape:       return "InvalidEscape";
        case AddressErrorCode::UnterminatedBracket: return "UnterminatedBracket";
        case AddressErrorCode::InvalidIndex:        return "InvalidIndex";
        case AddressErrorCode::InvalidSelector:     return "InvalidSelector";
        case AddressErrorCode::InvalidOccurrence:   return "InvalidOccurrence";
        case AddressErrorCode::UnexpectedWildcard:  return "UnexpectedWildcard";
        case AddressErrorCode::UnexpectedSegment:   return "UnexpectedSegment";
        case AddressErrorCode::InvalidSide:         return "InvalidSide";
    }
    return "Unknown";
}

AddressError::AddressError(AddressErrorCode code, std::size_t offset, const std::string& description)
    : std::invalid_argument(description + " at offset " + std::to_string(offset))
    , code_(code)
    , offset_(offset)
    , description_(description)
{}

std::vector<std::string> KeySelector::fields() const
{
    std::vector<std::string> result;
    result.reserve(components.size());
    for (const auto& component : components) {
        result.push_back(component.field);
    }
    return result;
}

// ============================================================
// Scanner
// ============================================================

namespace {

constexpr std::string_view kFieldSpecials   = "\\.[]\"*";
constexpr std::string_view kBracketSpecials = "\\[]=:,";

[[noreturn]] void fail(AddressErrorCode code, std::size_t offset, const std::string& description)
{
    throw AddressError(code, offset, description);
}

struct BracketChar {
    char c;
    bool escaped;
    std::size_t offset;

    [[nodiscard]] bool is(char expected) const noexcept { return !escaped && c == expected; }
    [[nodiscard]] bool is_digit() const noexcept { return !escaped && c >= '0' && c <= '9'; }
};

std::size_t parse_decimal(const std::vector<BracketChar>& chars, std::size_t first, std::size_t last,
                          AddressErrorCode code, const char* what)
{
    if (first == last) {
        fail(code, chars.empty() ? 0 : chars[std::min(first, chars.size() - 1)].offset,
             std::string("expected digits in ") + what);
    }
    std::string digits;
    for (std::size_t i = first; i < last; ++i) {
        if (!chars[i].is_digit()) {
            fail(code, chars[i].offset, std::string("non-digit in ") + what);
        }
        digits += chars[i].c;
    }
    if (digits.size() > 1 && digits[0] == '0') {
        fail(code, chars[first].offset, std::string("leading zero in ") + what);
    }
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        fail(code, chars[first].offset, std::string(what) + " out of range");
    }
    return value;
}

class AddressScanner {
public:
    explicit AddressScanner(std::string_view text) : text_(text) {}

    detail::ScannedAddress scan()
    {
        const std::size_t n = text_.size();
        bool first = true;
        while (pos_ < n && !result_.open_ended) {
            if (text_[pos_] == '[') {
                scan_bracket();
                first = false;
                continue;
            }
            if (!first) {
                const char c = text_[pos_];
                if (c == '*' && pos_ + 1 == n) {
                    // "[0]*": trailing wildcard after a bracket
                    result_.open_ended = true;
                    ++pos_;
                    break;
                }
                if (c != '.') {
                    fail(AddressErrorCode::UnexpectedCharacter, pos_,
                         std::string("expected '.' or '[' but found '") + c + "'");
                }
                ++pos_;
            }
            scan_field();
            first = false;
        }
        return std::move(result_);
    }

private:
    std::string_view text_;
    std::size_t pos_ = 0;
    detail::ScannedAddress result_;

    void push(PatternSegment segment, std::size_t offset)
    {
        result_.segments.push_back(std::move(segment));
        result_.offsets.push_back(offset);
    }

    void scan_field()
    {
        const std::size_t n = text_.size();
        const std::size_t start = pos_;

        if (text_.substr(pos_, 2) == "\"\"") {
            pos_ += 2;
            if (pos_ < n && text_[pos_] != '.' && text_[pos_] != '[') {
                fail(AddressErrorCode::UnexpectedCharacter, pos_, "unexpected character after '\"\"'");
            }
            push(std::string{}, start);
            return;
        }

        std::string name;
        while (pos_ < n) {
            const char c = text_[pos_];
            if (c == '.' || c == '[') {
                break;
            }
            if (c == '\\') {
                if (pos_ + 1 >= n || kFieldSpecials.find(text_[pos_ + 1]) == std::string_view::npos) {
                    fail(AddressErrorCode::InvalidEscape, pos_, "invalid escape in field name");
                }
                name += text_[pos_ + 1];
                pos_ += 2;
                continue;
            }
            if (c == '*') {
                if (pos_ == start) {
                    if (pos_ + 1 == n || text_[pos_ + 1] == '.' || text_[pos_ + 1] == '[') {
                        ++pos_;
                        push(AnySegment{}, start);
                        return;
                    }
                } else if (pos_ + 1 == n) {
                    ++pos_;
                    result_.open_ended = true;
                    break;
                }
                fail(AddressErrorCode::UnexpectedWildcard, pos_,
                     "'*' must be a whole segment or end the pattern");
            }
            if (c == ']' || c == '"') {
                fail(AddressErrorCode::UnexpectedCharacter, pos_,
                     std::string("unescaped '") + c + "' in field name");
            }
            name += c;
            ++pos_;
        }

        if (name.empty()) {
            fail(AddressErrorCode::EmptySegment, start, "empty field name");
        }
        push(std::move(name), start);
    }

    void scan_bracket()
    {
        const std::size_t n = text_.size();
        const std::size_t start = pos_;
        ++pos_;

        std::vector<BracketChar> inner;
        bool closed = false;
        while (pos_ < n) {
            const char c = text_[pos_];
            if (c == ']') {
                closed = true;
                ++pos_;
                break;
            }
            if (c == '[') {
                fail(AddressErrorCode::UnexpectedCharacter, pos_, "unescaped '[' inside brackets");
            }
            if (c == '\\') {
                if (pos_ + 1 >= n || kBracketSpecials.find(text_[pos_ + 1]) == std::string_view::npos) {
                    fail(AddressErrorCode::InvalidEscape, pos_, "invalid escape inside brackets");
                }
                inner.push_back({text_[pos_ + 1], true, pos_});
                pos_ += 2;
                continue;
            }
            inner.push_back({c, false, pos_});
            ++pos_;
        }
        if (!closed) {
            fail(AddressErrorCode::UnterminatedBracket, start, "missing ']'");
        }
        push(parse_bracket(inner, start), start);
    }

    static PatternSegment parse_bracket(const std::vector<BracketChar>& inner, std::size_t start)
    {
        if (inner.empty() || (inner.size() == 1 && inner[0].is('*'))) {
            return AnyElement{};
        }
        if (std::all_of(inner.begin(), inner.end(), [](const BracketChar& ch) { return ch.is_digit(); })) {
            return parse_decimal(inner, 0, inner.size(), AddressErrorCode::InvalidIndex, "array index");
        }

        KeySelector selector;
        std::size_t body_end = inner.size();

        auto colon = std::find_if(inner.begin(), inner.end(), [](const BracketChar& ch) { return ch.is(':'); });
        if (colon != inner.end()) {
            const auto k = static_cast<std::size_t>(colon - inner.begin());
            if (k + 1 >= inner.size() || !inner[k + 1].is(':')) {
                fail(AddressErrorCode::InvalidOccurrence, inner[k].offset, "expected '::' before occurrence");
            }
            selector.occurrence = parse_decimal(inner, k + 2, inner.size(),
                                                AddressErrorCode::InvalidOccurrence, "occurrence");
            body_end = k;
        }

        std::size_t component_start = 0;
        while (true) {
            std::size_t component_end = component_start;
            while (component_end < body_end && !inner[component_end].is(',')) {
                ++component_end;
            }
            const std::size_t offset = component_start < inner.size() ? inner[component_start].offset : start;

            KeyComponent component;
            bool seen_equals = false;
            for (std::size_t i = component_start; i < component_end; ++i) {
                if (inner[i].is('=')) {
                    if (seen_equals) {
                        fail(AddressErrorCode::InvalidSelector, inner[i].offset, "second '=' in key selector");
                    }
                    seen_equals = true;
                    continue;
                }
                (seen_equals ? component.value : component.field) += inner[i].c;
            }
            if (!seen_equals) {
                fail(AddressErrorCode::InvalidSelector, offset, "expected key=value inside brackets");
            }
            if (component.field.empty()) {
                fail(AddressErrorCode::InvalidSelector, offset, "empty key name in selector");
            }
            selector.components.push_back(std::move(component));

            if (component_end >= body_end) {
                break;
            }
            component_start = component_end + 1;
        }
        return selector;
    }
};

template <typename T, typename ParseFn>
ParseResult<T> validate_with(std::string_view text, ParseFn&& parse)
{
    ParseResult<T> result;
    try {
        result.address = parse(text);
        result.success = true;
    } catch (const AddressError& e) {
        result.error_code = e.code();
        result.error_message = e.description();
        result.error_offset = e.offset();
    }
    return result;
}

std::string join_segments(const auto& segments)
{
    std::string out;
    bool first = true;
    for (const auto& segment : segments) {
        std::visit([&out, first](const auto& s) {
            detail::append_segment_text(out, PatternSegment{s}, first);
        }, segment);
        first = false;
    }
    return out;
}

void reject_open_ended(const detail::ScannedAddress& scanned, std::string_view text)
{
    if (scanned.open_ended) {
        fail(AddressErrorCode::UnexpectedWildcard, text.size() - 1, "trailing '*' is only valid in match patterns");
    }
}

} // anonymous namespace

namespace detail {

ScannedAddress scan_address(std::string_view text)
{
    return AddressScanner{text}.scan();
}

void append_segment_text(std::string& out, const PatternSegment& segment, bool first)
{
    std::visit([&out, first](const auto& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, std::string>) {
            if (!first) out += '.';
            out += escape_field(s);
        } else if constexpr (std::is_same_v<T, std::size_t>) {
            out += '[';
            out += std::to_string(s);
            out += ']';
        } else if constexpr (std::is_same_v<T, KeySelector>) {
            out += selector_to_string(s);
        } else if constexpr (std::is_same_v<T, AnyElement>) {
            out += "[]";
        } else if constexpr (std::is_same_v<T, AnySegment>) {
            if (!first) out += '.';
            out += '*';
        }
    }, segment);
}

} // namespace detail

// ============================================================
// Escaping
// ============================================================

std::string escape_field(std::string_view name)
{
    if (name.empty()) {
        return "\"\"";
    }
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        if (kFieldSpecials.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string escape_bracket_text(std::string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (kBracketSpecials.find(c) != std::string_view::npos) {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string selector_to_string(const KeySelector& selector)
{
    std::string out = "[";
    for (std::size_t i = 0; i < selector.components.size(); ++i) {
        if (i > 0) out += ',';
        out += escape_bracket_text(selector.components[i].field);
        out += '=';
        out += escape_bracket_text(selector.components[i].value);
    }
    if (selector.occurrence) {
        out += "::";
        out += std::to_string(*selector.occurrence);
    }
    out += ']';
    return out;
}

// ============================================================
// PositionAddress
// ============================================================

PositionAddress PositionAddress::parse(std::string_view text)
{
    auto scanned = detail::scan_address(text);
    reject_open_ended(scanned, text);

    PositionAddress result;
    for (std::size_t i = 0; i < scanned.segments.size(); ++i) {
        const auto offset = scanned.offsets[i];
        std::visit([&result, offset](auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, std::size_t>) {
                result.push_back(std::move(s));
            } else if constexpr (std::is_same_v<T, KeySelector>) {
                fail(AddressErrorCode::UnexpectedSegment, offset, "key selector in a position address");
            } else {
                fail(AddressErrorCode::UnexpectedWildcard, offset, "wildcard in a position address");
            }
        }, scanned.segments[i]);
    }
    return result;
}

std::string PositionAddress::to_string() const
{
    return join_segments(segments_);
}

// ============================================================
// IdentityAddress
// ============================================================

IdentityAddress IdentityAddress::parse(std::string_view text)
{
    auto scanned = detail::scan_address(text);
    reject_open_ended(scanned, text);

    IdentityAddress result;
    for (std::size_t i = 0; i < scanned.segments.size(); ++i) {
        const auto offset = scanned.offsets[i];
        std::visit([&result, offset](auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, std::string> ||
                          std::is_same_v<T, std::size_t> ||
                          std::is_same_v<T, KeySelector>) {
                result.push_back(std::move(s));
            } else {
                fail(AddressErrorCode::UnexpectedWildcard, offset, "wildcard in an identity address");
            }
        }, scanned.segments[i]);
    }
    return result;
}

IdentityAddress IdentityAddress::from_position(const PositionAddress& position)
{
    IdentityAddress result;
    for (const auto& segment : position) {
        std::visit([&result](const auto& s) { result.push_back(s); }, segment);
    }
    return result;
}

bool IdentityAddress::has_selectors() const noexcept
{
    return std::any_of(segments_.begin(), segments_.end(), [](const IdentitySegment& s) {
        return std::holds_alternative<KeySelector>(s);
    });
}

std::string IdentityAddress::to_string() const
{
    return join_segments(segments_);
}

// ============================================================
// ScopedAddress
// ============================================================

ScopedAddress ScopedAddress::parse(std::string_view text)
{
    ScopedAddress result;
    std::size_t shift = 0;
    if (text.starts_with("left:")) {
        result.side = Side::Left;
        shift = 5;
    } else if (text.starts_with("right:")) {
        result.side = Side::Right;
        shift = 6;
    } else {
        fail(AddressErrorCode::InvalidSide, 0, "expected 'left:' or 'right:' prefix");
    }

    try {
        result.address = PositionAddress::parse(text.substr(shift));
    } catch (const AddressError& e) {
        throw AddressError(e.code(), e.offset() + shift, e.description());
    }
    return result;
}

std::string ScopedAddress::to_string() const
{
    std::string out{side_name(side)};
    out += ':';
    out += address.to_string();
    return out;
}

// ============================================================
// ArrayPattern
// ============================================================

ArrayPattern ArrayPattern::parse(std::string_view text)
{
    auto scanned = detail::scan_address(text);
    reject_open_ended(scanned, text);

    ArrayPattern result;
    for (std::size_t i = 0; i < scanned.segments.size(); ++i) {
        const auto offset = scanned.offsets[i];
        std::visit([&result, offset](auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, std::string> || std::is_same_v<T, AnyElement>) {
                result.push_back(std::move(s));
            } else if constexpr (std::is_same_v<T, AnySegment>) {
                fail(AddressErrorCode::UnexpectedWildcard, offset, "'*' in an array pattern");
            } else {
                fail(AddressErrorCode::UnexpectedSegment, offset, "array patterns use '[]' for every array segment");
            }
        }, scanned.segments[i]);
    }
    return result;
}

std::size_t ArrayPattern::array_depth() const noexcept
{
    return static_cast<std::size_t>(std::count_if(segments_.begin(), segments_.end(), [](const auto& s) {
        return std::holds_alternative<AnyElement>(s);
    }));
}

bool ArrayPattern::is_valid_target() const noexcept
{
    return !segments_.empty() && std::holds_alternative<AnyElement>(segments_.back());
}

std::optional<std::string> ArrayPattern::target_array_field() const
{
    if (!is_valid_target() || segments_.size() < 2) {
        return std::nullopt;
    }
    if (auto* field = std::get_if<std::string>(&segments_[segments_.size() - 2])) {
        return *field;
    }
    return std::nullopt;
}

std::optional<ArrayPattern> ArrayPattern::parent_array() const
{
    auto last = std::find_if(segments_.rbegin(), segments_.rend(), [](const auto& s) {
        return std::holds_alternative<AnyElement>(s);
    });
    if (last == segments_.rend()) {
        return std::nullopt;
    }
    auto enclosing = std::find_if(std::next(last), segments_.rend(), [](const auto& s) {
        return std::holds_alternative<AnyElement>(s);
    });
    if (enclosing == segments_.rend()) {
        return std::nullopt;
    }
    auto end = enclosing.base();  // one past the enclosing "[]"
    return ArrayPattern{container_type(segments_.begin(), end)};
}

std::string ArrayPattern::to_string() const
{
    return join_segments(segments_);
}

// ============================================================
// Validation
// ============================================================

ParseResult<PositionAddress> validate_position_address(std::string_view text)
{
    return validate_with<PositionAddress>(text, [](std::string_view t) { return PositionAddress::parse(t); });
}

ParseResult<IdentityAddress> validate_identity_address(std::string_view text)
{
    return validate_with<IdentityAddress>(text, [](std::string_view t) { return IdentityAddress::parse(t); });
}

ParseResult<ScopedAddress> validate_scoped_address(std::string_view text)
{
    return validate_with<ScopedAddress>(text, [](std::string_view t) { return ScopedAddress::parse(t); });
}

ParseResult<ArrayPattern> validate_array_pattern(std::string_view text)
{
    return validate_with<ArrayPattern>(text, [](std::string_view t) { return ArrayPattern::parse(t); });
}

} // namespace struct_diff

// ============================================================
// Hashing
// ============================================================

std::size_t std::hash<struct_diff::PositionAddress>::operator()(
    const struct_diff::PositionAddress& address) const noexcept
{
    return std::hash<std::string>{}(address.to_string());
}

std::size_t std::hash<struct_diff::IdentityAddress>::operator()(
    const struct_diff::IdentityAddress& address) const noexcept
{
    return std::hash<std::string>{}(address.to_string());
}

std::size_t std::hash<struct_diff::ScopedAddress>::operator()(
    const struct_diff::ScopedAddress& address) const noexcept
{
    const std::size_t h = std::hash<struct_diff::PositionAddress>{}(address.address);
    return address.side == struct_diff::Side::Left ? h : ~h;
}
