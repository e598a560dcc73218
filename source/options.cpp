// options.cpp
// JSON configuration loading

#include <struct_diff/options.h>
#include <struct_diff/serialization.h>

#include <stdexcept>

namespace struct_diff {

namespace {

[[noreturn]] void invalid(const std::string& key, const std::string& reason)
{
    throw std::invalid_argument("config: \"" + key + "\" " + reason);
}

double read_ratio(const Value& val, const std::string& key)
{
    if (!val.is_number()) {
        invalid(key, "must be a number");
    }
    const double ratio = val.as_number();
    if (!(ratio >= 0.0 && ratio <= 1.0)) {
        invalid(key, "must lie in [0, 1]");
    }
    return ratio;
}

std::size_t read_count(const Value& val, const std::string& key)
{
    if (!val.is_number()) {
        invalid(key, "must be a number");
    }
    const double number = val.as_number();
    if (number < 0.0 || number != static_cast<double>(val.as_int64())) {
        invalid(key, "must be a non-negative integer");
    }
    return static_cast<std::size_t>(val.as_int64());
}

std::vector<std::string> read_strings(const Value& val, const std::string& key)
{
    const auto* elements = val.get_if<ValueArray>();
    if (!elements) {
        invalid(key, "must be an array of strings");
    }
    std::vector<std::string> result;
    result.reserve(elements->size());
    for (const auto& box : *elements) {
        if (!box.get().is_string()) {
            invalid(key, "must be an array of strings");
        }
        result.push_back(box.get().as_string());
    }
    return result;
}

const ValueObject& read_object(const Value& val, const std::string& key)
{
    const auto* object = val.get_if<ValueObject>();
    if (!object) {
        invalid(key, "must be an object");
    }
    return *object;
}

DetectorOptions read_detector(const Value& val)
{
    DetectorOptions options;
    for (const auto& field : read_object(val, "detector")) {
        const auto& name = field.name;
        const Value& member = field.value.get();
        if (name == "minArraySize") {
            options.min_array_size = read_count(member, name);
        } else if (name == "minOverlapRatio") {
            options.min_overlap_ratio = read_ratio(member, name);
        } else if (name == "minDistinctRatio") {
            options.min_distinct_ratio = read_ratio(member, name);
        } else if (name == "maxCompositeArity") {
            options.max_composite_arity = read_count(member, name);
            if (options.max_composite_arity < 2 || options.max_composite_arity > 3) {
                invalid(name, "must be 2 or 3");
            }
        } else if (name == "maxCompositeCandidates") {
            options.max_composite_candidates = read_count(member, name);
        } else if (name == "preferredFields") {
            options.preferred_fields = read_strings(member, name);
        } else {
            detail::log_key_error("options_from_value", name, "unknown detector option, ignored");
        }
    }
    return options;
}

} // anonymous namespace

DiffConfig options_from_value(const Value& config)
{
    DiffConfig result;
    for (const auto& field : read_object(config, "<root>")) {
        const auto& name = field.name;
        const Value& member = field.value.get();
        if (name == "detector") {
            result.compare.detector = read_detector(member);
        } else if (name == "expandOneSided") {
            if (!member.is_bool()) {
                invalid(name, "must be a boolean");
            }
            result.compare.expand_one_sided = member.as_bool();
        } else if (name == "ignore") {
            result.ignore = read_strings(member, name);
            for (const auto& pattern : result.ignore) {
                auto parsed = validate_pattern(pattern);
                if (!parsed) {
                    invalid(name, "holds malformed pattern \"" + pattern + "\": " + parsed.error_message);
                }
            }
        } else {
            detail::log_key_error("options_from_value", name, "unknown option, ignored");
        }
    }
    return result;
}

DiffConfig load_options(const std::string& file_path)
{
    return options_from_value(load_json_file(file_path));
}

} // namespace struct_diff
