// address_resolver.cpp
// Identity <-> position address conversion

#include <struct_diff/address_resolver.h>

namespace struct_diff {

namespace {

/// Selector fields must name the same key the run detected, in the same order
bool same_key(const KeySelector& selector, const std::vector<std::string>& key)
{
    if (selector.components.size() != key.size()) {
        return false;
    }
    for (std::size_t i = 0; i < key.size(); ++i) {
        if (selector.components[i].field != key[i]) {
            return false;
        }
    }
    return true;
}

bool tuple_equals(const std::vector<std::string>& tuple, const KeySelector& selector)
{
    for (std::size_t i = 0; i < tuple.size(); ++i) {
        if (tuple[i] != selector.components[i].value) {
            return false;
        }
    }
    return true;
}

/// Index of the element `selector` names, or nullopt
std::optional<std::size_t> find_element(const ValueArray& elements,
                                        const std::vector<std::string>& key,
                                        const KeySelector& selector)
{
    const std::size_t wanted = selector.occurrence.value_or(0);
    std::size_t seen = 0;
    for (std::size_t i = 0; i < elements.size(); ++i) {
        auto tuple = key_tuple(elements[i].get(), key);
        if (!tuple || !tuple_equals(*tuple, selector)) {
            continue;
        }
        if (seen++ == wanted) {
            return i;
        }
    }
    return std::nullopt;
}

} // anonymous namespace

std::optional<PositionAddress> resolve_identity_to_position(const IdentityAddress& address,
                                                            const Value& document,
                                                            const IdentityKeyIndex& keys)
{
    PositionAddress position;
    IdentityAddress prefix;
    const Value* current = &document;

    for (const auto& segment : address) {
        const Value* next = std::visit([&](const auto& seg) -> const Value* {
            using T = std::decay_t<decltype(seg)>;
            if constexpr (std::is_same_v<T, std::string>) {
                const Value* child = current->find(seg);
                if (child) {
                    position.push_back(seg);
                }
                return child;
            } else if constexpr (std::is_same_v<T, std::size_t>) {
                const auto* elements = current->get_if<ValueArray>();
                // An index never addresses an element of a keyed array
                if (!elements || keys.key_for(prefix) || seg >= elements->size()) {
                    return nullptr;
                }
                position.push_back(seg);
                return &(*elements)[seg].get();
            } else if constexpr (std::is_same_v<T, KeySelector>) {
                const auto* elements = current->get_if<ValueArray>();
                const auto* key = keys.key_for(prefix);
                if (!elements || !key || !same_key(seg, *key)) {
                    return nullptr;
                }
                auto index = find_element(*elements, *key, seg);
                if (!index) {
                    return nullptr;
                }
                position.push_back(*index);
                return &(*elements)[*index].get();
            } else {
                static_assert(detail::always_false<T>, "unhandled identity segment");
            }
        }, segment);

        if (!next) {
            return std::nullopt;
        }
        prefix.push_back(segment);
        current = next;
    }
    return position;
}

std::optional<PositionAddress> resolve_identity_to_position(const IdentityAddress& address,
                                                            const Value& document,
                                                            const std::vector<IdentityKeyInfo>& keys)
{
    return resolve_identity_to_position(address, document, IdentityKeyIndex{keys});
}

ResolvedPair resolve_both_sides(const IdentityAddress& address,
                                const Value& left,
                                const Value& right,
                                const IdentityKeyIndex& keys)
{
    return ResolvedPair{resolve_identity_to_position(address, left, keys),
                        resolve_identity_to_position(address, right, keys)};
}

ResolvedPair resolve_both_sides(const IdentityAddress& address,
                                const Value& left,
                                const Value& right,
                                const std::vector<IdentityKeyInfo>& keys)
{
    return resolve_both_sides(address, left, right, IdentityKeyIndex{keys});
}

std::optional<IdentityAddress> position_to_identity(const PositionAddress& address,
                                                    const Value& document,
                                                    const IdentityKeyIndex& keys)
{
    IdentityAddress identity;
    const Value* current = &document;

    for (const auto& segment : address) {
        if (const auto* field = std::get_if<std::string>(&segment)) {
            current = current->find(*field);
            if (!current) {
                return std::nullopt;
            }
            identity.push_back(*field);
            continue;
        }

        const std::size_t index = std::get<std::size_t>(segment);
        const auto* elements = current->get_if<ValueArray>();
        if (!elements || index >= elements->size()) {
            return std::nullopt;
        }

        const auto* key = keys.key_for(identity);
        if (!key) {
            identity.push_back(index);
            current = &(*elements)[index].get();
            continue;
        }

        auto tuple = key_tuple((*elements)[index].get(), *key);
        if (!tuple) {
            return std::nullopt;
        }
        std::size_t occurrence = 0;
        std::size_t total = 0;
        for (std::size_t i = 0; i < elements->size(); ++i) {
            auto other = key_tuple((*elements)[i].get(), *key);
            if (other && *other == *tuple) {
                if (i < index) {
                    ++occurrence;
                }
                ++total;
            }
        }

        KeySelector selector;
        for (std::size_t i = 0; i < key->size(); ++i) {
            selector.components.push_back({(*key)[i], (*tuple)[i]});
        }
        if (total > 1) {
            selector.occurrence = occurrence;
        }
        identity.push_back(std::move(selector));
        current = &(*elements)[index].get();
    }
    return identity;
}

std::optional<IdentityAddress> position_to_identity(const PositionAddress& address,
                                                    const Value& document,
                                                    const std::vector<IdentityKeyInfo>& keys)
{
    return position_to_identity(address, document, IdentityKeyIndex{keys});
}

const Value* value_at(const Value& document, const PositionAddress& address)
{
    const Value* current = &document;
    for (const auto& segment : address) {
        current = std::visit([current](const auto& seg) { return current->find(seg); }, segment);
        if (!current) {
            return nullptr;
        }
    }
    return current;
}

const Value* value_at(const Value& left, const Value& right, const ScopedAddress& address)
{
    return value_at(address.side == Side::Left ? left : right, address.address);
}

} // namespace struct_diff
