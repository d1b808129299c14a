#pragma once

#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata::ui {

// Stable per-frame widget identifier
class WidgetId {
public:
    constexpr WidgetId() = default;
    constexpr explicit WidgetId(uint64_t value) : m_value(value) {}

    constexpr uint64_t value() const { return m_value; }
    constexpr bool is_valid() const { return m_value != 0; }

    constexpr bool operator==(const WidgetId& other) const { return m_value == other.m_value; }
    constexpr bool operator!=(const WidgetId& other) const { return m_value != other.m_value; }
    constexpr bool operator<(const WidgetId& other) const { return m_value < other.m_value; }

private:
    uint64_t m_value = 0;
};

// Optional caller-supplied disambiguator (loop index, stable string key).
// A keyed widget's id does not depend on its position among its siblings.
class WidgetKey {
public:
    WidgetKey() = default;
    WidgetKey(int key) : m_key(static_cast<uint64_t>(static_cast<int64_t>(key))) {}
    WidgetKey(uint32_t key) : m_key(uint64_t{key}) {}
    WidgetKey(uint64_t key) : m_key(key) {}
    WidgetKey(const char* key) : m_key(std::string(key)) {}
    WidgetKey(std::string_view key) : m_key(std::string(key)) {}
    WidgetKey(std::string key) : m_key(std::move(key)) {}

    bool empty() const { return std::holds_alternative<std::monostate>(m_key); }

    // Fold the key into a hash seeded with the parent id
    uint64_t combine(uint64_t parent) const;

private:
    std::variant<std::monostate, uint64_t, std::string> m_key;
};

// Thrown on push/pop imbalance
class IdStackError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

// Hierarchical id generation.
// Each scope remembers its own id and how many children it has handed out;
// a child's id hashes the parent id with either its ordinal or its key.
class IdStack {
public:
    IdStack();

    // Clear to the root scope; call at the start of every frame
    void reset();

    // Id for the next widget in the current scope
    WidgetId next_id(const WidgetKey& key = {});

    // Enter a container: allocates the container's id and makes it the parent
    // of subsequent ids
    WidgetId push_scope(const WidgetKey& key = {});
    // Enter a scope for an id that was already allocated
    void push_id(WidgetId id);
    void pop_scope();

    WidgetId current() const { return m_scopes.back().id; }
    size_t depth() const { return m_scopes.size() - 1; }

    // Throws IdStackError if any scope is still open
    void check_balanced() const;

private:
    struct Scope {
        WidgetId id;
        uint32_t child_index = 0;
    };

    std::vector<Scope> m_scopes;
};

} // namespace strata::ui

template<>
struct std::hash<strata::ui::WidgetId> {
    size_t operator()(const strata::ui::WidgetId& id) const noexcept {
        return std::hash<uint64_t>{}(id.value());
    }
};
