#include <strata/ui/widget_id.hpp>
#include <strata/core/log.hpp>
#include <strata/core/string_hash.hpp>

namespace strata::ui {

using core::SequentialHash;

namespace {

// Tags keep ordinal and keyed ids in separate hash domains
constexpr uint64_t ORDINAL_TAG = 0x6f7264;  // "ord"
constexpr uint64_t INT_KEY_TAG = 0x696b65;  // "ike"
constexpr uint64_t STR_KEY_TAG = 0x736b65;  // "ske"
constexpr uint64_t ROOT_SEED = 0x73747261;  // "stra"

WidgetId nonzero(uint64_t value) {
    // Zero is reserved for "no widget"
    return WidgetId(value == 0 ? 1 : value);
}

} // anonymous namespace

uint64_t WidgetKey::combine(uint64_t parent) const {
    SequentialHash hash(parent);
    if (const auto* number = std::get_if<uint64_t>(&m_key)) {
        hash.add(INT_KEY_TAG).add(*number);
    } else if (const auto* text = std::get_if<std::string>(&m_key)) {
        hash.add(STR_KEY_TAG).add(std::string_view(*text));
    }
    return hash.value();
}

IdStack::IdStack() {
    reset();
}

void IdStack::reset() {
    m_scopes.clear();
    m_scopes.push_back(Scope{nonzero(SequentialHash(ROOT_SEED).value()), 0});
}

WidgetId IdStack::next_id(const WidgetKey& key) {
    Scope& scope = m_scopes.back();
    uint32_t ordinal = scope.child_index++;

    if (!key.empty()) {
        return nonzero(key.combine(scope.id.value()));
    }
    return nonzero(SequentialHash(scope.id.value()).add(ORDINAL_TAG).add(uint64_t{ordinal}).value());
}

WidgetId IdStack::push_scope(const WidgetKey& key) {
    WidgetId id = next_id(key);
    push_id(id);
    return id;
}

void IdStack::push_id(WidgetId id) {
    m_scopes.push_back(Scope{id, 0});
}

void IdStack::pop_scope() {
    if (m_scopes.size() <= 1) {
        core::log(core::LogLevel::Error, "IdStack: pop_scope without matching push_scope");
        throw IdStackError("IdStack: pop_scope without matching push_scope");
    }
    m_scopes.pop_back();
}

void IdStack::check_balanced() const {
    if (depth() != 0) {
        core::log(core::LogLevel::Error, "IdStack: {} scope(s) still open at frame end", depth());
        throw IdStackError("IdStack: unbalanced scopes at frame end");
    }
}

} // namespace strata::ui
