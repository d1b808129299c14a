#include <strata/entity/entity_store.hpp>
#include <strata/core/log.hpp>
#include <algorithm>
#include <format>

namespace strata::entity {

using core::log;
using core::LogLevel;

uint32_t entity_index(EntityId id) {
    return static_cast<uint32_t>(entt::to_entity(id));
}

uint32_t entity_generation(EntityId id) {
    return static_cast<uint32_t>(entt::to_version(id));
}

std::string to_string(EntityId id) {
    if (id == entt::null) {
        return "Entity(null)";
    }
    return std::format("Entity({}v{})", entity_index(id), entity_generation(id));
}

namespace detail {

void raise_not_found(EntityId id) {
    std::string message = std::format("{} no longer exists", to_string(id));
    log(LogLevel::Error, "EntityStore: {}", message);
    throw EntityNotFoundError(id, message);
}

void raise_borrow_conflict(EntityId id, bool exclusive_requested) {
    std::string message = exclusive_requested
        ? std::format("{} is already borrowed; exclusive access refused", to_string(id))
        : std::format("{} is exclusively borrowed; read access refused", to_string(id));
    log(LogLevel::Error, "EntityStore: {}", message);
    throw EntityBorrowError(id, message);
}

void raise_type_mismatch(EntityId id, const char* requested_type) {
    std::string message = std::format("{} does not hold a value of type {}", to_string(id), requested_type);
    log(LogLevel::Error, "EntityStore: {}", message);
    throw EntityTypeError(id, message);
}

} // namespace detail

// ============================================================================
// EntityStore
// ============================================================================

EntityStore::EntityStore() = default;

EntityStore::~EntityStore() {
    if (m_live_count > 0) {
        log(LogLevel::Debug, "EntityStore: destroying store with {} live entities", m_live_count);
    }
    // Values may hold handles into this store; stop bookkeeping before the
    // registry tears the pools down
    m_closing = true;
    m_observers.clear();
}

EntityStore& EntityStore::get() {
    static EntityStore instance;
    return instance;
}

bool EntityStore::alive(EntityId id) const {
    if (id == entt::null || !m_registry.valid(id)) {
        return false;
    }
    const auto* meta = m_registry.try_get<detail::EntityMeta>(id);
    return meta && meta->strong > 0;
}

uint32_t EntityStore::strong_count(EntityId id) const {
    if (id == entt::null || !m_registry.valid(id)) return 0;
    const auto* meta = m_registry.try_get<detail::EntityMeta>(id);
    return meta ? meta->strong : 0;
}

uint32_t EntityStore::weak_count(EntityId id) const {
    if (id == entt::null || !m_registry.valid(id)) return 0;
    const auto* meta = m_registry.try_get<detail::EntityMeta>(id);
    return meta ? meta->weak : 0;
}

bool EntityStore::is_borrowed(EntityId id) const {
    if (id == entt::null || !m_registry.valid(id)) return false;
    const auto* meta = m_registry.try_get<detail::EntityMeta>(id);
    return meta && (meta->exclusive || meta->shared_borrows > 0);
}

void EntityStore::retain(EntityId id) {
    if (!alive(id)) {
        detail::raise_not_found(id);
    }
    ++m_registry.get<detail::EntityMeta>(id).strong;
}

void EntityStore::release(EntityId id) {
    if (m_closing || id == entt::null || !m_registry.valid(id)) return;
    auto* meta = m_registry.try_get<detail::EntityMeta>(id);
    if (!meta || meta->strong == 0) {
        return;
    }

    if (--meta->strong > 0) {
        return;
    }

    --m_live_count;
    if (meta->exclusive || meta->shared_borrows > 0) {
        // Dropped from inside its own access window; reclaim once the borrow ends
        meta->pending_destroy = true;
        return;
    }
    schedule_destroy(id);
}

void EntityStore::retain_weak(EntityId id) {
    if (id == entt::null || !m_registry.valid(id)) return;
    if (auto* meta = m_registry.try_get<detail::EntityMeta>(id)) {
        ++meta->weak;
    }
}

void EntityStore::release_weak(EntityId id) {
    if (m_closing || id == entt::null || !m_registry.valid(id)) return;
    if (auto* meta = m_registry.try_get<detail::EntityMeta>(id)) {
        if (meta->weak > 0) --meta->weak;
    }
}

void EntityStore::schedule_destroy(EntityId id) {
    m_pending_destroy.push_back(id);
    if (m_draining) {
        return;
    }

    // Destroying a value can drop the last handle to other entities; those
    // land in the queue and are reclaimed by this same loop
    m_draining = true;
    while (!m_pending_destroy.empty()) {
        EntityId next = m_pending_destroy.back();
        m_pending_destroy.pop_back();
        if (!m_registry.valid(next)) continue;

        m_observers.erase(next);
        m_changed.erase(std::remove(m_changed.begin(), m_changed.end(), next), m_changed.end());
        m_registry.destroy(next);
        log(LogLevel::Trace, "EntityStore: reclaimed {}", to_string(next).c_str());
    }
    m_draining = false;
}

// ============================================================================
// Borrows
// ============================================================================

EntityStore::BorrowGuard::BorrowGuard(EntityStore& store_, EntityId id_, bool exclusive_)
    : store(store_), id(id_), exclusive(exclusive_) {
    store.begin_borrow(id, exclusive);
}

EntityStore::BorrowGuard::~BorrowGuard() {
    store.end_borrow(id, exclusive);
}

void EntityStore::begin_borrow(EntityId id, bool exclusive) {
    auto& meta = m_registry.get<detail::EntityMeta>(id);
    if (meta.exclusive || (exclusive && meta.shared_borrows > 0)) {
        detail::raise_borrow_conflict(id, exclusive);
    }
    if (exclusive) {
        meta.exclusive = true;
    } else {
        ++meta.shared_borrows;
    }
}

void EntityStore::end_borrow(EntityId id, bool exclusive) {
    if (m_closing) return;
    auto* meta = m_registry.valid(id) ? m_registry.try_get<detail::EntityMeta>(id) : nullptr;
    if (!meta) return;

    if (exclusive) {
        meta->exclusive = false;
    } else if (meta->shared_borrows > 0) {
        --meta->shared_borrows;
    }

    if (meta->pending_destroy && !meta->exclusive && meta->shared_borrows == 0) {
        meta->pending_destroy = false;
        schedule_destroy(id);
    }
}

// ============================================================================
// Observation
// ============================================================================

core::ScopedConnection EntityStore::observe(EntityId id, ObserverCallback callback) {
    if (!alive(id)) {
        detail::raise_not_found(id);
    }
    uint64_t subscription = m_next_subscription++;
    m_observers[id].push_back(Observer{subscription, std::move(callback)});
    return core::ScopedConnection([this, id, subscription]() {
        unsubscribe(id, subscription);
    });
}

void EntityStore::unsubscribe(EntityId id, uint64_t subscription) {
    auto it = m_observers.find(id);
    if (it == m_observers.end()) return;

    auto& observers = it->second;
    observers.erase(
        std::remove_if(observers.begin(), observers.end(),
            [subscription](const Observer& o) { return o.subscription == subscription; }),
        observers.end()
    );
    if (observers.empty()) {
        m_observers.erase(it);
    }
}

void EntityStore::mark_changed(EntityId id) {
    if (std::find(m_changed.begin(), m_changed.end(), id) == m_changed.end()) {
        m_changed.push_back(id);
    }
}

void EntityStore::flush() {
    std::vector<EntityId> changed;
    changed.swap(m_changed);

    for (EntityId id : changed) {
        if (!alive(id)) continue;

        auto it = m_observers.find(id);
        if (it == m_observers.end()) continue;

        m_invalidation_requested = true;

        // Copy: a callback may subscribe or unsubscribe while we iterate
        std::vector<Observer> observers = it->second;
        for (auto& observer : observers) {
            if (observer.callback) {
                observer.callback(id);
            }
        }
    }
}

} // namespace strata::entity
