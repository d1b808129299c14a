#pragma once

#include <strata/entity/entity_errors.hpp>
#include <strata/core/scoped_connection.hpp>
#include <entt/entt.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace strata::entity {

class EntityStore;
template<typename T> class WeakEntity;

namespace detail {
    // Bookkeeping record stored beside every entity's state
    struct EntityMeta {
        uint32_t strong = 1;
        uint32_t weak = 0;
        uint32_t shared_borrows = 0;
        bool exclusive = false;
        bool pending_destroy = false;
    };
} // namespace detail

// Strong, reference-counted handle to persistent state of type T.
// Copying a handle increments the strong count; destroying it decrements.
// When the last strong handle goes away the state is reclaimed and every
// handle to it (strong or weak) fails lookups from then on.
template<typename T>
class Entity {
public:
    Entity() = default;
    ~Entity() { reset(); }

    Entity(const Entity& other);
    Entity& operator=(const Entity& other);
    Entity(Entity&& other) noexcept;
    Entity& operator=(Entity&& other) noexcept;

    // Drop this handle's strong reference
    void reset();

    EntityId id() const { return m_id; }
    EntityStore* store() const { return m_store; }

    // Non-null and the state is still alive
    bool valid() const;
    explicit operator bool() const { return valid(); }

    // Exclusive access for the duration of f
    template<typename F>
    decltype(auto) update(F&& f) const;

    // Shared read access for the duration of f
    template<typename F>
    decltype(auto) read(F&& f) const;

    WeakEntity<T> downgrade() const;

    bool operator==(const Entity& other) const {
        return m_store == other.m_store && m_id == other.m_id;
    }
    bool operator!=(const Entity& other) const { return !(*this == other); }

private:
    friend class EntityStore;
    template<typename> friend class WeakEntity;

    // Adopts one strong reference already counted by the store
    Entity(EntityStore* store, EntityId id) : m_store(store), m_id(id) {}

    EntityStore* m_store = nullptr;
    EntityId m_id = entt::null;
};

// Non-owning handle; resolving it after reclamation throws EntityNotFoundError
template<typename T>
class WeakEntity {
public:
    WeakEntity() = default;
    ~WeakEntity() { reset(); }

    WeakEntity(const WeakEntity& other);
    WeakEntity& operator=(const WeakEntity& other);
    WeakEntity(WeakEntity&& other) noexcept;
    WeakEntity& operator=(WeakEntity&& other) noexcept;

    void reset();

    EntityId id() const { return m_id; }
    bool expired() const;

    // Strong handle to the same state, or EntityNotFoundError
    Entity<T> upgrade() const;
    std::optional<Entity<T>> try_upgrade() const;

    bool operator==(const WeakEntity& other) const {
        return m_store == other.m_store && m_id == other.m_id;
    }

private:
    friend class Entity<T>;

    WeakEntity(EntityStore* store, EntityId id);

    EntityStore* m_store = nullptr;
    EntityId m_id = entt::null;
};

// Process-wide table of persistent entity state.
//
// Each entity owns one heap-allocated value of its creation type plus a
// bookkeeping record (strong/weak counts and borrow state). Identifiers come
// from an EnTT registry using a 64-bit identifier, so a recycled slot index
// carries a new generation and stale handles never alias new state.
//
// Thread Safety: none. The store is shared across frames and layers but only
// ever touched from the frame thread.
class EntityStore {
public:
    EntityStore();
    ~EntityStore();

    EntityStore(const EntityStore&) = delete;
    EntityStore& operator=(const EntityStore&) = delete;

    // Singleton access
    static EntityStore& get();

    template<typename T, typename... Args>
    Entity<T> create(Args&&... args) {
        auto value = std::make_unique<T>(std::forward<Args>(args)...);
        EntityId id = m_registry.create();
        m_registry.emplace<detail::EntityMeta>(id);
        m_registry.emplace<std::unique_ptr<T>>(id, std::move(value));
        ++m_live_count;
        return Entity<T>(this, id);
    }

    // Exclusive access; throws EntityBorrowError if the entity is already borrowed
    template<typename T, typename F>
    decltype(auto) with_mut(const Entity<T>& handle, F&& f) {
        EntityId id = checked_id(handle);
        T& value = resolve<T>(id);
        BorrowGuard guard(*this, id, true);
        mark_changed(id);
        return std::invoke(std::forward<F>(f), value);
    }

    // Shared access; throws EntityBorrowError while an exclusive borrow is held
    template<typename T, typename F>
    decltype(auto) read(const Entity<T>& handle, F&& f) {
        EntityId id = checked_id(handle);
        const T& value = resolve<T>(id);
        BorrowGuard guard(*this, id, false);
        return std::invoke(std::forward<F>(f), value);
    }

    // New strong handle from a raw identifier; throws EntityNotFoundError or
    // EntityTypeError when the id is dead or holds a different type
    template<typename T>
    Entity<T> acquire(EntityId id) {
        if (!alive(id)) {
            detail::raise_not_found(id);
        }
        resolve<T>(id);
        retain(id);
        return Entity<T>(this, id);
    }

    template<typename T>
    WeakEntity<T> downgrade(const Entity<T>& handle) {
        return WeakEntity<T>(this, checked_id(handle));
    }

    // Liveness and bookkeeping
    bool alive(EntityId id) const;
    uint32_t strong_count(EntityId id) const;
    uint32_t weak_count(EntityId id) const;
    bool is_borrowed(EntityId id) const;
    size_t size() const { return m_live_count; }
    bool empty() const { return m_live_count == 0; }

    // Observation: callbacks run from flush() for entities mutated since the last flush
    using ObserverCallback = std::function<void(EntityId)>;
    core::ScopedConnection observe(EntityId id, ObserverCallback callback);
    template<typename T>
    core::ScopedConnection observe(const Entity<T>& handle, ObserverCallback callback) {
        return observe(checked_id(handle), std::move(callback));
    }

    void mark_changed(EntityId id);
    void flush();
    bool has_pending_changes() const { return !m_changed.empty(); }
    bool invalidation_requested() const { return m_invalidation_requested; }
    void clear_invalidation() { m_invalidation_requested = false; }

    // Handle bookkeeping (called by Entity / WeakEntity)
    void retain(EntityId id);
    void release(EntityId id);
    void retain_weak(EntityId id);
    void release_weak(EntityId id);

private:
    // Registry of the 64-bit identifier type; component pools hold the
    // bookkeeping record and one std::unique_ptr<T> per entity
    using Registry = entt::basic_registry<EntityId>;

    struct BorrowGuard {
        BorrowGuard(EntityStore& store, EntityId id, bool exclusive);
        ~BorrowGuard();
        BorrowGuard(const BorrowGuard&) = delete;
        BorrowGuard& operator=(const BorrowGuard&) = delete;

        EntityStore& store;
        EntityId id;
        bool exclusive;
    };

    struct Observer {
        uint64_t subscription = 0;
        ObserverCallback callback;
    };

    template<typename T>
    EntityId checked_id(const Entity<T>& handle) const {
        if (handle.store() != this || !alive(handle.id())) {
            detail::raise_not_found(handle.id());
        }
        return handle.id();
    }

    template<typename T>
    T& resolve(EntityId id) {
        auto* slot = m_registry.try_get<std::unique_ptr<T>>(id);
        if (!slot || !*slot) {
            detail::raise_type_mismatch(id, typeid(T).name());
        }
        return **slot;
    }

    void begin_borrow(EntityId id, bool exclusive);
    void end_borrow(EntityId id, bool exclusive);
    void schedule_destroy(EntityId id);
    void unsubscribe(EntityId id, uint64_t subscription);

    Registry m_registry;
    size_t m_live_count = 0;

    std::vector<EntityId> m_pending_destroy;
    bool m_draining = false;
    bool m_closing = false;

    std::unordered_map<EntityId, std::vector<Observer>> m_observers;
    std::vector<EntityId> m_changed;
    uint64_t m_next_subscription = 1;
    bool m_invalidation_requested = false;
};

// ============================================================================
// Entity<T>
// ============================================================================

template<typename T>
Entity<T>::Entity(const Entity& other) : m_store(other.m_store), m_id(other.m_id) {
    if (m_store) m_store->retain(m_id);
}

template<typename T>
Entity<T>& Entity<T>::operator=(const Entity& other) {
    if (this != &other) {
        if (other.m_store) other.m_store->retain(other.m_id);
        reset();
        m_store = other.m_store;
        m_id = other.m_id;
    }
    return *this;
}

template<typename T>
Entity<T>::Entity(Entity&& other) noexcept : m_store(other.m_store), m_id(other.m_id) {
    other.m_store = nullptr;
    other.m_id = entt::null;
}

template<typename T>
Entity<T>& Entity<T>::operator=(Entity&& other) noexcept {
    if (this != &other) {
        reset();
        m_store = other.m_store;
        m_id = other.m_id;
        other.m_store = nullptr;
        other.m_id = entt::null;
    }
    return *this;
}

template<typename T>
void Entity<T>::reset() {
    if (m_store) {
        EntityStore* store = m_store;
        m_store = nullptr;
        store->release(m_id);
    }
    m_id = entt::null;
}

template<typename T>
bool Entity<T>::valid() const {
    return m_store && m_store->alive(m_id);
}

template<typename T>
template<typename F>
decltype(auto) Entity<T>::update(F&& f) const {
    if (!m_store) detail::raise_not_found(m_id);
    return m_store->with_mut(*this, std::forward<F>(f));
}

template<typename T>
template<typename F>
decltype(auto) Entity<T>::read(F&& f) const {
    if (!m_store) detail::raise_not_found(m_id);
    return m_store->read(*this, std::forward<F>(f));
}

template<typename T>
WeakEntity<T> Entity<T>::downgrade() const {
    if (!m_store) detail::raise_not_found(m_id);
    return m_store->downgrade(*this);
}

// ============================================================================
// WeakEntity<T>
// ============================================================================

template<typename T>
WeakEntity<T>::WeakEntity(EntityStore* store, EntityId id) : m_store(store), m_id(id) {
    if (m_store) m_store->retain_weak(m_id);
}

template<typename T>
WeakEntity<T>::WeakEntity(const WeakEntity& other) : m_store(other.m_store), m_id(other.m_id) {
    if (m_store) m_store->retain_weak(m_id);
}

template<typename T>
WeakEntity<T>& WeakEntity<T>::operator=(const WeakEntity& other) {
    if (this != &other) {
        if (other.m_store) other.m_store->retain_weak(other.m_id);
        reset();
        m_store = other.m_store;
        m_id = other.m_id;
    }
    return *this;
}

template<typename T>
WeakEntity<T>::WeakEntity(WeakEntity&& other) noexcept : m_store(other.m_store), m_id(other.m_id) {
    other.m_store = nullptr;
    other.m_id = entt::null;
}

template<typename T>
WeakEntity<T>& WeakEntity<T>::operator=(WeakEntity&& other) noexcept {
    if (this != &other) {
        reset();
        m_store = other.m_store;
        m_id = other.m_id;
        other.m_store = nullptr;
        other.m_id = entt::null;
    }
    return *this;
}

template<typename T>
void WeakEntity<T>::reset() {
    if (m_store) {
        EntityStore* store = m_store;
        m_store = nullptr;
        store->release_weak(m_id);
    }
    m_id = entt::null;
}

template<typename T>
bool WeakEntity<T>::expired() const {
    return !m_store || !m_store->alive(m_id);
}

template<typename T>
Entity<T> WeakEntity<T>::upgrade() const {
    if (expired()) {
        detail::raise_not_found(m_id);
    }
    m_store->retain(m_id);
    return Entity<T>(m_store, m_id);
}

template<typename T>
std::optional<Entity<T>> WeakEntity<T>::try_upgrade() const {
    if (expired()) return std::nullopt;
    m_store->retain(m_id);
    return Entity<T>(m_store, m_id);
}

} // namespace strata::entity
