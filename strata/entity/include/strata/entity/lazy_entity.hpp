#pragma once

#include <strata/entity/entity_store.hpp>
#include <utility>

namespace strata::entity {

// Holder that creates its entity on first use.
// Render closures run every frame; capturing a LazyEntity lets a widget own
// persistent state without the caller creating it up front.
//
// @code
// LazyEntity<int> clicks;
// layer_manager.add_ui_layer(0, {}, [clicks](UiLayerContext& ctx) mutable {
//     const auto& counter = clicks.get_or_init(0);
//     ...
// });
// @endcode
template<typename T>
class LazyEntity {
public:
    LazyEntity() = default;
    explicit LazyEntity(EntityStore& store) : m_store(&store) {}

    template<typename... Args>
    const Entity<T>& get_or_init(Args&&... args) {
        if (!m_entity) {
            EntityStore& store = m_store ? *m_store : EntityStore::get();
            m_entity = store.template create<T>(std::forward<Args>(args)...);
        }
        return m_entity;
    }

    bool initialized() const { return static_cast<bool>(m_entity); }

    void reset() { m_entity.reset(); }

private:
    EntityStore* m_store = nullptr;
    Entity<T> m_entity;
};

} // namespace strata::entity
