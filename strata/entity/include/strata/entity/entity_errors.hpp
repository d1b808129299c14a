#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace strata::entity {

// 32-bit slot index in the low half, 32-bit generation in the high half
enum class EntityId : std::uint64_t {};

uint32_t entity_index(EntityId id);
uint32_t entity_generation(EntityId id);
std::string to_string(EntityId id);

// Base for all entity usage errors
class EntityError : public std::logic_error {
public:
    EntityError(EntityId id, const std::string& what)
        : std::logic_error(what), m_id(id) {}

    EntityId id() const { return m_id; }

private:
    EntityId m_id;
};

// Handle refers to state that has been reclaimed (or never existed in this store)
class EntityNotFoundError : public EntityError {
public:
    using EntityError::EntityError;
};

// Access conflicts with an exclusive borrow already in progress
class EntityBorrowError : public EntityError {
public:
    using EntityError::EntityError;
};

// Handle type does not match the stored state type
class EntityTypeError : public EntityError {
public:
    using EntityError::EntityError;
};

namespace detail {
    // Log at Error level, then throw
    [[noreturn]] void raise_not_found(EntityId id);
    [[noreturn]] void raise_borrow_conflict(EntityId id, bool exclusive_requested);
    [[noreturn]] void raise_type_mismatch(EntityId id, const char* requested_type);
} // namespace detail

} // namespace strata::entity
