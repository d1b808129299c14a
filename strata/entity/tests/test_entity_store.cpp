#include <catch2/catch_test_macros.hpp>
#include <strata/entity/entity_store.hpp>
#include <strata/entity/lazy_entity.hpp>
#include <string>
#include <vector>

using namespace strata::entity;

namespace {

struct TextField {
    std::string text;
    int cursor = 0;
};

struct Node {
    int value = 0;
    Entity<Node> next;
};

struct DropCounter {
    int* drops;
    explicit DropCounter(int* d) : drops(d) {}
    ~DropCounter() { ++(*drops); }
};

} // anonymous namespace

// ============================================================================
// Creation and reference counting
// ============================================================================

TEST_CASE("EntityStore create", "[entity][store]") {
    EntityStore store;

    auto field = store.create<TextField>(TextField{"hello", 5});
    REQUIRE(field.valid());
    REQUIRE(store.size() == 1);
    REQUIRE(store.strong_count(field.id()) == 1);

    field.read([](const TextField& f) {
        REQUIRE(f.text == "hello");
        REQUIRE(f.cursor == 5);
    });
}

TEST_CASE("Entity handle copies share state", "[entity][store]") {
    EntityStore store;
    auto a = store.create<int>(1);

    SECTION("Copy increments strong count") {
        Entity<int> b = a;
        REQUIRE(b == a);
        REQUIRE(store.strong_count(a.id()) == 2);

        b.update([](int& v) { v = 42; });
        REQUIRE(a.read([](const int& v) { return v; }) == 42);
    }

    SECTION("Dropping a copy keeps state alive") {
        {
            Entity<int> b = a;
        }
        REQUIRE(store.strong_count(a.id()) == 1);
        REQUIRE(a.valid());
    }

    SECTION("Move transfers without touching the count") {
        Entity<int> b = std::move(a);
        REQUIRE(store.strong_count(b.id()) == 1);
        REQUIRE_FALSE(a.valid());
    }
}

TEST_CASE("Last strong handle reclaims state", "[entity][store]") {
    EntityStore store;
    int drops = 0;

    auto counter = store.create<DropCounter>(&drops);
    EntityId id = counter.id();
    counter.reset();

    REQUIRE(drops == 1);
    REQUIRE(store.empty());
    REQUIRE_FALSE(store.alive(id));
}

TEST_CASE("Recycled slots never alias stale handles", "[entity][store]") {
    EntityStore store;

    auto first = store.create<int>(1);
    auto weak = first.downgrade();
    EntityId old_id = first.id();
    first.reset();

    auto second = store.create<int>(2);
    REQUIRE(second.id() != old_id);
    REQUIRE(weak.expired());
    REQUIRE_THROWS_AS(weak.upgrade(), EntityNotFoundError);

    if (entity_index(second.id()) == entity_index(old_id)) {
        REQUIRE(entity_generation(second.id()) != entity_generation(old_id));
    }
}

// ============================================================================
// Weak handles
// ============================================================================

TEST_CASE("WeakEntity resolution", "[entity][weak]") {
    EntityStore store;
    auto strong = store.create<TextField>();
    auto weak = strong.downgrade();

    REQUIRE(store.weak_count(strong.id()) == 1);
    REQUIRE(store.strong_count(strong.id()) == 1);

    SECTION("Upgrade while alive") {
        auto again = weak.upgrade();
        REQUIRE(again == strong);
        REQUIRE(store.strong_count(strong.id()) == 2);
    }

    SECTION("Upgrade after reclamation throws") {
        strong.reset();
        REQUIRE(weak.expired());
        REQUIRE_THROWS_AS(weak.upgrade(), EntityNotFoundError);
        REQUIRE_FALSE(weak.try_upgrade().has_value());
    }

    SECTION("Weak handles do not keep state alive") {
        WeakEntity<TextField> copy = weak;
        REQUIRE(store.weak_count(strong.id()) == 2);
        strong.reset();
        REQUIRE(copy.expired());
    }
}

// ============================================================================
// Borrowing
// ============================================================================

TEST_CASE("with_mut grants exclusive access", "[entity][borrow]") {
    EntityStore store;
    auto field = store.create<TextField>();

    store.with_mut(field, [](TextField& f) {
        f.text = "abc";
        f.cursor = 3;
    });

    REQUIRE(field.read([](const TextField& f) { return f.text; }) == "abc");
    REQUIRE_FALSE(store.is_borrowed(field.id()));
}

TEST_CASE("Re-entrant access is refused", "[entity][borrow]") {
    EntityStore store;
    auto value = store.create<int>(0);

    SECTION("Nested with_mut") {
        REQUIRE_THROWS_AS(
            value.update([&](int&) { value.update([](int& v) { v = 1; }); }),
            EntityBorrowError
        );
    }

    SECTION("Read inside with_mut") {
        REQUIRE_THROWS_AS(
            value.update([&](int&) { value.read([](const int&) {}); }),
            EntityBorrowError
        );
    }

    SECTION("with_mut inside read") {
        REQUIRE_THROWS_AS(
            value.read([&](const int&) { value.update([](int&) {}); }),
            EntityBorrowError
        );
    }

    SECTION("Nested reads are fine") {
        int seen = value.read([&](const int& outer) {
            return value.read([&](const int& inner) { return outer + inner + 7; });
        });
        REQUIRE(seen == 7);
    }

    // The failed borrow must not leave the entity locked
    REQUIRE_FALSE(store.is_borrowed(value.id()));
    value.update([](int& v) { v = 5; });
    REQUIRE(value.read([](const int& v) { return v; }) == 5);
}

TEST_CASE("Dropping the last handle inside its own borrow defers reclamation", "[entity][borrow]") {
    EntityStore store;
    int drops = 0;
    auto counter = store.create<DropCounter>(&drops);
    EntityId id = counter.id();

    Entity<DropCounter> copy = counter;
    counter.reset();

    store.with_mut(copy, [&](DropCounter&) {
        copy.reset();
        REQUIRE(drops == 0);
        REQUIRE_FALSE(store.alive(id));
    });

    REQUIRE(drops == 1);
}

TEST_CASE("Reclaiming a value releases the handles it holds", "[entity][store]") {
    EntityStore store;

    auto tail = store.create<Node>();
    tail.update([](Node& n) { n.value = 2; });
    auto head = store.create<Node>();
    head.update([&](Node& n) {
        n.value = 1;
        n.next = tail;
    });

    EntityId tail_id = tail.id();
    tail.reset();
    REQUIRE(store.alive(tail_id));

    head.reset();
    REQUIRE_FALSE(store.alive(tail_id));
    REQUIRE(store.empty());
}

TEST_CASE("acquire checks the stored type", "[entity][store]") {
    EntityStore store;
    auto value = store.create<int>(3);

    auto same = store.acquire<int>(value.id());
    REQUIRE(same == value);
    REQUIRE(store.strong_count(value.id()) == 2);

    REQUIRE_THROWS_AS(store.acquire<TextField>(value.id()), EntityTypeError);
    REQUIRE(store.strong_count(value.id()) == 2);
}

TEST_CASE("Handles from another store are rejected", "[entity][store]") {
    EntityStore a;
    EntityStore b;
    auto value = a.create<int>(1);

    REQUIRE_THROWS_AS(b.with_mut(value, [](int&) {}), EntityNotFoundError);
}

TEST_CASE("Errors carry the entity id", "[entity][errors]") {
    EntityStore store;
    auto value = store.create<int>(1);
    auto weak = value.downgrade();
    EntityId id = value.id();
    value.reset();

    try {
        (void)weak.upgrade();
        FAIL("expected EntityNotFoundError");
    } catch (const EntityError& e) {
        REQUIRE(e.id() == id);
        REQUIRE(std::string(e.what()).find("no longer exists") != std::string::npos);
    }
}

// ============================================================================
// Observation
// ============================================================================

TEST_CASE("Observers run on flush for mutated entities", "[entity][observe]") {
    EntityStore store;
    auto value = store.create<int>(0);
    auto other = store.create<int>(0);

    std::vector<EntityId> notified;
    auto connection = store.observe(value, [&](EntityId id) { notified.push_back(id); });

    SECTION("Mutation then flush notifies once") {
        value.update([](int& v) { ++v; });
        value.update([](int& v) { ++v; });
        REQUIRE(notified.empty());

        store.flush();
        REQUIRE(notified.size() == 1);
        REQUIRE(notified[0] == value.id());
        REQUIRE(store.invalidation_requested());

        store.clear_invalidation();
        store.flush();
        REQUIRE(notified.size() == 1);
        REQUIRE_FALSE(store.invalidation_requested());
    }

    SECTION("Reads and unobserved entities do not notify") {
        value.read([](const int&) {});
        other.update([](int& v) { v = 9; });
        store.flush();
        REQUIRE(notified.empty());
        REQUIRE_FALSE(store.invalidation_requested());
    }

    SECTION("Disconnected observers are silent") {
        connection.disconnect();
        value.update([](int& v) { ++v; });
        store.flush();
        REQUIRE(notified.empty());
    }
}

// ============================================================================
// LazyEntity
// ============================================================================

TEST_CASE("LazyEntity creates on first use", "[entity][lazy]") {
    EntityStore store;
    LazyEntity<int> lazy(store);

    REQUIRE_FALSE(lazy.initialized());
    REQUIRE(store.empty());

    const auto& first = lazy.get_or_init(10);
    REQUIRE(lazy.initialized());
    REQUIRE(store.size() == 1);

    const auto& second = lazy.get_or_init(99);
    REQUIRE(first == second);
    REQUIRE(second.read([](const int& v) { return v; }) == 10);

    lazy.reset();
    REQUIRE(store.empty());
}
