#include <catch2/catch_test_macros.hpp>
#include <strata/ui/widget_id.hpp>
#include <unordered_set>
#include <vector>

using namespace strata::ui;

namespace {

// Ids for a parent scope with the given sibling keys
std::vector<WidgetId> sibling_ids(const std::vector<WidgetKey>& keys) {
    IdStack stack;
    std::vector<WidgetId> ids;
    stack.push_scope();
    for (const auto& key : keys) {
        ids.push_back(stack.next_id(key));
    }
    stack.pop_scope();
    return ids;
}

} // anonymous namespace

// ============================================================================
// WidgetId
// ============================================================================

TEST_CASE("WidgetId basics", "[ui][id]") {
    WidgetId none;
    REQUIRE_FALSE(none.is_valid());

    WidgetId a(42);
    WidgetId b(42);
    REQUIRE(a == b);
    REQUIRE(a != WidgetId(43));

    std::unordered_set<WidgetId> set{a, b, WidgetId(7)};
    REQUIRE(set.size() == 2);
}

// ============================================================================
// IdStack
// ============================================================================

TEST_CASE("IdStack ids are stable across frames", "[ui][id]") {
    auto frame = []() {
        IdStack stack;
        std::vector<WidgetId> ids;
        ids.push_back(stack.next_id());
        ids.push_back(stack.push_scope());
        ids.push_back(stack.next_id());
        ids.push_back(stack.next_id("keyed"));
        stack.pop_scope();
        ids.push_back(stack.next_id(3));
        return ids;
    };

    REQUIRE(frame() == frame());

    SECTION("Reset restarts numbering") {
        IdStack stack;
        WidgetId first = stack.next_id();
        stack.next_id();
        stack.reset();
        REQUIRE(stack.next_id() == first);
    }
}

TEST_CASE("IdStack sibling ordering", "[ui][id]") {
    SECTION("Unkeyed ids depend on ordinal position") {
        IdStack stack;
        WidgetId first = stack.next_id();
        WidgetId second = stack.next_id();
        REQUIRE(first != second);
        REQUIRE(first.is_valid());
    }

    SECTION("Keyed ids ignore ordinal position") {
        auto forward = sibling_ids({WidgetKey("inc"), WidgetKey("dec")});
        auto reversed = sibling_ids({WidgetKey("dec"), WidgetKey("inc")});
        REQUIRE(forward[0] == reversed[1]);
        REQUIRE(forward[1] == reversed[0]);
    }

    SECTION("Inserting an unkeyed sibling shifts later unkeyed ids") {
        auto before = sibling_ids({WidgetKey(), WidgetKey()});
        auto after = sibling_ids({WidgetKey(), WidgetKey(), WidgetKey()});
        REQUIRE(before[0] == after[0]);
        REQUIRE(before[1] == after[1]);

        auto shifted = sibling_ids({WidgetKey("new"), WidgetKey(), WidgetKey()});
        REQUIRE(shifted[1] != before[0]);
    }

    SECTION("Integer and string keys do not collide") {
        auto ids = sibling_ids({WidgetKey(1), WidgetKey("1")});
        REQUIRE(ids[0] != ids[1]);
    }
}

TEST_CASE("IdStack scopes compose hierarchically", "[ui][id]") {
    IdStack stack;

    stack.push_scope("panel_a");
    WidgetId in_a = stack.next_id("ok");
    stack.pop_scope();

    stack.push_scope("panel_b");
    WidgetId in_b = stack.next_id("ok");
    REQUIRE(stack.depth() == 1);
    stack.pop_scope();

    REQUIRE(in_a != in_b);
    REQUIRE(stack.depth() == 0);
}

TEST_CASE("IdStack imbalance is a usage error", "[ui][id]") {
    IdStack stack;

    SECTION("Pop without push") {
        REQUIRE_THROWS_AS(stack.pop_scope(), IdStackError);
    }

    SECTION("Open scope at frame end") {
        stack.push_scope();
        REQUIRE_THROWS_AS(stack.check_balanced(), IdStackError);
        stack.pop_scope();
        REQUIRE_NOTHROW(stack.check_balanced());
    }
}
