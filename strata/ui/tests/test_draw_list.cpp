#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <strata/ui/draw_list.hpp>

using namespace strata::ui;
using Catch::Matchers::WithinAbs;

namespace {

Color red() { return rgb(1.0f, 0.0f, 0.0f); }

} // anonymous namespace

// ============================================================================
// Ordering
// ============================================================================

TEST_CASE("DrawList insert_before keeps paint order", "[ui][draw_list]") {
    DrawList list;
    list.append(FilledRect{Rect(0, 0, 10, 10), red()});        // A
    list.append(FilledRect{Rect(20, 0, 10, 10), red()});       // B
    list.insert_before(0, FilledRect{Rect(0, 0, 30, 10), rgb(0.1f, 0.1f, 0.1f)});  // Bg

    REQUIRE(list.size() == 3);
    REQUIRE(list[0].get_if<FilledRect>()->rect.width == 30.0f);
    REQUIRE(list[1].get_if<FilledRect>()->rect.x == 0.0f);
    REQUIRE(list[2].get_if<FilledRect>()->rect.x == 20.0f);

    SECTION("Emission order tags stay with their commands") {
        REQUIRE(list[1].order == 0);
        REQUIRE(list[2].order == 1);
        REQUIRE(list[0].order == 2);
    }
}

TEST_CASE("DrawList mark and insert", "[ui][draw_list]") {
    DrawList list;
    list.add_rect(Rect(0, 0, 5, 5), red());
    size_t mark = list.mark();
    list.add_text(Vec2(1, 1), "child", TextStyle{});
    list.insert_rect(mark, Rect(0, 10, 50, 20), colors::White);

    REQUIRE(list.size() == 3);
    REQUIRE(list[0].is<FilledRect>());
    REQUIRE(list[1].is<FilledRect>());
    REQUIRE(list[1].get_if<FilledRect>()->rect.width == 50.0f);
    REQUIRE(list[2].is<TextRun>());

    SECTION("Out of range insert appends") {
        list.insert_before(100, ClipPop{});
        REQUIRE(list[list.size() - 1].is<ClipPop>());
    }
}

// ============================================================================
// Builders
// ============================================================================

TEST_CASE("DrawList skips invisible payloads", "[ui][draw_list]") {
    DrawList list;

    list.add_rect(Rect(0, 0, 10, 10), colors::Transparent);
    list.insert_rect(0, Rect(0, 0, 10, 10), rgba(1, 1, 1, 0));
    list.add_text(Vec2(0, 0), "", TextStyle{});

    FrameStyle invisible;
    invisible.with_background(colors::Transparent);
    list.add_frame(Rect(0, 0, 10, 10), invisible);

    REQUIRE(list.empty());

    SECTION("Border alone makes a frame visible") {
        FrameStyle bordered = invisible;
        bordered.with_border(1.0f, colors::White);
        list.add_frame(Rect(0, 0, 10, 10), bordered);
        REQUIRE(list.size() == 1);
    }

    SECTION("Shadow alone makes a frame visible") {
        FrameStyle shadowed = invisible;
        shadowed.with_shadow(Vec2(2, 2), 4.0f, rgba(0, 0, 0, 0.5f));
        list.add_frame(Rect(0, 0, 10, 10), shadowed);
        REQUIRE(list.size() == 1);
    }

    SECTION("Gradient with one opaque stop is visible") {
        FrameStyle gradient;
        gradient.with_linear_gradient(colors::Transparent, red(), 0.0f);
        list.add_frame(Rect(0, 0, 10, 10), gradient);
        REQUIRE(list.size() == 1);
        REQUIRE(std::holds_alternative<LinearGradient>(list[0].get_if<FrameShape>()->style.fill));
    }
}

TEST_CASE("DrawList clip stack", "[ui][draw_list]") {
    DrawList list;

    SECTION("Nested clips intersect") {
        list.push_clip(Rect(0, 0, 100, 100));
        list.push_clip(Rect(50, 50, 100, 100));

        auto clip = list.current_clip();
        REQUIRE(clip.has_value());
        REQUIRE_THAT(clip->x, WithinAbs(50.0f, 0.001f));
        REQUIRE_THAT(clip->width, WithinAbs(50.0f, 0.001f));
        REQUIRE_THAT(clip->height, WithinAbs(50.0f, 0.001f));
        REQUIRE(list[1].get_if<ClipPush>()->rect == *clip);

        list.pop_clip();
        list.pop_clip();
        REQUIRE_FALSE(list.current_clip().has_value());
        REQUIRE(list.size() == 4);
    }

    SECTION("Disjoint clips collapse to zero size") {
        list.push_clip(Rect(0, 0, 10, 10));
        list.push_clip(Rect(100, 100, 10, 10));
        auto clip = list.current_clip();
        REQUIRE(clip->width == 0.0f);
        REQUIRE(clip->height == 0.0f);
    }

    SECTION("Unmatched pop is ignored") {
        list.pop_clip();
        REQUIRE(list.empty());
    }

    SECTION("Resized clip is intersected with its parent") {
        list.push_clip(Rect(0, 0, 100, 100));
        list.push_clip(Rect(10, 10, 1000, 1000));
        size_t inner = list.size() - 1;
        list.pop_clip();
        list.pop_clip();

        list.resize_clip(inner, Rect(20, 20, 200, 30));
        const auto* push = list[inner].get_if<ClipPush>();
        REQUIRE(push->rect == Rect(20, 20, 80, 30));
    }
}

TEST_CASE("DrawList clear resets order", "[ui][draw_list]") {
    DrawList list;
    list.add_rect(Rect(0, 0, 1, 1), red());
    list.push_clip(Rect(0, 0, 1, 1));
    list.clear();

    REQUIRE(list.empty());
    REQUIRE(list.clip_depth() == 0);
    list.add_rect(Rect(0, 0, 1, 1), red());
    REQUIRE(list[0].order == 0);
}
