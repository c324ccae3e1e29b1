#include <doctest/doctest.h>

#include "ui/FakeHost.hpp"

#include <rtk/ui/ReflowScheduler.hpp>

using namespace RTK::UI;
using RTK::UI::Testing::RecordingWidget;
using RTK::UI::Testing::WindowHarness;

TEST_CASE("Partial reflow of a widget without layout escalates to full") {
    ReflowScheduler scheduler;
    RecordingWidget fresh;
    REQUIRE_FALSE(fresh.has_layout());

    scheduler.queue(ReflowMode::Partial, &fresh);
    CHECK(scheduler.full_pending());
    auto plan = scheduler.take();
    REQUIRE(plan.has_value());
    CHECK(plan->mode == ReflowMode::Full);
    CHECK(plan->widgets.empty());
    CHECK_FALSE(scheduler.pending());
    CHECK_FALSE(scheduler.take().has_value());
}

TEST_CASE("Partial requests accumulate and full is sticky") {
    WindowHarness harness;
    RecordingWidget a;
    RecordingWidget b;
    a.layout(LayoutBox{0, 0, 10, 10}, *harness.window);
    b.layout(LayoutBox{0, 0, 10, 10}, *harness.window);

    ReflowScheduler scheduler;
    scheduler.queue(ReflowMode::Partial, &a);
    scheduler.queue(ReflowMode::Partial, &b);
    scheduler.queue(ReflowMode::Partial, &a);
    CHECK_FALSE(scheduler.full_pending());
    REQUIRE(scheduler.partial_widgets().size() == 2);
    CHECK(scheduler.partial_widgets()[0] == &a);

    scheduler.queue(ReflowMode::Full);
    scheduler.queue(ReflowMode::Partial, &b);
    CHECK(scheduler.full_pending());
    CHECK(scheduler.take()->mode == ReflowMode::Full);

    SUBCASE("Forgetting the last widget leaves nothing pending") {
        scheduler.queue(ReflowMode::Partial, &a);
        scheduler.forget(&a);
        CHECK_FALSE(scheduler.pending());
    }
    SUBCASE("A null widget means the whole tree") {
        scheduler.queue(ReflowMode::Partial, nullptr);
        CHECK(scheduler.full_pending());
    }
}

TEST_CASE("Partial plans run incrementally only below the limit after a full layout") {
    RecordingWidget a;
    ReflowPlan plan{ReflowMode::Partial, {&a}};
    CHECK(CanReflowPartially(plan, true, 20));
    CHECK_FALSE(CanReflowPartially(plan, false, 20));
    CHECK_FALSE(CanReflowPartially(plan, true, 1));
    CHECK_FALSE(CanReflowPartially(ReflowPlan{ReflowMode::Full, {}}, true, 20));
    CHECK_FALSE(CanReflowPartially(ReflowPlan{ReflowMode::Partial, {}}, true, 20));
}
