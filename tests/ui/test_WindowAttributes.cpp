#include <doctest/doctest.h>

#include <rtk/ui/WindowAttributes.hpp>

using namespace RTK;
using namespace RTK::UI;

TEST_CASE("Descriptor table is indexed by attribute") {
    auto const descriptors = AttributeDescriptors();
    REQUIRE(descriptors.size() == 14);
    for (std::size_t index = 0; index < descriptors.size(); ++index) {
        CHECK(static_cast<std::size_t>(descriptors[index].attribute) == index);
    }
    CHECK(FindAttribute("bg") == WindowAttribute::Background);
    CHECK(FindAttribute("minw") == WindowAttribute::MinW);
    CHECK_FALSE(FindAttribute("colour").has_value());

    CHECK_FALSE(DescribeAttribute(WindowAttribute::Background).window_sync);
    CHECK(DescribeAttribute(WindowAttribute::X).window_sync);
    CHECK(DescribeAttribute(WindowAttribute::W).reflow == ReflowMode::Full);
    CHECK_FALSE(DescribeAttribute(WindowAttribute::Title).reflow.has_value());
}

TEST_CASE("Invalid values are rejected and leave attributes unchanged") {
    WindowAttributes attrs;

    auto wrong = AssignAttribute(attrs, WindowAttribute::W, AttributeValue{true});
    REQUIRE_FALSE(wrong.has_value());
    CHECK(wrong.error().code == Error::Code::InvalidType);
    CHECK(describeError(wrong.error()).find("w:") != std::string::npos);
    CHECK(attrs.w == 800.0);

    CHECK_FALSE(AssignAttribute(attrs, WindowAttribute::H, AttributeValue{-1.0}).has_value());
    CHECK_FALSE(AssignAttribute(attrs, WindowAttribute::Opacity, AttributeValue{1.5}).has_value());
    CHECK_FALSE(AssignAttribute(attrs, WindowAttribute::Title, AttributeValue{std::string{}}).has_value());
    CHECK_FALSE(AssignAttribute(attrs, WindowAttribute::Dock, AttributeValue{std::string{"sideways"}}).has_value());
    CHECK_FALSE(AssignAttribute(attrs, WindowAttribute::Dock, AttributeValue{DockTarget{300}}).has_value());
    CHECK_FALSE(AssignAttribute(attrs, WindowAttribute::Background, AttributeValue{0.5}).has_value());
    CHECK(attrs.h == 600.0);
    CHECK(attrs.opacity == 1.0);
    CHECK(attrs.title == "rtk application");
}

TEST_CASE("Dock accepts docker ids and position names") {
    WindowAttributes attrs;
    REQUIRE(AssignAttribute(attrs, WindowAttribute::Dock, AttributeValue{std::string{"left"}}).has_value());
    CHECK(std::get<DockPosition>(attrs.dock) == DockPosition::Left);

    REQUIRE(AssignAttribute(attrs, WindowAttribute::Dock, AttributeValue{DockTarget{3}}).has_value());
    CHECK(std::get<int>(attrs.dock) == 3);

    CHECK(ParseDockPosition("floating") == DockPosition::Floating);
    CHECK(DockPositionName(DockPosition::Top) == "top");
}

TEST_CASE("Calculated attributes apply minimums and capability limits") {
    WindowAttributes attrs;
    REQUIRE(AssignAttribute(attrs, WindowAttribute::W, AttributeValue{40.0}).has_value());
    REQUIRE(AssignAttribute(attrs, WindowAttribute::MinH, AttributeValue{700.0}).has_value());
    REQUIRE(AssignAttribute(attrs, WindowAttribute::Pinned, AttributeValue{true}).has_value());
    REQUIRE(AssignAttribute(attrs, WindowAttribute::Borderless, AttributeValue{true}).has_value());

    auto const without = CalculateAttributes(attrs, AttributeContext{false});
    CHECK(without.w == 100.0);
    CHECK(without.h == 700.0);
    CHECK_FALSE(without.pinned);
    CHECK_FALSE(without.borderless);
    // Declared values are untouched.
    CHECK(attrs.w == 40.0);

    auto const with = CalculateAttributes(attrs, AttributeContext{true});
    CHECK(with.pinned);
    CHECK(with.borderless);
}

TEST_CASE("Calculated position is the layout origin") {
    WindowAttributes attrs;
    REQUIRE(AssignAttribute(attrs, WindowAttribute::X, AttributeValue{100.0}).has_value());
    REQUIRE(AssignAttribute(attrs, WindowAttribute::Y, AttributeValue{50.0}).has_value());
    auto calc = CalculateAttributes(attrs, AttributeContext{true});
    CHECK(calc.x == 0.0);
    CHECK(calc.y == 0.0);

    RecalculateAttribute(attrs, calc, WindowAttribute::X, AttributeContext{true});
    CHECK(calc.x == 0.0);
    CHECK(attrs.x == 100.0);
}

TEST_CASE("Recalculating one attribute leaves observed values alone") {
    WindowAttributes attrs;
    attrs.w = 80.0;
    auto calc = CalculateAttributes(attrs, AttributeContext{false});
    CHECK(calc.w == 100.0);
    // Size handed over by the host, below the minimum.
    calc.w = 80.0;

    REQUIRE(AssignAttribute(attrs, WindowAttribute::Title, AttributeValue{std::string{"Mixer"}}).has_value());
    RecalculateAttribute(attrs, calc, WindowAttribute::Title, AttributeContext{false});
    CHECK(calc.title == "Mixer");
    CHECK(calc.w == 80.0);

    SUBCASE("A new minimum clamps the matching dimension") {
        REQUIRE(AssignAttribute(attrs, WindowAttribute::MinW, AttributeValue{60.0}).has_value());
        RecalculateAttribute(attrs, calc, WindowAttribute::MinW, AttributeContext{false});
        CHECK(calc.minw == 60.0);
        CHECK(calc.w == 80.0);

        REQUIRE(AssignAttribute(attrs, WindowAttribute::MinW, AttributeValue{90.0}).has_value());
        RecalculateAttribute(attrs, calc, WindowAttribute::MinW, AttributeContext{false});
        CHECK(calc.w == 90.0);
    }
    SUBCASE("Capability limits still apply") {
        REQUIRE(AssignAttribute(attrs, WindowAttribute::Pinned, AttributeValue{true}).has_value());
        RecalculateAttribute(attrs, calc, WindowAttribute::Pinned, AttributeContext{false});
        CHECK_FALSE(calc.pinned);
    }
    SUBCASE("Dock targets copy across") {
        REQUIRE(AssignAttribute(attrs, WindowAttribute::Dock, AttributeValue{std::string{"left"}}).has_value());
        RecalculateAttribute(attrs, calc, WindowAttribute::Dock, AttributeContext{false});
        CHECK(std::get<DockPosition>(calc.dock) == DockPosition::Left);
    }
}

TEST_CASE("Read returns the declared value") {
    WindowAttributes attrs;
    REQUIRE(AssignAttribute(attrs, WindowAttribute::Title, AttributeValue{std::string{"Mixer"}}).has_value());
    CHECK(std::get<std::string>(ReadAttribute(attrs, WindowAttribute::Title)) == "Mixer");
    CHECK(std::get<Color>(ReadAttribute(attrs, WindowAttribute::Background)) == 0x252525ffu);
    CHECK(std::get<bool>(ReadAttribute(attrs, WindowAttribute::Visible)));
}
