#include <rtk/ui/WindowAttributes.hpp>

#include <algorithm>
#include <array>
#include <utility>

namespace RTK::UI {

namespace {

constexpr auto kDockPositionNames = std::to_array<std::pair<DockPosition, std::string_view>>({
    {DockPosition::Bottom, "bottom"},
    {DockPosition::Left, "left"},
    {DockPosition::Top, "top"},
    {DockPosition::Right, "right"},
    {DockPosition::Floating, "floating"},
});

auto wrong_type(char const* expected) -> std::unexpected<Error> {
    return makeError(Error::Code::InvalidType, std::string{"attribute expects "} + expected);
}

auto validate_number(AttributeValue const& value) -> Expected<void> {
    if (!std::holds_alternative<double>(value)) {
        return wrong_type("a number");
    }
    return {};
}

auto validate_size(AttributeValue const& value) -> Expected<void> {
    auto const* number = std::get_if<double>(&value);
    if (number == nullptr) {
        return wrong_type("a number");
    }
    if (*number < 0.0) {
        return makeError(Error::Code::InvalidType, "window dimensions must not be negative");
    }
    return {};
}

auto validate_bool(AttributeValue const& value) -> Expected<void> {
    if (!std::holds_alternative<bool>(value)) {
        return wrong_type("a boolean");
    }
    return {};
}

auto validate_dock(AttributeValue const& value) -> Expected<void> {
    if (auto const* name = std::get_if<std::string>(&value)) {
        if (!ParseDockPosition(*name)) {
            return makeError(Error::Code::InvalidType, "unknown dock position '" + *name + "'");
        }
        return {};
    }
    auto const* target = std::get_if<DockTarget>(&value);
    if (target == nullptr) {
        return wrong_type("a docker id or dock position");
    }
    if (auto const* id = std::get_if<int>(target); id && (*id < 0 || *id > 0xff)) {
        return makeError(Error::Code::InvalidType, "docker id out of range");
    }
    return {};
}

auto validate_title(AttributeValue const& value) -> Expected<void> {
    auto const* title = std::get_if<std::string>(&value);
    if (title == nullptr) {
        return wrong_type("a string");
    }
    if (title->empty()) {
        return makeError(Error::Code::InvalidType, "window title must not be empty");
    }
    return {};
}

auto validate_opacity(AttributeValue const& value) -> Expected<void> {
    auto const* opacity = std::get_if<double>(&value);
    if (opacity == nullptr) {
        return wrong_type("a number");
    }
    if (*opacity < 0.0 || *opacity > 1.0) {
        return makeError(Error::Code::InvalidType, "opacity must be within [0, 1]");
    }
    return {};
}

auto validate_color(AttributeValue const& value) -> Expected<void> {
    if (!std::holds_alternative<Color>(value)) {
        return wrong_type("a color");
    }
    return {};
}

void store_dock(WindowAttributes& attrs, AttributeValue const& value) {
    if (auto const* name = std::get_if<std::string>(&value)) {
        if (auto position = ParseDockPosition(*name)) {
            attrs.dock = *position;
        }
        return;
    }
    attrs.dock = std::get<DockTarget>(value);
}

// x and y place the OS window; inside the layout tree the content origin is always 0,0.
void origin_x(WindowAttributes& calc, AttributeContext const&) {
    calc.x = 0.0;
}

void origin_y(WindowAttributes& calc, AttributeContext const&) {
    calc.y = 0.0;
}

void require_native_pinned(WindowAttributes& calc, AttributeContext const& ctx) {
    if (!ctx.native_available) {
        calc.pinned = false;
    }
}

void require_native_borderless(WindowAttributes& calc, AttributeContext const& ctx) {
    if (!ctx.native_available) {
        calc.borderless = false;
    }
}

constexpr std::array<AttributeDescriptor, 14> kDescriptors{{
    {WindowAttribute::X, "x", true, std::nullopt, &validate_number,
     [](WindowAttributes& a, AttributeValue const& v) { a.x = std::get<double>(v); }, &origin_x},
    {WindowAttribute::Y, "y", true, std::nullopt, &validate_number,
     [](WindowAttributes& a, AttributeValue const& v) { a.y = std::get<double>(v); }, &origin_y},
    {WindowAttribute::W, "w", true, ReflowMode::Full, &validate_size,
     [](WindowAttributes& a, AttributeValue const& v) { a.w = std::get<double>(v); },
     [](WindowAttributes& c, AttributeContext const&) { c.w = std::max(c.minw, c.w); }},
    {WindowAttribute::H, "h", true, ReflowMode::Full, &validate_size,
     [](WindowAttributes& a, AttributeValue const& v) { a.h = std::get<double>(v); },
     [](WindowAttributes& c, AttributeContext const&) { c.h = std::max(c.minh, c.h); }},
    {WindowAttribute::MinW, "minw", true, ReflowMode::Full, &validate_size,
     [](WindowAttributes& a, AttributeValue const& v) { a.minw = std::get<double>(v); }, nullptr},
    {WindowAttribute::MinH, "minh", true, ReflowMode::Full, &validate_size,
     [](WindowAttributes& a, AttributeValue const& v) { a.minh = std::get<double>(v); }, nullptr},
    {WindowAttribute::Visible, "visible", true, std::nullopt, &validate_bool,
     [](WindowAttributes& a, AttributeValue const& v) { a.visible = std::get<bool>(v); }, nullptr},
    {WindowAttribute::Docked, "docked", true, std::nullopt, &validate_bool,
     [](WindowAttributes& a, AttributeValue const& v) { a.docked = std::get<bool>(v); }, nullptr},
    {WindowAttribute::Dock, "dock", true, std::nullopt, &validate_dock, &store_dock, nullptr},
    {WindowAttribute::Pinned, "pinned", true, std::nullopt, &validate_bool,
     [](WindowAttributes& a, AttributeValue const& v) { a.pinned = std::get<bool>(v); }, &require_native_pinned},
    {WindowAttribute::Borderless, "borderless", true, std::nullopt, &validate_bool,
     [](WindowAttributes& a, AttributeValue const& v) { a.borderless = std::get<bool>(v); }, &require_native_borderless},
    {WindowAttribute::Title, "title", true, std::nullopt, &validate_title,
     [](WindowAttributes& a, AttributeValue const& v) { a.title = std::get<std::string>(v); }, nullptr},
    {WindowAttribute::Opacity, "opacity", true, std::nullopt, &validate_opacity,
     [](WindowAttributes& a, AttributeValue const& v) { a.opacity = std::get<double>(v); }, nullptr},
    {WindowAttribute::Background, "bg", false, std::nullopt, &validate_color,
     [](WindowAttributes& a, AttributeValue const& v) { a.background = std::get<Color>(v); }, nullptr},
}};

} // namespace

auto AttributeDescriptors() -> std::span<AttributeDescriptor const> {
    return kDescriptors;
}

auto DescribeAttribute(WindowAttribute attribute) -> AttributeDescriptor const& {
    return kDescriptors[static_cast<std::size_t>(attribute)];
}

auto FindAttribute(std::string_view name) -> std::optional<WindowAttribute> {
    for (auto const& descriptor : kDescriptors) {
        if (descriptor.name == name) {
            return descriptor.attribute;
        }
    }
    return std::nullopt;
}

auto AssignAttribute(WindowAttributes& attrs, WindowAttribute attribute, AttributeValue const& value) -> Expected<void> {
    auto const& descriptor = DescribeAttribute(attribute);
    if (auto valid = descriptor.validate(value); !valid) {
        return makeError(valid.error().code,
                         std::string{descriptor.name} + ": " + valid.error().message.value_or(""));
    }
    descriptor.store(attrs, value);
    return {};
}

auto ReadAttribute(WindowAttributes const& attrs, WindowAttribute attribute) -> AttributeValue {
    switch (attribute) {
    case WindowAttribute::X:
        return attrs.x;
    case WindowAttribute::Y:
        return attrs.y;
    case WindowAttribute::W:
        return attrs.w;
    case WindowAttribute::H:
        return attrs.h;
    case WindowAttribute::MinW:
        return attrs.minw;
    case WindowAttribute::MinH:
        return attrs.minh;
    case WindowAttribute::Visible:
        return attrs.visible;
    case WindowAttribute::Docked:
        return attrs.docked;
    case WindowAttribute::Dock:
        return attrs.dock;
    case WindowAttribute::Pinned:
        return attrs.pinned;
    case WindowAttribute::Borderless:
        return attrs.borderless;
    case WindowAttribute::Title:
        return attrs.title;
    case WindowAttribute::Opacity:
        return attrs.opacity;
    case WindowAttribute::Background:
        return attrs.background;
    }
    return attrs.x;
}

auto CalculateAttributes(WindowAttributes const& declared, AttributeContext const& ctx) -> WindowAttributes {
    auto calc = declared;
    for (auto const& descriptor : kDescriptors) {
        if (descriptor.calculate != nullptr) {
            descriptor.calculate(calc, ctx);
        }
    }
    return calc;
}

void RecalculateAttribute(WindowAttributes const& declared, WindowAttributes& calc, WindowAttribute attribute,
                         AttributeContext const& ctx) {
    auto const& descriptor = DescribeAttribute(attribute);
    descriptor.store(calc, ReadAttribute(declared, attribute));
    if (descriptor.calculate != nullptr) {
        descriptor.calculate(calc, ctx);
    }
    // Minimums clamp the matching dimension.
    if (attribute == WindowAttribute::MinW) {
        RecalculateAttribute(declared, calc, WindowAttribute::W, ctx);
    } else if (attribute == WindowAttribute::MinH) {
        RecalculateAttribute(declared, calc, WindowAttribute::H, ctx);
    }
}

auto ParseDockPosition(std::string_view name) -> std::optional<DockPosition> {
    for (auto const& [position, label] : kDockPositionNames) {
        if (label == name) {
            return position;
        }
    }
    return std::nullopt;
}

auto DockPositionName(DockPosition position) -> std::string_view {
    for (auto const& [value, label] : kDockPositionNames) {
        if (value == position) {
            return label;
        }
    }
    return "unknown";
}

} // namespace RTK::UI
