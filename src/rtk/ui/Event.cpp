#include <rtk/ui/Event.hpp>

#include <cmath>
#include <sstream>

namespace RTK::UI {

auto Event::reset(EventType type, double x, double y) -> Event& {
    *this = Event{};
    this->type = type;
    this->x = x;
    this->y = y;
    return *this;
}

void Event::set_modifiers(unsigned cap, unsigned button) {
    modifiers = cap & Modifier::Mask;
    ctrl = (cap & Modifier::Ctrl) != 0;
    shift = (cap & Modifier::Shift) != 0;
    alt = (cap & Modifier::Alt) != 0;
    meta = (cap & Modifier::Meta) != 0;
    buttons = cap & MouseButton::Mask;
    this->button = button;
}

void Event::set_handled(Widget* widget) {
    handled_ = true;
    handled_by_ = widget;
}

void Event::clear_handled() {
    handled_ = false;
    handled_by_ = nullptr;
}

auto Event::is_mouse_event() const -> bool {
    return type == EventType::MouseDown || type == EventType::MouseUp || type == EventType::MouseMove
           || type == EventType::MouseWheel;
}

auto Event::clone() const -> Event {
    Event copy = *this;
    copy.clear_handled();
    return copy;
}

auto Event::clone_as(EventType type, bool simulated) const -> Event {
    Event copy = clone();
    copy.type = type;
    copy.simulated = simulated;
    return copy;
}

auto Event::describe() const -> std::string {
    std::ostringstream oss;
    oss << "Event<" << EventTypeName(type) << " xy=" << x << "," << y << " handled=" << (handled_ ? "true" : "false")
        << " sim=" << (simulated ? "true" : "false");
    switch (type) {
    case EventType::MouseDown:
    case EventType::MouseUp:
    case EventType::MouseMove:
        oss << " button=" << button << " buttons=" << buttons;
        break;
    case EventType::MouseWheel:
        oss << " wheel=" << hwheel << "," << wheel;
        break;
    case EventType::Key:
        oss << " char=" << (character ? std::string(1, *character) : std::string("nil"))
            << " keycode=" << keycode.value_or(0);
        break;
    case EventType::DropFile:
        oss << " files=" << files.size();
        break;
    case EventType::WindowClose:
        break;
    }
    oss << ">";
    return oss.str();
}

auto EventTypeName(EventType type) -> char const* {
    switch (type) {
    case EventType::MouseDown:
        return "mousedown";
    case EventType::MouseUp:
        return "mouseup";
    case EventType::MouseMove:
        return "mousemove";
    case EventType::MouseWheel:
        return "mousewheel";
    case EventType::Key:
        return "key";
    case EventType::DropFile:
        return "dropfile";
    case EventType::WindowClose:
        return "windowclose";
    }
    return "unknown";
}

auto ClassifyKeyChar(long code, bool ctrl) -> std::optional<char> {
    if (code <= 0) {
        return std::nullopt;
    }
    if (code <= 26 && ctrl) {
        return static_cast<char>(code + 96);
    }
    if (code >= 32 && code != 127) {
        if (code <= 255) {
            return static_cast<char>(code);
        }
        // Host-specific extended ranges that shadow printable ASCII.
        if (code <= 282) {
            return static_cast<char>(code - 160);
        }
        if (code <= 346) {
            return static_cast<char>(code - 224);
        }
    }
    return std::nullopt;
}

auto WheelDistance(double raw, WheelMode mode) -> double {
    if (raw == 0.0) {
        return 0.0;
    }
    if (mode == WheelMode::Damped) {
        double direction = raw < 0.0 ? 1.0 : -1.0;
        return direction * std::sqrt(std::abs(raw) / 6.0);
    }
    return -raw / 120.0;
}

auto DefaultWheelMode() -> WheelMode {
#if defined(__APPLE__)
    return WheelMode::Damped;
#else
    return WheelMode::Linear;
#endif
}

} // namespace RTK::UI
