#include <rtk/rtk.hpp>

#include <charconv>
#include <deque>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

using namespace RTK::UI;

namespace {

// In-memory host: a fixed canvas, a clock advanced by the driver, and input scripted per frame.
class ScriptedHost final : public HostSurface {
public:
    void init(std::string_view title, int w, int h, DockState dock, int x, int y) override {
        std::cout << "init '" << title << "' " << w << "x" << h << " at " << x << "," << y << " dock=" << dock << '\n';
        canvas_ = SizeI{w, h};
        position_ = PointI{x, y};
        dock_ = dock;
    }
    void quit() override { std::cout << "quit\n"; }
    void commit() override { drops_.clear(); }

    auto drop_file(int index) const -> std::optional<std::string> override {
        if (index < 0 || static_cast<std::size_t>(index) >= drops_.size()) {
            return std::nullopt;
        }
        return drops_[static_cast<std::size_t>(index)];
    }
    void clear_drop_files() override { drops_.clear(); }

    auto mouse_position() const -> PointI override { return mouse_; }
    auto mouse_cap() const -> unsigned override { return cap_; }
    auto wheel() const -> std::pair<double, double> override { return {wheel_, 0.0}; }
    void clear_wheel() override { wheel_ = 0.0; }
    auto poll_char() -> long override {
        if (keys_.empty()) {
            return 0;
        }
        auto key = keys_.front();
        keys_.pop_front();
        return key;
    }

    auto canvas_size() const -> SizeI override { return canvas_; }
    auto dock_state() const -> DockQuery override { return DockQuery{dock_, position_.x, position_.y}; }
    void set_dock(DockState state) override { dock_ = state; }
    auto docker_position(int) const -> std::optional<int> override { return std::nullopt; }

    auto client_to_screen(PointI client) const -> PointI override {
        return PointI{position_.x + client.x, position_.y + client.y};
    }
    auto screen_mouse_position() const -> PointI override { return client_to_screen(mouse_); }

    auto retina_scale() const -> double override { return 1.0; }
    void set_cursor(Cursor cursor) override {
        if (cursor != cursor_) {
            std::cout << "cursor " << CursorName(cursor) << '\n';
            cursor_ = cursor;
        }
    }

    void present(std::span<std::uint8_t const> pixels, int, int, std::size_t) override {
        ++frames_presented;
        last_frame_bytes = pixels.size();
    }

    auto now() const -> double override { return now_; }

    void advance(double seconds) { now_ += seconds; }
    void move_mouse(int x, int y) { mouse_ = PointI{x, y}; }
    void set_buttons(unsigned cap) { cap_ = cap; }
    void scroll(double delta) { wheel_ = delta; }
    void type(long key) { keys_.push_back(key); }
    void drop(std::string path) { drops_.push_back(std::move(path)); }

    int         frames_presented = 0;
    std::size_t last_frame_bytes = 0;

private:
    SizeI                    canvas_{};
    PointI                   position_{};
    DockState                dock_ = 0;
    PointI                   mouse_{};
    unsigned                 cap_ = 0;
    double                   wheel_ = 0.0;
    std::deque<long>         keys_;
    std::vector<std::string> drops_;
    Cursor                   cursor_ = Cursor::Undefined;
    double                   now_ = 0.0;
};

// A single clickable panel: highlights under the cursor and counts clicks.
class ClickPanel final : public Widget {
public:
    void draw(DrawContext& ctx) override {
        auto const color = hovered_ ? 0x3a6ea5ffu : 0x444444ffu;
        ctx.target.fill_rect(PixelRect{static_cast<int>(box_.x), static_cast<int>(box_.y), static_cast<int>(box_.w),
                                       static_cast<int>(box_.h)},
                             color);
        if (hovered_) {
            ctx.window.request_cursor(Cursor::Hand);
        }
    }

    void dispatch_event(Event& event, Window& window, bool) override {
        if (!event.is_mouse_event() && event.type != EventType::Key && event.type != EventType::DropFile) {
            return;
        }
        bool const inside = event.x >= box_.x && event.y >= box_.y && event.x < box_.x + box_.w
                            && event.y < box_.y + box_.h;
        if (inside != hovered_) {
            hovered_ = inside;
            window.queue_draw();
        }
        if (inside) {
            window.set_widget_mouseover(this, event);
        }
        switch (event.type) {
        case EventType::MouseDown:
            if (inside && !event.simulated) {
                window.set_widget_pressed(this, event);
                event.set_handled(this);
            }
            break;
        case EventType::MouseUp:
            if (inside && window.is_widget_pressed(this)) {
                ++clicks;
                std::cout << "click #" << clicks << " at " << event.x << "," << event.y << '\n';
                event.set_handled(this);
            }
            break;
        case EventType::MouseWheel:
            std::cout << "wheel " << event.wheel << '\n';
            break;
        case EventType::Key:
            if (event.character) {
                std::cout << "key '" << *event.character << "'\n";
            }
            break;
        case EventType::DropFile:
            for (auto const& file : event.files) {
                std::cout << "dropped " << file << '\n';
            }
            break;
        default:
            break;
        }
    }

    auto tooltip() const -> std::optional<std::string> override { return std::string{"Click me"}; }
    void draw_tooltip(DrawContext&, double x, double y) override {
        std::cout << "tooltip at " << x << "," << y << '\n';
    }

    int clicks = 0;

protected:
    void on_reflow(LayoutBox const& box, Window&) override {
        auto const margin = box.w / 4.0;
        box_ = LayoutBox{box.x + margin, box.y + box.h / 4.0, box.w - 2.0 * margin, box.h / 2.0};
    }

private:
    LayoutBox box_{};
    bool      hovered_ = false;
};

auto parse_int(std::string_view text) -> std::optional<int> {
    int value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

int main(int argc, char** argv) {
    std::optional<std::string> config_path;
    int                        frames = 90;
    for (int idx = 1; idx < argc; ++idx) {
        std::string_view arg{argv[idx]};
        if (arg == "--config" && idx + 1 < argc) {
            config_path = argv[++idx];
        } else if (arg == "--frames" && idx + 1 < argc) {
            auto parsed = parse_int(argv[++idx]);
            if (!parsed || *parsed <= 0) {
                std::cerr << "Invalid frame count: " << argv[idx] << '\n';
                return 1;
            }
            frames = *parsed;
        } else {
            std::cerr << "Unknown argument: " << arg << '\n';
            std::cerr << "Usage: " << argv[0] << " [--config <file.json>] [--frames <count>]\n";
            return 1;
        }
    }

    RuntimeConfig config;
    if (config_path) {
        auto loaded = LoadRuntimeConfig(*config_path);
        if (!loaded) {
            std::cerr << "LoadRuntimeConfig failed: " << RTK::describeError(loaded.error()) << '\n';
            return 1;
        }
        config = *loaded;
    }
    ApplyEnvironmentOverrides(config);

    ScriptedHost host;
    auto window = Window::Create(host, nullptr, config);
    if (!window) {
        std::cerr << "Window::Create failed: " << RTK::describeError(window.error()) << '\n';
        return 1;
    }

    auto panel = std::make_shared<ClickPanel>();
    (*window)->set_content(panel);
    if (auto titled = (*window)->set_attribute("title", AttributeValue{std::string{"rtk headless example"}}); !titled) {
        std::cerr << "set_attribute failed: " << RTK::describeError(titled.error()) << '\n';
        return 1;
    }
    if (auto sized = (*window)->resize(400, 300); !sized) {
        std::cerr << "resize failed: " << RTK::describeError(sized.error()) << '\n';
        return 1;
    }
    (*window)->callbacks().on_close = [] { std::cout << "window closed\n"; };

    PlacementHints hints;
    hints.halign = HAlign::Center;
    hints.valign = VAlign::Center;
    if (auto opened = (*window)->open(hints); !opened) {
        std::cerr << "Window::open failed: " << RTK::describeError(opened.error()) << '\n';
        return 1;
    }

    double const dt = config.tick_interval();
    for (int frame = 0; frame < frames && (*window)->running(); ++frame) {
        switch (frame) {
        case 2:
            host.move_mouse(200, 150);
            break;
        case 30:
            host.set_buttons(MouseButton::Left);
            break;
        case 32:
            host.set_buttons(0);
            break;
        case 40:
            host.scroll(-120.0);
            break;
        case 45:
            host.type('r');
            host.type('t');
            host.type('k');
            break;
        case 50:
            host.drop("/tmp/kick.wav");
            break;
        default:
            break;
        }
        if (frame == frames - 1) {
            host.type(Keycode::Escape);
        }
        host.advance(dt);
        (*window)->tick();
    }

    std::cout << "frames presented: " << host.frames_presented << " (" << host.last_frame_bytes << " bytes), clicks: "
              << panel->clicks << '\n';
    return 0;
}
