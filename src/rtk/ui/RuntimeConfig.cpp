#include <rtk/ui/RuntimeConfig.hpp>

#include "rtk/log/TaggedLogger.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>

namespace RTK::UI {

using json = nlohmann::json;

namespace {

auto trim(std::string_view text) -> std::string_view {
    auto is_space = [](char ch) {
        return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
    };
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto lowercase(std::string_view text) -> std::string {
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    return normalized;
}

// Unset is nullopt; an empty value counts as enabled.
auto parse_truthy(char const* value) -> std::optional<bool> {
    if (value == nullptr) {
        return std::nullopt;
    }
    auto text = trim(value);
    if (text.empty()) {
        return true;
    }
    auto normalized = lowercase(text);
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return true;
}

auto parse_double(std::string_view text) -> std::optional<double> {
    text = trim(text);
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto read_number(json const& payload, char const* key, double& out) -> Expected<void> {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return {};
    }
    if (!it->is_number()) {
        return makeError(Error::Code::MalformedInput, std::string{"config key '"} + key + "' must be a number");
    }
    out = it->get<double>();
    return {};
}

auto read_delay(json const& payload, char const* key, double& out) -> Expected<void> {
    auto value = out;
    if (auto status = read_number(payload, key, value); !status) {
        return status;
    }
    if (value < 0.0) {
        return makeError(Error::Code::InvalidType, std::string{"config key '"} + key + "' must not be negative");
    }
    out = value;
    return {};
}

auto read_bool(json const& payload, char const* key, bool& out) -> Expected<void> {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return {};
    }
    if (!it->is_boolean()) {
        return makeError(Error::Code::MalformedInput, std::string{"config key '"} + key + "' must be a boolean");
    }
    out = it->get<bool>();
    return {};
}

auto read_string(json const& payload, char const* key) -> Expected<std::optional<std::string>> {
    auto it = payload.find(key);
    if (it == payload.end()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return makeError(Error::Code::MalformedInput, std::string{"config key '"} + key + "' must be a string");
    }
    return std::optional<std::string>{it->get<std::string>()};
}

} // namespace

auto WheelModeName(WheelMode mode) -> std::string_view {
    return mode == WheelMode::Damped ? "damped" : "linear";
}

auto WheelModeFromName(std::string_view name) -> std::optional<WheelMode> {
    auto normalized = lowercase(trim(name));
    if (normalized == "damped") {
        return WheelMode::Damped;
    }
    if (normalized == "linear") {
        return WheelMode::Linear;
    }
    return std::nullopt;
}

auto ParseRuntimeConfig(std::string_view json_text) -> Expected<RuntimeConfig> {
    auto payload = json::parse(json_text, nullptr, false);
    if (payload.is_discarded()) {
        return makeError(Error::Code::MalformedInput, "runtime config is not valid JSON");
    }
    if (!payload.is_object()) {
        return makeError(Error::Code::MalformedInput, "runtime config must be a JSON object");
    }

    RuntimeConfig config{};
    std::array<Expected<void>, 12> scalar_results{
        read_bool(payload, "touch_scroll", config.touch_scroll),
        read_delay(payload, "touch_activate_delay", config.touch_activate_delay),
        read_delay(payload, "long_press_delay", config.long_press_delay),
        read_delay(payload, "tooltip_delay", config.tooltip_delay),
        read_delay(payload, "double_click_guard", config.double_click_guard),
        read_delay(payload, "slow_reflow_threshold", config.slow_reflow_threshold),
        read_delay(payload, "slow_tick_threshold", config.slow_tick_threshold),
        read_number(payload, "fps", config.fps),
        read_number(payload, "drag_threshold_exponent", config.drag_threshold_exponent),
        read_number(payload, "double_click_threshold_factor", config.double_click_threshold_factor),
        read_number(payload, "user_scale", config.user_scale),
        read_bool(payload, "debug", config.debug),
    };
    for (auto& result : scalar_results) {
        if (!result) {
            return std::unexpected(result.error());
        }
    }
    if (config.fps <= 0.0) {
        return makeError(Error::Code::InvalidType, "config key 'fps' must be positive");
    }
    if (config.user_scale <= 0.0) {
        return makeError(Error::Code::InvalidType, "config key 'user_scale' must be positive");
    }

    if (auto it = payload.find("partial_reflow_limit"); it != payload.end()) {
        if (!it->is_number_unsigned()) {
            return makeError(Error::Code::MalformedInput, "config key 'partial_reflow_limit' must be a non-negative integer");
        }
        config.partial_reflow_limit = it->get<std::size_t>();
    }
    if (auto it = payload.find("debug_toggle_key"); it != payload.end()) {
        if (!it->is_number_integer()) {
            return makeError(Error::Code::MalformedInput, "config key 'debug_toggle_key' must be an integer");
        }
        config.debug_toggle_key = it->get<long>();
    }

    auto wheel_mode = read_string(payload, "wheel_mode");
    if (!wheel_mode) {
        return std::unexpected(wheel_mode.error());
    }
    if (*wheel_mode) {
        auto mode = WheelModeFromName(**wheel_mode);
        if (!mode) {
            return makeError(Error::Code::InvalidType, "unknown wheel_mode '" + **wheel_mode + "'");
        }
        config.wheel_mode = *mode;
    }

    auto cursor = read_string(payload, "default_cursor");
    if (!cursor) {
        return std::unexpected(cursor.error());
    }
    if (*cursor) {
        auto parsed = CursorFromName(**cursor);
        if (parsed == Cursor::Undefined) {
            return makeError(Error::Code::InvalidType, "unknown default_cursor '" + **cursor + "'");
        }
        config.default_cursor = parsed;
    }
    return config;
}

auto LoadRuntimeConfig(std::filesystem::path const& path) -> Expected<RuntimeConfig> {
    std::ifstream stream(path);
    if (!stream) {
        return makeError(Error::Code::NotFound, "unable to open runtime config " + path.string());
    }
    std::ostringstream buffer;
    buffer << stream.rdbuf();
    auto config = ParseRuntimeConfig(buffer.str());
    if (!config) {
        rtk_log_warning("failed to load runtime config " + path.string() + ": " + describeError(config.error()), "config");
    }
    return config;
}

void ApplyEnvironmentOverrides(RuntimeConfig& config) {
    if (auto touch = parse_truthy(std::getenv("RTK_TOUCH_SCROLL"))) {
        config.touch_scroll = *touch;
    }
    if (auto debug = parse_truthy(std::getenv("RTK_UI_DEBUG"))) {
        config.debug = *debug;
    }
    if (auto const* scale_text = std::getenv("RTK_UI_SCALE")) {
        auto scale = parse_double(scale_text);
        if (scale && *scale > 0.0) {
            config.user_scale = *scale;
        } else {
            rtk_log_warning(std::string{"ignoring invalid RTK_UI_SCALE '"} + scale_text + "'", "config");
        }
    }
    if (auto const* wheel_text = std::getenv("RTK_WHEEL_MODE")) {
        if (auto mode = WheelModeFromName(wheel_text)) {
            config.wheel_mode = *mode;
        } else {
            rtk_log_warning(std::string{"ignoring invalid RTK_WHEEL_MODE '"} + wheel_text + "'", "config");
        }
    }
}

} // namespace RTK::UI
