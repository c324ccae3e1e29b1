#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <set>
#include <source_location>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_map>

namespace RTK {

enum class LogLevel : int {
    Debug2   = 9,
    Debug    = 10,
    Info     = 20,
    Warning  = 30,
    Error    = 40,
    Critical = 50,
};

// Used when RTK_LOG_LEVEL is unset: informational lifecycle messages stay quiet.
inline constexpr LogLevel kDefaultLogLevel = LogLevel::Warning;

[[nodiscard]] auto logLevelName(LogLevel level) -> std::string_view;
[[nodiscard]] auto parseLogLevel(std::string_view text) -> std::optional<LogLevel>;

class TaggedLogger {
public:
    struct LogMessage {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level = LogLevel::Info;
        std::set<std::string>                 tags;
        std::string                           message;
        std::string                           threadName;
        std::source_location                  location;
    };

    TaggedLogger();
    ~TaggedLogger();

    TaggedLogger(const TaggedLogger&)            = delete;
    TaggedLogger& operator=(const TaggedLogger&) = delete;
    TaggedLogger(TaggedLogger&&)                 = delete;
    TaggedLogger& operator=(TaggedLogger&&)      = delete;

    template <typename... Tags>
    auto log_impl(LogLevel level, const std::string& message, const std::source_location& location, Tags&&... tags) -> void;

    auto setThreadName(const std::string& name) -> void;
    auto setLoggingEnabled(bool enabled) -> void;
    auto setLevel(LogLevel level) -> void;
    [[nodiscard]] auto level() const -> LogLevel;
    [[nodiscard]] auto enabledFor(LogLevel level) const -> bool;

    // Blocks until every queued message has been written.
    auto flush() -> void;

    static std::mutex coutMutex;

private:
    std::queue<LogMessage>  messageQueue;
    mutable std::mutex      queueMutex;
    std::condition_variable cv;
    std::condition_variable drained;
    std::thread             workerThread;
    std::atomic<bool>       running;
    std::atomic<bool>       loggingEnabled;
    std::atomic<int>        minimumLevel;
    std::size_t             inFlight = 0;
    std::set<std::string>   skipTags{};
    std::set<std::string>   enabledTags{};

    std::unordered_map<std::thread::id, std::string> threadNames;
    mutable std::mutex                               threadNamesMutex;
    std::atomic<int>                                 nextThreadNumber;

    auto        applyEnvironment() -> void;
    auto        processQueue() -> void;
    auto        writeToStderr(const LogMessage& msg) const -> void;
    auto        getThreadName(const std::thread::id& id) -> std::string;
    static auto getShortPath(const char* filepath) -> std::string;
};

TaggedLogger& logger();

template <typename... Tags>
auto TaggedLogger::log_impl(LogLevel level, const std::string& message, const std::source_location& location, Tags&&... tags) -> void {
    if (!enabledFor(level))
        return;

    auto logMessage = LogMessage{.timestamp = std::chrono::system_clock::now(), .level = level, .tags = {std::string(std::forward<Tags>(tags))...}, .message = message, .threadName = getThreadName(std::this_thread::get_id()), .location = location};

    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->messageQueue.push(std::move(logMessage));
        this->cv.notify_one();
    }
}

#define rtk_log_at(level, message, ...) ::RTK::logger().log_impl(level, message, std::source_location::current(), ##__VA_ARGS__)
#define rtk_log(message, ...) rtk_log_at(::RTK::LogLevel::Info, message, ##__VA_ARGS__)
#define rtk_log_debug(message, ...) rtk_log_at(::RTK::LogLevel::Debug, message, ##__VA_ARGS__)
#define rtk_log_warning(message, ...) rtk_log_at(::RTK::LogLevel::Warning, message, ##__VA_ARGS__)
#define rtk_log_error(message, ...) rtk_log_at(::RTK::LogLevel::Error, message, ##__VA_ARGS__)

void set_thread_name(const std::string& name);
void set_logging_enabled(bool enabled);
void set_log_level(LogLevel level);

} // namespace RTK
