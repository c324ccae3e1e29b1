#include "TaggedLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <vector>

namespace RTK {

namespace {

template <typename Range, typename Delimiter>
std::string join_with_impl(const Range& range, const Delimiter& delim) {
    std::ostringstream oss;
    bool               first = true;
    for (const auto& item : range) {
        if (!first)
            oss << delim;
        oss << item;
        first = false;
    }
    return oss.str();
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
        text.remove_prefix(1);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
        text.remove_suffix(1);
    return text;
}

auto split_tags(char const* value) -> std::vector<std::string> {
    std::vector<std::string> out;
    if (value == nullptr)
        return out;
    std::string_view rest{value};
    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto token = trim(rest.substr(0, comma));
        if (!token.empty())
            out.emplace_back(token);
        if (comma == std::string_view::npos)
            break;
        rest.remove_prefix(comma + 1);
    }
    return out;
}

auto lowered(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (char ch : text)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    return out;
}

auto env_flag(char const* name) -> std::optional<bool> {
    char const* value = std::getenv(name);
    if (value == nullptr)
        return std::nullopt;
    auto normalized = lowered(trim(value));
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no")
        return false;
    return true;
}

} // namespace

auto logLevelName(LogLevel level) -> std::string_view {
    switch (level) {
    case LogLevel::Debug2:
        return "DEBUG2";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warning:
        return "WARNING";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Critical:
        return "CRITICAL";
    }
    return "UNKNOWN";
}

auto parseLogLevel(std::string_view text) -> std::optional<LogLevel> {
    auto normalized = lowered(trim(text));
    if (normalized.empty())
        return std::nullopt;
    for (auto level : {LogLevel::Debug2, LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::Critical}) {
        if (normalized == lowered(logLevelName(level)))
            return level;
    }
    if (normalized == "warn")
        return LogLevel::Warning;
    if (std::all_of(normalized.begin(), normalized.end(), [](char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; })) {
        auto numeric = std::atoi(normalized.c_str());
        for (auto level : {LogLevel::Debug2, LogLevel::Debug, LogLevel::Info, LogLevel::Warning, LogLevel::Error, LogLevel::Critical}) {
            if (numeric == static_cast<int>(level))
                return level;
        }
    }
    return std::nullopt;
}

std::mutex TaggedLogger::coutMutex;

TaggedLogger& logger() {
    static TaggedLogger instance;
    return instance;
}

TaggedLogger::TaggedLogger()
    : running(true), loggingEnabled(true), minimumLevel(static_cast<int>(kDefaultLogLevel)), nextThreadNumber(0) {
    this->applyEnvironment();
    this->workerThread = std::thread(&TaggedLogger::processQueue, this);
}

TaggedLogger::~TaggedLogger() {
    {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->running = false;
        this->cv.notify_one();
    }
    if (this->workerThread.joinable()) {
        this->workerThread.join();
    }
}

auto TaggedLogger::applyEnvironment() -> void {
    if (auto enabled = env_flag("RTK_LOG_ENABLED")) {
        loggingEnabled = *enabled;
    } else if (auto legacy = env_flag("RTK_LOG")) {
        loggingEnabled = *legacy;
    }
    if (char const* level = std::getenv("RTK_LOG_LEVEL")) {
        if (auto parsed = parseLogLevel(level))
            minimumLevel = static_cast<int>(*parsed);
    }
    for (auto& tag : split_tags(std::getenv("RTK_LOG_ENABLE_TAGS")))
        enabledTags.insert(std::move(tag));
    for (auto& tag : split_tags(std::getenv("RTK_LOG_SKIP_TAGS")))
        skipTags.insert(std::move(tag));
}

auto TaggedLogger::setThreadName(const std::string& name) -> void {
    const auto                  threadId = std::this_thread::get_id();
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    threadNames[threadId] = name;
}

auto TaggedLogger::setLoggingEnabled(bool enabled) -> void {
    loggingEnabled.store(enabled, std::memory_order_relaxed);
}

auto TaggedLogger::setLevel(LogLevel level) -> void {
    minimumLevel.store(static_cast<int>(level), std::memory_order_relaxed);
}

auto TaggedLogger::level() const -> LogLevel {
    return static_cast<LogLevel>(minimumLevel.load(std::memory_order_relaxed));
}

auto TaggedLogger::enabledFor(LogLevel level) const -> bool {
    return loggingEnabled.load(std::memory_order_relaxed) && static_cast<int>(level) >= minimumLevel.load(std::memory_order_relaxed);
}

auto TaggedLogger::flush() -> void {
    std::unique_lock<std::mutex> lock(this->queueMutex);
    this->drained.wait(lock, [this] { return this->messageQueue.empty() && this->inFlight == 0; });
}

auto TaggedLogger::processQueue() -> void {
    while (true) {
        std::unique_lock<std::mutex> lock(this->queueMutex);
        this->cv.wait(lock, [this] { return !this->messageQueue.empty() || !this->running; });

        if (!this->running && this->messageQueue.empty()) {
            this->drained.notify_all();
            return;
        }

        while (!this->messageQueue.empty()) {
            const auto msg = std::move(this->messageQueue.front());
            this->messageQueue.pop();
            ++this->inFlight;
            lock.unlock();
            this->writeToStderr(msg);
            lock.lock();
            --this->inFlight;
        }
        this->drained.notify_all();
    }
}

auto TaggedLogger::getShortPath(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    fs::path p{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

auto TaggedLogger::writeToStderr(const LogMessage& msg) const -> void {
    if (this->enabledTags.size())
        for (auto const& tag : msg.tags)
            if (!this->enabledTags.contains(tag))
                return;
    for (auto const& skipTag : this->skipTags)
        if (msg.tags.contains(skipTag))
            return;
    const auto  now      = msg.timestamp;
    const auto  nowMs    = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    const auto  nowTimeT = std::chrono::system_clock::to_time_t(now);
    const auto* nowTm    = std::localtime(&nowTimeT);

    std::ostringstream oss;
    oss << std::put_time(nowTm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0') << std::setw(3) << nowMs.count() << ' ';
    oss << '[' << logLevelName(msg.level) << "] ";
    if (!msg.tags.empty())
        oss << '[' << join_with_impl(msg.tags, std::string("][")) << ']' << ' ';

    oss << "[" << msg.threadName << "] ";
    oss << "[" << getShortPath(msg.location.file_name()) << ":" << msg.location.line() << "] ";
    oss << msg.message << '\n';

    std::lock_guard<std::mutex> lock(coutMutex);
    std::cerr << oss.str() << std::flush;
}

auto TaggedLogger::getThreadName(const std::thread::id& id) -> std::string {
    std::lock_guard<std::mutex> lock(threadNamesMutex);
    auto                        it = threadNames.find(id);
    if (it != threadNames.end()) {
        return it->second;
    } else {
        std::string name = "Thread " + std::to_string(nextThreadNumber++);
        threadNames[id]  = name;
        return name;
    }
}

void set_thread_name(const std::string& name) {
    logger().setThreadName(name);
}

void set_logging_enabled(bool enabled) {
    logger().setLoggingEnabled(enabled);
}

void set_log_level(LogLevel level) {
    logger().setLevel(level);
}

} // namespace RTK
