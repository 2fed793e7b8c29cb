#pragma once

#include <mutex>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <optional>

namespace meshlink {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal,
    Off
};

// Parse a level name ("trace", "DEBUG", "warn", ...). Unknown names yield nullopt.
[[nodiscard]]
inline std::optional<Level> parse_level(std::string_view name) noexcept {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>((c >= 'A' && c <= 'Z') ? c - 'A' + 'a' : c));
    }
    if (lower == "trace")                     return Level::Trace;
    if (lower == "debug")                     return Level::Debug;
    if (lower == "info")                      return Level::Info;
    if (lower == "warn" || lower == "warning") return Level::Warn;
    if (lower == "error")                     return Level::Error;
    if (lower == "fatal")                     return Level::Fatal;
    if (lower == "off" || lower == "none")    return Level::Off;
    return std::nullopt;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
//
// Link completions may be logged from transport threads before they are
// marshaled into the session loop, so the sink is guarded by a mutex.
//
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }

    Level level() const noexcept { return level_; }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level_ && level_ != Level::Off; }

    // Reads MESHLINK_LOG_LEVEL. Returns false if unset or not a known level name.
    bool init_from_env() noexcept {
        const char* value = std::getenv("MESHLINK_LOG_LEVEL");
        if (value == nullptr) {
            return false;
        }
        auto lvl = parse_level(value);
        if (!lvl) {
            return false;
        }
        level_ = *lvl;
        return true;
    }

    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = (os != nullptr) ? os : &std::cout;
    }

    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "] " << msg;
        if (color_enabled_) os << "\033[0m";
        os << '\n';
        if (lvl >= Level::Error) os.flush();
    }

    static const char* level_name(Level lvl) noexcept {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
            case Level::Off:   return "OFF";
        }
        return "?????";
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(false)
    {}

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";
            case Level::Debug: return "\033[36m";
            case Level::Info:  return "\033[32m";
            case Level::Warn:  return "\033[33m";
            case Level::Error: return "\033[31m";
            case Level::Fatal: return "\033[1;31m";
            case Level::Off:   return "\033[0m";
        }
        return "\033[0m";
    }

    // Wall-clock timestamp with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        char out[40];
        std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms));
        return out;
    }

    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace meshlink


// ---------------------------------------------------------
// Logging macros. The level check happens before the stream is built,
// so disabled levels cost one comparison.
// ---------------------------------------------------------
#define ML_LOG_LEVEL(lvl)                                              \
    if (!::meshlink::log::Logger::instance().enabled(lvl)) {}          \
    else ::meshlink::log::LogStream((lvl))

#define ML_TRACE(msg)  ML_LOG_LEVEL(::meshlink::log::Level::Trace) << msg
#define ML_DEBUG(msg)  ML_LOG_LEVEL(::meshlink::log::Level::Debug) << msg
#define ML_INFO(msg)   ML_LOG_LEVEL(::meshlink::log::Level::Info)  << msg
#define ML_WARN(msg)   ML_LOG_LEVEL(::meshlink::log::Level::Warn)  << msg
#define ML_ERROR(msg)  ML_LOG_LEVEL(::meshlink::log::Level::Error) << msg
#define ML_FATAL(msg)  ML_LOG_LEVEL(::meshlink::log::Level::Fatal) << msg
