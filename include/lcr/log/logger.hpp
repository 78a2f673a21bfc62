#pragma once

#include <mutex>
#include <cstdint>
#include <cstddef>
#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <ctime>
#include <cstdio>

namespace lcr {
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
    Fatal
};

// Parses "trace" | "debug" | "info" | "warn" | "error" | "fatal"
[[nodiscard]]
inline bool parse_level(std::string_view text, Level& out) noexcept {
    if (text == "trace")      { out = Level::Trace; return true; }
    if (text == "debug")      { out = Level::Debug; return true; }
    if (text == "info")       { out = Level::Info;  return true; }
    if (text == "warn")       { out = Level::Warn;  return true; }
    if (text == "error")      { out = Level::Error; return true; }
    if (text == "fatal")      { out = Level::Fatal; return true; }
    return false;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    // Default cap for the file sink (10 MiB)
    static constexpr std::size_t DEFAULT_FILE_CAP = 10 * 1024 * 1024;

    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_ = lvl; }

    Level level() const noexcept { return level_; }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        close_file_();
        out_ = os;
    }

    // Redirect output to a file. The file is truncated and restarted once
    // it would grow beyond max_bytes.
    [[nodiscard]]
    bool set_file(const std::string& path, std::size_t max_bytes = DEFAULT_FILE_CAP) {
        std::lock_guard<std::mutex> lock(mutex_);
        close_file_();
        file_.open(path, std::ios::out | std::ios::app);
        if (!file_.is_open()) {
            out_ = &std::cout;
            return false;
        }
        file_path_ = path;
        file_cap_ = max_bytes;
        file_.seekp(0, std::ios::end);
        const auto pos = file_.tellp();
        file_bytes_ = (pos > 0) ? static_cast<std::size_t>(pos) : 0;
        color_enabled_ = false;
        out_ = &file_;
        return true;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (lvl < level_) return;
        std::lock_guard<std::mutex> lock(mutex_);
        std::string line = timestamp();
        line += " [";
        line += level_name(lvl);
        line += "] ";
        line += msg;
        if (out_ == &file_) {
            rotate_if_needed_(line.size() + 1);
            file_bytes_ += line.size() + 1;
        }
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << line;
        if (color_enabled_) os << "\033[0m"; // reset
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(true)
    {}

    void close_file_() {
        if (file_.is_open()) {
            file_.close();
        }
        file_path_.clear();
        file_bytes_ = 0;
    }

    void rotate_if_needed_(std::size_t incoming) {
        if (file_cap_ == 0 || file_bytes_ + incoming <= file_cap_) {
            return;
        }
        file_.close();
        file_.open(file_path_, std::ios::out | std::ios::trunc);
        file_bytes_ = 0;
    }

    // Human-readable severity names
    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
        }
        return "?????";
    }

    // ANSI color mappings
    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
        }
        return "\033[0m";
    }

    // Timestamp generation (local time, millisecond resolution)
    static std::string timestamp() {
        using namespace std::chrono;
        auto now = system_clock::now();
        auto t = system_clock::to_time_t(now);
        auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[64];
        std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    Level level_;
    bool color_enabled_;
    std::mutex mutex_;

    // File sink
    std::ofstream file_;
    std::string file_path_;
    std::size_t file_cap_{DEFAULT_FILE_CAP};
    std::size_t file_bytes_{0};
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    LogStream(Level lvl) : lvl_(lvl) {}

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
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging
// ---------------------------------------------------------
#define LS_LOG_LEVEL(lvl) ::lcr::log::LogStream((lvl))

#define LS_TRACE(msg)  LS_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define LS_DEBUG(msg)  LS_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define LS_INFO(msg)   LS_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define LS_WARN(msg)   LS_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define LS_ERROR(msg)  LS_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define LS_FATAL(msg)  LS_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
