#pragma once

#include <chrono>
#include <concepts>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace glide
{

enum class LogLevel : int
{
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5
};

namespace detail
{

inline std::string to_log_string(std::string_view v)
{
    return std::string(v);
}

inline std::string to_log_string(const char* v)
{
    return v ? std::string(v) : std::string("(null)");
}

inline std::string to_log_string(bool v)
{
    return v ? "true" : "false";
}

template <typename T>
    requires std::is_arithmetic_v<T>
std::string to_log_string(T v)
{
    return std::to_string(v);
}

// Substitutes each "{}" in order. Surplus placeholders stay as written;
// surplus arguments are dropped.
template <typename... Args>
std::string format_log_message(std::string_view format, const Args&... args)
{
    std::string result(format);
    size_t      cursor = 0;

    auto substitute = [&](const std::string& text)
    {
        auto pos = result.find("{}", cursor);
        if (pos == std::string::npos)
            return;
        result.replace(pos, 2, text);
        cursor = pos + text.size();
    };
    (substitute(to_log_string(args)), ...);
    return result;
}

}   // namespace detail

// Process-wide leveled logger. Entries below the current level are dropped
// before formatting; the rest are handed to every registered sink under a lock.
class Logger
{
   public:
    struct LogEntry
    {
        std::chrono::system_clock::time_point timestamp;
        LogLevel                              level;
        std::string                           category;
        std::string                           message;
    };

    using LogSink = std::function<void(const LogEntry&)>;

    static Logger& instance();

    void     set_level(LogLevel level);
    LogLevel get_level() const;
    bool     is_enabled(LogLevel level) const;

    void add_sink(LogSink sink);
    void clear_sinks();

    // Applies GLIDE_LOG_LEVEL from the environment, if present: sets the level
    // and installs a console sink. Returns false when the variable is unset or
    // names no known level.
    bool configure_from_env();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       const Args&... args)
    {
        if (is_enabled(level))
            log(level, category, detail::format_log_message(format, args...));
    }

    static std::string             level_to_string(LogLevel level);
    static std::optional<LogLevel> level_from_string(std::string_view name);

   private:
    Logger()                         = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;
};

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
}   // namespace sinks

#define GLIDE_LOG_AT(level, category, ...)                                           \
    do                                                                               \
    {                                                                                \
        if (::glide::Logger::instance().is_enabled(level))                           \
        {                                                                            \
            ::glide::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
        }                                                                            \
    } while (0)

#define GLIDE_LOG_TRACE(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Trace, category, __VA_ARGS__)
#define GLIDE_LOG_DEBUG(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Debug, category, __VA_ARGS__)
#define GLIDE_LOG_INFO(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Info, category, __VA_ARGS__)
#define GLIDE_LOG_WARN(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Warning, category, __VA_ARGS__)
#define GLIDE_LOG_ERROR(category, ...) GLIDE_LOG_AT(::glide::LogLevel::Error, category, __VA_ARGS__)
#define GLIDE_LOG_CRITICAL(category, ...) \
    GLIDE_LOG_AT(::glide::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace glide
