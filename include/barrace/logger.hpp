#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace barrace
{

enum class LogLevel : int
{
    Debug   = 0,
    Info    = 1,
    Warning = 2,
    Error   = 3,
};

namespace detail
{

template <typename T>
std::string log_arg_to_string(T&& v)
{
    using D = std::decay_t<T>;
    if constexpr (std::is_same_v<D, std::string>)
        return v;
    else if constexpr (std::is_same_v<D, std::string_view>)
        return std::string(v);
    else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        return v ? std::string(v) : std::string("(null)");
    else if constexpr (std::is_same_v<D, bool>)
        return v ? "true" : "false";
    else
        return std::to_string(v);
}

// Replace each "{}" in order. Substituted text is never rescanned; surplus
// placeholders stay literal.
template <typename... Args>
std::string format_braces(std::string_view format, Args&&... args)
{
    std::string result(format);
    if constexpr (sizeof...(args) > 0)
    {
        size_t search_from  = 0;
        auto   replace_next = [&](auto&& arg)
        {
            auto pos = result.find("{}", search_from);
            if (pos == std::string::npos)
                return;
            std::string text = log_arg_to_string(std::forward<decltype(arg)>(arg));
            result.replace(pos, 2, text);
            search_from = pos + text.size();
        };
        (replace_next(std::forward<Args>(args)), ...);
    }
    return result;
}

}  // namespace detail

// Process-wide logger. The library installs no sink; the host (the CLI, a
// test fixture) decides where entries go.
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

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel level, std::string_view category, std::string_view format, Args&&... args)
    {
        if (is_enabled(level))
            log(level, category, detail::format_braces(format, std::forward<Args>(args)...));
    }

    static std::string level_to_string(LogLevel level);
    static bool        parse_level(std::string_view name, LogLevel& out);

    // "2025-03-04 12:00:00.123 INFO [data] message"
    static std::string format_line(const LogEntry& entry);

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
// Coloured lines on stderr.
Logger::LogSink console_sink();
// Appends to filename. Throws std::runtime_error if it cannot be opened.
Logger::LogSink file_sink(const std::string& filename);
}  // namespace sinks

#define BARRACE_LOG_AT(level, category, ...)                                          \
    do                                                                                \
    {                                                                                 \
        if (::barrace::Logger::instance().is_enabled(level))                          \
            ::barrace::Logger::instance().log_formatted(level, category, __VA_ARGS__); \
    } while (0)

#define BARRACE_LOG_DEBUG(category, ...) BARRACE_LOG_AT(::barrace::LogLevel::Debug, category, __VA_ARGS__)
#define BARRACE_LOG_INFO(category, ...)  BARRACE_LOG_AT(::barrace::LogLevel::Info, category, __VA_ARGS__)
#define BARRACE_LOG_WARN(category, ...)  BARRACE_LOG_AT(::barrace::LogLevel::Warning, category, __VA_ARGS__)
#define BARRACE_LOG_ERROR(category, ...) BARRACE_LOG_AT(::barrace::LogLevel::Error, category, __VA_ARGS__)

}  // namespace barrace
