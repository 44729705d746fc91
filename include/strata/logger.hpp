#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace strata
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

    void add_sink(LogSink sink);
    void clear_sinks();

    void log(LogLevel level, std::string_view category, std::string_view message);

    template <typename... Args>
    void log_formatted(LogLevel         level,
                       std::string_view category,
                       std::string_view format,
                       Args&&... args);

    bool is_enabled(LogLevel level) const;

    static std::string level_to_string(LogLevel level);
    static std::string timestamp_to_string(const std::chrono::system_clock::time_point& tp);

    // Expands "{}" placeholders left to right. Extra arguments are dropped,
    // missing ones leave the placeholder in place.
    template <typename... Args>
    static std::string format_message(std::string_view format, Args&&... args)
    {
        std::string result(format);
        std::size_t cursor = 0;
        auto        replace_next = [&](auto&& arg)
        {
            auto pos = result.find("{}", cursor);
            if (pos != std::string::npos)
            {
                std::string text = arg_to_string(std::forward<decltype(arg)>(arg));
                result.replace(pos, 2, text);
                cursor = pos + text.size();
            }
        };
        (replace_next(std::forward<Args>(args)), ...);
        return result;
    }

   private:
    Logger()                         = default;
    ~Logger()                        = default;
    Logger(const Logger&)            = delete;
    Logger& operator=(const Logger&) = delete;

    mutable std::mutex   mutex_;
    LogLevel             min_level_ = LogLevel::Info;
    std::vector<LogSink> sinks_;

    template <typename T>
    static std::string arg_to_string(T&& v)
    {
        using D = std::decay_t<T>;
        if constexpr (std::is_same_v<D, std::string>)
            return v;
        else if constexpr (std::is_same_v<D, std::string_view>)
            return std::string(v);
        else if constexpr (std::is_same_v<D, const char*> || std::is_same_v<D, char*>)
        {
            const char* p = v;
            return p ? std::string(p) : std::string("(null)");
        }
        else if constexpr (std::is_same_v<D, bool>)
            return v ? "true" : "false";
        else
            return std::to_string(v);
    }
};

// Callers go through STRATA_LOG_*, which already checked the level
template <typename... Args>
void Logger::log_formatted(LogLevel         level,
                           std::string_view category,
                           std::string_view format,
                           Args&&... args)
{
    log(level, category, format_message(format, std::forward<Args>(args)...));
}

namespace sinks
{
Logger::LogSink console_sink();
Logger::LogSink file_sink(const std::string& filename);
}   // namespace sinks

#define STRATA_LOG_AT(lvl, category, ...)                                               \
    do                                                                                  \
    {                                                                                   \
        if (::strata::Logger::instance().is_enabled(lvl))                               \
        {                                                                               \
            ::strata::Logger::instance().log_formatted(lvl, category, __VA_ARGS__);     \
        }                                                                               \
    } while (0)

#define STRATA_LOG_TRACE(category, ...) STRATA_LOG_AT(::strata::LogLevel::Trace, category, __VA_ARGS__)
#define STRATA_LOG_DEBUG(category, ...) STRATA_LOG_AT(::strata::LogLevel::Debug, category, __VA_ARGS__)
#define STRATA_LOG_INFO(category, ...) STRATA_LOG_AT(::strata::LogLevel::Info, category, __VA_ARGS__)
#define STRATA_LOG_WARN(category, ...) STRATA_LOG_AT(::strata::LogLevel::Warning, category, __VA_ARGS__)
#define STRATA_LOG_ERROR(category, ...) STRATA_LOG_AT(::strata::LogLevel::Error, category, __VA_ARGS__)
#define STRATA_LOG_CRITICAL(category, ...) \
    STRATA_LOG_AT(::strata::LogLevel::Critical, category, __VA_ARGS__)

}   // namespace strata
