module;
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Debug = 0,
        Info,
        Warning,
        Error
    };

    using SinkFn = std::function<void(Level, std::string_view)>;

    // Messages below the threshold are dropped before formatting.
    void SetLevel(Level level);
    [[nodiscard]] Level GetLevel();

    // Redirects output away from the colored console writer (tests capture
    // diagnostics this way). ResetSink restores the console.
    void SetSink(SinkFn sink);
    void ResetSink();

    [[nodiscard]] bool IsEnabled(Level level);
    void Write(Level level, std::string_view msg);

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Info)) return;
        Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Warning)) return;
        Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (!IsEnabled(Level::Error)) return;
        Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args)
    {
#ifndef NDEBUG
        if (!IsEnabled(Level::Debug)) return;
        Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
