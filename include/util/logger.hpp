#pragma once

#include "util/result.hpp"

#include <cstdarg>
#include <optional>
#include <string>
#include <string_view>

namespace ddi {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

const char* ToString(LogLevel lvl);
std::optional<LogLevel> ParseLogLevel(std::string_view s);

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);
    LogLevel Level() const;

    // Appends to `path`; the previous file (if any) is closed.
    Result OpenFile(const std::string& path);
    void CloseFile();

    // Full-screen UI owns the terminal while a run is displayed.
    void SetConsoleEnabled(bool enabled);
    bool ConsoleEnabled() const;

    // printf-style logging
    void Log(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
    void VLog(LogLevel lvl, const char* fmt, va_list ap);
    void LogWithSource(LogLevel lvl,
                       const char* file,
                       int line,
                       const char* fmt,
                       ...) __attribute__((format(printf, 5, 6)));
    void VLogWithSource(LogLevel lvl,
                        const char* file,
                        int line,
                        const char* fmt,
                        va_list ap);

private:
    Logger() = default;
};

#define LogDebug(...) ::ddi::Logger::Instance().LogWithSource(::ddi::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::ddi::Logger::Instance().LogWithSource(::ddi::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::ddi::Logger::Instance().LogWithSource(::ddi::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::ddi::Logger::Instance().LogWithSource(::ddi::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace ddi
