#pragma once

#include "util/result.hpp"

#include <cstdarg>
#include <string>

namespace ipswdl {

enum class LogLevel : int {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    None  = 4,
};

class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel lvl);

    // Redirects output from stderr to `path` (appending). Closing reverts to stderr.
    Result OpenFile(const std::string& path);
    void CloseFile();

    // printf-style logging, used through the Log* macros below
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

#define LogDebug(...) ::ipswdl::Logger::Instance().LogWithSource(::ipswdl::LogLevel::Debug, __FILE__, __LINE__, __VA_ARGS__)
#define LogInfo(...)  ::ipswdl::Logger::Instance().LogWithSource(::ipswdl::LogLevel::Info,  __FILE__, __LINE__, __VA_ARGS__)
#define LogWarn(...)  ::ipswdl::Logger::Instance().LogWithSource(::ipswdl::LogLevel::Warn,  __FILE__, __LINE__, __VA_ARGS__)
#define LogError(...) ::ipswdl::Logger::Instance().LogWithSource(::ipswdl::LogLevel::Error, __FILE__, __LINE__, __VA_ARGS__)

} // namespace ipswdl
