#pragma once
#include <stdint.h>
#include <unistd.h>
#include <time.h>
#include <string>
#include <string_view>
#include <optional>
#include <mutex>
#include <iostream>
#include <utility>
#include "fmt/format.h"
extern const char* g_gitHash;

struct EofException{};
struct TimeoutError{};

enum class LogLevel { Debug=0, Info, Warning, Error, Critical };

// set once from the command line, before any threads are started
extern LogLevel g_logLevel;
extern std::mutex g_logMutex;

std::optional<LogLevel> parseLogLevel(std::string_view name);
const char* logLevelName(LogLevel level);

std::string humanTimeNow();
std::string humanTime(time_t t);

template<typename... Args>
void logAt(LogLevel level, fmt::format_string<Args...> fmtstr, Args&&... args)
{
  if(level < g_logLevel)
    return;
  std::string msg = fmt::format(fmtstr, std::forward<Args>(args)...);
  std::lock_guard<std::mutex> l(g_logMutex);
  std::cerr<<humanTimeNow()<<" "<<logLevelName(level)<<": "<<msg<<std::endl;
}

// seconds on the steady clock, only useful for differences
double steadyNow();

std::string makeHexDump(std::string_view str);
size_t writen2(int fd, const void *buf, size_t count);
void unixDie(const std::string& reason);
