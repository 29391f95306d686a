#include "nmeacast.hh"
#include <errno.h>
#include <stdlib.h>
#include <string>
#include <string.h>
#include <stdexcept>
#include <chrono>
#include "fmt/format.h"
#include "fmt/printf.h"

using namespace std;

LogLevel g_logLevel{LogLevel::Error};
std::mutex g_logMutex;

static const char* s_levelNames[]={"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};

std::optional<LogLevel> parseLogLevel(std::string_view name)
{
  for(int n=0; n < 5; ++n)
    if(name == s_levelNames[n])
      return static_cast<LogLevel>(n);
  return std::optional<LogLevel>();
}

const char* logLevelName(LogLevel level)
{
  int n = static_cast<int>(level);
  if(n >= 0 && n < 5)
    return s_levelNames[n];
  return "???";
}

std::string humanTimeNow()
{
  time_t now = time(0);
  return humanTime(now);
}

std::string humanTime(time_t t)
{
  static bool set_tz = false;
  struct tm tm={0};
  gmtime_r(&t, &tm);

  if (!set_tz) {
    setenv("TZ", "UTC", 1); // We think in UTC.
    tzset();
    set_tz = true;
  }

  char buffer[80];
  strftime(buffer, sizeof(buffer), "%a, %d %b %Y %H:%M:%S %z", &tm);
  return buffer;
}

double steadyNow()
{
  using namespace std::chrono;
  return duration_cast<microseconds>(steady_clock::now().time_since_epoch()).count()/1000000.0;
}

string makeHexDump(std::string_view str)
{
  string ret;
  ret.reserve((int)(str.size()*3));

  for(auto c : str)
    ret += fmt::sprintf("%02x ", (unsigned char)c);
  return ret;
}

size_t writen2(int fd, const void *buf, size_t count)
{
  const char *ptr = (char*)buf;
  const char *eptr = ptr + count;

  ssize_t res;
  while(ptr != eptr) {
    res = ::write(fd, ptr, eptr - ptr);
    if(res < 0) {
      if(errno == EAGAIN || errno == EWOULDBLOCK)
        throw TimeoutError();
      throw runtime_error("failed in writen2: "+string(strerror(errno)));
    }
    else if (res == 0)
      throw EofException();

    ptr += (size_t) res;
  }

  return count;
}

void unixDie(const std::string& reason)
{
  throw std::runtime_error(reason+": "+strerror(errno));
}
