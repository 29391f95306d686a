#include "ingest.hh"
#include <sys/types.h>
#include <sys/socket.h>
#include <errno.h>
#include <string.h>
#include <unistd.h>
#include <algorithm>
#include "nmea.hh"
#include "extract.hh"
#include "nmeacast.hh"

using namespace std;

static bool isPrintable(std::string_view str)
{
  return std::all_of(str.begin(), str.end(), [](char c) {
      return (c >= 0x20 && c < 0x7f) || c=='\r' || c=='\n';
    });
}

unsigned int Ingestor::processDatagram(std::string_view payload, double t)
{
  d_datagrams++;
  string reason;
  auto sentence = parseNMEA(payload, &reason);
  if(!sentence) {
    d_decodeFailures++;
    if(g_logLevel <= LogLevel::Debug)
      logAt(LogLevel::Debug, "Unrecognized input ({}): {}", reason,
            isPrintable(payload) ? string(payload) : makeHexDump(payload));
    return 0;
  }

  unsigned int count=0;
  for(const auto& obs : extractObservations(*sentence)) {
    auto res = d_store.update(obs.key, obs.value, t);
    d_broadcaster.publish(obs.key, res.value);
    ++count;
  }
  d_observations += count;
  return count;
}

void Ingestor::run(int fd)
{
  char buf[65536];
  for(;;) {
    ssize_t len = recvfrom(fd, buf, sizeof(buf), 0, nullptr, nullptr);
    if(len < 0) {
      if(errno == EINTR)
        continue;
      // these will not go away by trying again
      if(errno == EBADF || errno == ENOTSOCK || errno == EINVAL || errno == EFAULT)
        unixDie("receiving datagram");
      logAt(LogLevel::Error, "Error receiving datagram: {}", strerror(errno));
      usleep(100000);
      continue;
    }
    processDatagram(std::string_view(buf, len), steadyNow());
  }
}
