#include "tcpsubscriber.hh"
#include <thread>
#include <memory>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/tcp.h>
#include <errno.h>
#include <string.h>
#include "swrappers.hh"
#include "nmeacast.hh"

using namespace std;

TCPSubscriber::TCPSubscriber(int fd, const ComboAddress& remote, double writeTimeout) : d_sock(fd), d_remote(remote)
{
  SSetsockopt(d_sock, SOL_SOCKET, SO_KEEPALIVE, 1);
  SSetsockopt(d_sock, IPPROTO_TCP, TCP_NODELAY, 1);
  struct timeval tv;
  tv.tv_sec = (time_t)writeTimeout;
  tv.tv_usec = (suseconds_t)((writeTimeout - tv.tv_sec) * 1000000);
  if(setsockopt(d_sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0)
    unixDie("Setting write timeout for subscriber "+remote.toStringWithPort());
}

void TCPSubscriber::write(const std::string& unit)
{
  if(d_closed)
    throw EofException();
  string line = unit + "\n";
  writen2(d_sock, line.c_str(), line.size());
}

void TCPSubscriber::close()
{
  // wakes up the reader and any blocked writer, the fd itself closes with d_sock
  if(!d_closed.exchange(true))
    shutdown(d_sock, SHUT_RDWR);
}

std::string TCPSubscriber::describe() const
{
  return d_remote.toStringWithPort();
}

std::string TCPSubscriber::readUntilClosed()
{
  char buf[512];
  for(;;) {
    ssize_t res = read(d_sock, buf, sizeof(buf));
    if(res == 0)
      return "EOF";
    if(res < 0) {
      if(errno == EINTR)
        continue;
      return string("read error: ")+strerror(errno);
    }
  }
}

void subscriberSession(int fd, ComboAddress remote, Broadcaster* broadcaster, double writeTimeout)
try
{
  auto sub = make_shared<TCPSubscriber>(fd, remote, writeTimeout);
  uint64_t id = broadcaster->join(sub);
  string why = sub->readUntilClosed();
  logAt(LogLevel::Debug, "Reader for {} done: {}", remote.toStringWithPort(), why);
  broadcaster->leave(id);
}
catch(std::exception& e) {
  logAt(LogLevel::Warning, "Subscriber session for {} failed: {}", remote.toStringWithPort(), e.what());
}

void subscriberListener(Socket&& s, ComboAddress local, Broadcaster* broadcaster, double writeTimeout)
{
  for(;;) {
    ComboAddress remote=local;
    int fd;
    try {
      fd = SAccept(s, remote);
    }
    catch(std::exception& e) {
      logAt(LogLevel::Error, "Accepting subscriber on {}: {}", local.toStringWithPort(), e.what());
      sleep(1);
      continue;
    }
    std::thread t(subscriberSession, fd, remote, broadcaster, writeTimeout);
    t.detach();
  }
}
