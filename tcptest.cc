#include "doctest/doctest.h"
#include <thread>
#include <chrono>
#include <vector>
#include <signal.h>
#include <poll.h>
#include <unistd.h>
#include <sys/socket.h>
#include "comboaddress.hh"
#include "sclasses.hh"
#include "swrappers.hh"
#include "nmeacast.hh"
#include "metrics.hh"
#include "smoother.hh"
#include "broadcaster.hh"
#include "tcpsubscriber.hh"

using namespace std;

namespace {
// a connected TCP pair over loopback, 'accepted' is ours to hand to a TCPSubscriber
struct LoopbackPair
{
  explicit LoopbackPair(int rcvbuf = 0) : listener(AF_INET, SOCK_STREAM)
  {
    client = SSocket(AF_INET, SOCK_STREAM);
    ComboAddress local("127.0.0.1", 0);
    SBind(listener, local);
    SListen(listener, 1);
    socklen_t len = local.getSocklen();
    if(getsockname(listener, (struct sockaddr*)&local, &len) < 0)
      unixDie("getsockname on loopback listener");
    if(rcvbuf)
      SSetsockopt(client, SOL_SOCKET, SO_RCVBUF, rcvbuf);
    SConnectWithTimeout(client, local, 5);
    remote = local;
    accepted = SAccept(listener, remote);
  }
  ~LoopbackPair()
  {
    hangup();
  }
  void hangup()
  {
    if(client >= 0)
      close(client);
    client = -1;
  }

  Socket listener;
  int client;
  ComboAddress remote;
  int accepted;
};

vector<string> readLines(int fd, size_t n)
{
  vector<string> ret;
  string partial;
  char buf[256];
  while(ret.size() < n) {
    struct pollfd pfd{fd, POLLIN, 0};
    if(poll(&pfd, 1, 5000) <= 0)
      break;
    ssize_t res = read(fd, buf, sizeof(buf));
    if(res <= 0)
      break;
    for(ssize_t pos = 0; pos < res; ++pos) {
      if(buf[pos] == '\n') {
        ret.push_back(partial);
        partial.clear();
      }
      else
        partial.append(1, buf[pos]);
    }
  }
  return ret;
}

bool waitForCount(Broadcaster& b, size_t n)
{
  for(int tries = 0; tries < 500; ++tries) {
    if(b.size() == n)
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}
}

TEST_CASE("tcp subscribers get one line per unit") {
  signal(SIGPIPE, SIG_IGN);
  SmoothingStore ss(0);
  MetricDisplay md({"BSP", "TWA"});
  Broadcaster b(ss, md);
  ss.update("BSP", 6.5, 0);

  LoopbackPair lp;
  std::thread session(subscriberSession, lp.accepted, lp.remote, &b, 0.5);
  CHECK(waitForCount(b, 1));
  b.publish("TWA", 42);
  b.publish("BSP", 7.25);

  vector<string> expected{"BSP:6.50", "TWA:42", "BSP:7.25"};
  CHECK(readLines(lp.client, 3) == expected);

  // the session notices the hangup and leaves
  lp.hangup();
  session.join();
  CHECK(b.size() == 0);
  CHECK(b.getDropped() == 0);
}

TEST_CASE("a tcp subscriber whose peer is gone is dropped on write") {
  signal(SIGPIPE, SIG_IGN);
  SmoothingStore ss(0);
  MetricDisplay md({"BSP"});
  Broadcaster b(ss, md);

  LoopbackPair lp;
  auto sub = make_shared<TCPSubscriber>(lp.accepted, lp.remote, 0.5);
  b.join(sub);
  b.publish("BSP", 1);
  CHECK(readLines(lp.client, 1).size() == 1);
  lp.hangup();

  // nobody reads this connection, only failing writes can tell us it is gone
  auto start = std::chrono::steady_clock::now();
  for(int tries = 0; tries < 200 && b.size(); ++tries) {
    b.publish("BSP", tries);
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  CHECK(b.size() == 0);
  CHECK(b.getDropped() == 1);
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(2500));
}

TEST_CASE("a stalled tcp peer makes writes time out") {
  signal(SIGPIPE, SIG_IGN);
  LoopbackPair lp(4096);
  TCPSubscriber sub(lp.accepted, lp.remote, 0.2);
  SSetsockopt(lp.accepted, SOL_SOCKET, SO_SNDBUF, 4096);

  // the client never reads, so the send buffer fills up
  string unit(4096, 'x');
  bool timedOut = false;
  auto start = std::chrono::steady_clock::now();
  try {
    for(int n = 0; n < 100000; ++n)
      sub.write(unit);
  }
  catch(TimeoutError&) {
    timedOut = true;
  }
  CHECK(timedOut);
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(10));

  sub.close();
  CHECK_THROWS_AS(sub.write("BSP:1.00"), EofException);
}
