#include "comboaddress.hh"
#include "sclasses.hh"
#include "swrappers.hh"
#include <thread>
#include <signal.h>
#include <sys/types.h>
#include <sys/socket.h>
#include <vector>
#include <stdexcept>
#include <stdlib.h>
#include <unistd.h>
#include "fmt/format.h"
#include "fmt/printf.h"
#include "CLI/CLI.hpp"
#include "version.hh"
#include "nmeacast.hh"
#include "metrics.hh"
#include "smoother.hh"
#include "broadcaster.hh"
#include "ingest.hh"
#include "tcpsubscriber.hh"

static char program[]="nmeacastd";

using namespace std;

/* Goals in life:

   1) one bad datagram or one bad subscriber never takes us down
   2) get every sentence from the UDP socket to the subscribers without delay
*/

static void listMetrics()
{
  fmt::print("{:<6}{:<24}{:<6}{}\n", "Key", "Label", "Unit", "Format");
  for(const auto& mi : getMetricTable())
    fmt::print("{:<6}{:<24}{:<6}{}\n", mi.key, mi.label, mi.unit, mi.format);
}

int main(int argc, char** argv)
try
{
  bool doVERSION{false}, doListMetrics{false};

  CLI::App app(program);
  int udpPort = 2002;
  string udpAddress("0.0.0.0");
  string localAddress("0.0.0.0:8001");
  double tau = 2.0;
  double writeTimeout = 2.0;
  size_t maxQueue = 256;
  int statsInterval = 60;
  string logLevel("ERROR");
  vector<string> displayKeys{"BSP", "TWA", "HDG"};

  app.add_flag("--version", doVERSION, "show program version and copyright");
  app.add_flag("--list-metrics", doListMetrics, "show all metric keys and exit");
  app.add_option("--udp-port", udpPort, "UDP port to listen for NMEA sentences")->check(CLI::Range(1, 65535));
  app.add_option("--udp-bind", udpAddress, "Address to receive NMEA sentences on");
  app.add_option("--bind,-b", localAddress, "Address:port subscribers connect to");
  app.add_option("--tau", tau, "Smoothing time constant in seconds, 0 disables smoothing");
  app.add_option("--display-data", displayKeys, "Metric keys to send to subscribers");
  app.add_option("--max-queue", maxQueue, "Units queued for a subscriber before it is dropped");
  app.add_option("--write-timeout", writeTimeout, "Seconds a write to a subscriber may take");
  app.add_option("--stats-interval", statsInterval, "Seconds between statistics log lines");
  app.add_option("--log-level", logLevel, "Logging level")->check(CLI::IsMember({"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"}));
  try {
    app.parse(argc, argv);
  } catch(const CLI::Error &e) {
    return app.exit(e);
  }

  if(doVERSION) {
    showVersion(program, g_gitHash);
    exit(0);
  }
  if(doListMetrics) {
    listMetrics();
    exit(0);
  }

  g_logLevel = *parseLogLevel(logLevel);

  auto bad = validateDisplayKeys(displayKeys);
  if(!bad.empty()) {
    cerr<<"Unknown metric key(s) for --display-data: "<<fmt::format("{}", fmt::join(bad, " "))<<", see --list-metrics"<<endl;
    return EXIT_FAILURE;
  }
  if(tau < 0) {
    cerr<<"--tau must not be negative"<<endl;
    return EXIT_FAILURE;
  }
  if(!maxQueue || writeTimeout <= 0) {
    cerr<<"--max-queue and --write-timeout must be positive"<<endl;
    return EXIT_FAILURE;
  }

  signal(SIGPIPE, SIG_IGN);

  MetricDisplay display(displayKeys);
  SmoothingStore store(tau);
  Broadcaster broadcaster(store, display, maxQueue);
  Ingestor ingestor(store, broadcaster);

  ComboAddress recvaddr(udpAddress, udpPort);
  Socket receiver(recvaddr.sin4.sin_family, SOCK_DGRAM, 0);
  SSetsockopt(receiver, SOL_SOCKET, SO_REUSEADDR, 1);
  SBind(receiver, recvaddr);

  ComboAddress sendaddr(localAddress, 8001);
  Socket sender(sendaddr.sin4.sin_family, SOCK_STREAM);
  SSetsockopt(sender, SOL_SOCKET, SO_REUSEADDR, 1);
  SBind(sender, sendaddr);
  SListen(sender, 128);

  cout<<"Receiving NMEA on "<<recvaddr.toStringWithPort()<<", subscribers on "<<sendaddr.toStringWithPort();
  cout<<", tau "<<tau<<"s, sending "<<fmt::format("{}", fmt::join(displayKeys, " "))<<endl;

  thread sendThread(subscriberListener, std::move(sender), sendaddr, &broadcaster, writeTimeout);
  sendThread.detach();

  thread recvThread([&ingestor, &receiver]() {
      try {
        ingestor.run(receiver);
      }
      catch(std::exception& e) {
        logAt(LogLevel::Critical, "Ingest stopped: {}", e.what());
        _exit(EXIT_FAILURE);
      }
    });
  recvThread.detach();

  for(;;) {
    sleep(statsInterval > 0 ? statsInterval : 60);
    auto st = ingestor.getStats();
    logAt(LogLevel::Info, "{} datagrams, {} unrecognized, {} observations, {} subscribers, {} dropped",
          st.datagrams, st.decodeFailures, st.observations, broadcaster.size(), broadcaster.getDropped());
  }
}
catch(std::exception& e) {
  cerr<<"Fatal error: "<<e.what()<<endl;
  return EXIT_FAILURE;
}
