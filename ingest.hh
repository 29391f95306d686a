#pragma once
#include <string_view>
#include <atomic>
#include <stdint.h>
#include "smoother.hh"
#include "broadcaster.hh"

// The only writer of smoothing state: datagram in, decode, extract, smooth, publish
class Ingestor
{
public:
  Ingestor(SmoothingStore& store, Broadcaster& broadcaster) : d_store(store), d_broadcaster(broadcaster) {}

  // returns the number of observations applied, 0 for undecodable input
  unsigned int processDatagram(std::string_view payload, double t);

  // receives datagrams from fd until the end of time
  // never returns, throws std::runtime_error if the socket is unusable
  void run(int fd);

  struct Stats
  {
    uint64_t datagrams;
    uint64_t decodeFailures;
    uint64_t observations;
  };
  Stats getStats() const
  {
    return {d_datagrams, d_decodeFailures, d_observations};
  }

private:
  SmoothingStore& d_store;
  Broadcaster& d_broadcaster;
  std::atomic<uint64_t> d_datagrams{0}, d_decodeFailures{0}, d_observations{0};
};
