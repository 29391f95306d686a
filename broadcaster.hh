#pragma once
#include <string>
#include <deque>
#include <map>
#include <vector>
#include <memory>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <stdint.h>
#include "smoother.hh"
#include "metrics.hh"

// An output channel that receives "KEY:value" units
class Subscriber
{
public:
  virtual ~Subscriber() = default;
  // throws on failure, should not block longer than its own timeout
  virtual void write(const std::string& unit) = 0;
  // called once the subscriber has been dropped, may be called from any thread
  virtual void close() {}
  virtual std::string describe() const = 0;
};

/* The registry of live subscribers. Every subscriber gets its own bounded
   queue and its own sending thread, so publish() never waits on a
   subscriber. A subscriber that fails a write, or whose queue overflows,
   is removed, nobody else notices. */
class Broadcaster
{
public:
  Broadcaster(const SmoothingStore& store, const MetricDisplay& display, size_t maxQueue=256);
  ~Broadcaster();
  Broadcaster(const Broadcaster&) = delete;
  Broadcaster& operator=(const Broadcaster&) = delete;

  // registers, and queues the current value of every observed key for this subscriber only
  uint64_t join(std::shared_ptr<Subscriber> sub);
  // no-op if already gone
  void leave(uint64_t id);
  void publish(const std::string& key, double value);

  size_t size();
  uint64_t getDropped() const { return d_dropped; }

private:
  struct Destination
  {
    uint64_t id;
    std::shared_ptr<Subscriber> sub;
    std::deque<std::string> queue;
    std::mutex mut;
    std::condition_variable cv;
    bool pleaseQuit{false};
    std::atomic<bool> done{false};
    std::thread thread;
  };

  void sendThread(Destination* d);
  bool remove(uint64_t id, const std::string& why);
  void reap();

  const SmoothingStore& d_store;
  const MetricDisplay& d_display;
  const size_t d_maxQueue;

  std::mutex d_destslock;
  std::map<uint64_t, std::unique_ptr<Destination>> d_dests;
  std::vector<std::unique_ptr<Destination>> d_retired; // threads still to be joined
  uint64_t d_nextId{1};
  std::atomic<uint64_t> d_dropped{0};
};
