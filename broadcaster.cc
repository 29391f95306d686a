#include "broadcaster.hh"
#include <algorithm>
#include "nmeacast.hh"

using namespace std;

Broadcaster::Broadcaster(const SmoothingStore& store, const MetricDisplay& display, size_t maxQueue) :
  d_store(store), d_display(display), d_maxQueue(maxQueue ? maxQueue : 1)
{
}

Broadcaster::~Broadcaster()
{
  vector<unique_ptr<Destination>> all;
  {
    std::lock_guard<std::mutex> l(d_destslock);
    for(auto& d : d_dests)
      all.push_back(std::move(d.second));
    d_dests.clear();
    for(auto& d : d_retired)
      all.push_back(std::move(d));
    d_retired.clear();
  }
  for(auto& d : all) {
    {
      std::lock_guard<std::mutex> l(d->mut);
      d->pleaseQuit = true;
    }
    d->cv.notify_one();
    d->sub->close();
  }
  for(auto& d : all)
    if(d->thread.joinable())
      d->thread.join();
}

uint64_t Broadcaster::join(std::shared_ptr<Subscriber> sub)
{
  auto d = make_unique<Destination>();
  d->sub = std::move(sub);
  Destination* raw = d.get();

  std::lock_guard<std::mutex> l(d_destslock);
  reap();
  d->id = d_nextId++;
  // nobody else can see this queue yet, so the replay goes out before any live update
  for(const auto& s : d_store.snapshotAll()) {
    if(d_display.isEnabled(s.first))
      d->queue.push_back(d_display.formatUnit(s.first, s.second));
  }
  logAt(LogLevel::Info, "New subscriber {} as #{}, replaying {} values", d->sub->describe(), d->id, d->queue.size());
  d->thread = std::thread(&Broadcaster::sendThread, this, raw);
  uint64_t id = d->id;
  d_dests[id] = std::move(d);
  return id;
}

void Broadcaster::leave(uint64_t id)
{
  remove(id, "left");
}

bool Broadcaster::remove(uint64_t id, const std::string& why)
{
  std::shared_ptr<Subscriber> sub;
  {
    std::lock_guard<std::mutex> l(d_destslock);
    reap();
    auto iter = d_dests.find(id);
    if(iter == d_dests.end())
      return false;
    Destination* d = iter->second.get();
    sub = d->sub;
    d_retired.push_back(std::move(iter->second));
    d_dests.erase(iter);
    {
      std::lock_guard<std::mutex> m(d->mut);
      d->pleaseQuit = true;
      d->queue.clear();
    }
    d->cv.notify_one();
  }
  // the Destination may be reaped from here on, only use our own reference
  logAt(LogLevel::Info, "Subscriber #{} {} removed: {}", id, sub->describe(), why);
  sub->close();
  return true;
}

// joins the threads of subscribers that are gone, d_destslock must be held.
// Never joins the calling thread, its done flag is only set on the way out
void Broadcaster::reap()
{
  for(auto iter = d_retired.begin(); iter != d_retired.end(); ) {
    if((*iter)->done) {
      (*iter)->thread.join();
      iter = d_retired.erase(iter);
    }
    else
      ++iter;
  }
}

void Broadcaster::publish(const std::string& key, double value)
{
  if(!d_display.isEnabled(key))
    return;
  string unit = d_display.formatUnit(key, value);

  vector<uint64_t> overflowed;
  {
    std::lock_guard<std::mutex> l(d_destslock);
    reap();
    for(auto& d : d_dests) {
      Destination& dest = *d.second;
      {
        std::lock_guard<std::mutex> m(dest.mut);
        if(dest.queue.size() >= d_maxQueue) {
          overflowed.push_back(d.first);
          continue;
        }
        dest.queue.push_back(unit);
      }
      dest.cv.notify_one();
    }
  }
  for(auto id : overflowed) {
    if(remove(id, fmt::format("queue full ({} units)", d_maxQueue))) {
      d_dropped++;
      logAt(LogLevel::Warning, "Dropped stalled subscriber #{}", id);
    }
  }
}

size_t Broadcaster::size()
{
  std::lock_guard<std::mutex> l(d_destslock);
  return d_dests.size();
}

void Broadcaster::sendThread(Destination* d)
{
  string why;
  for(;;) {
    string msg;
    {
      std::unique_lock<std::mutex> l(d->mut);
      d->cv.wait(l, [d]{ return d->pleaseQuit || !d->queue.empty(); });
      if(d->pleaseQuit)
        break;
      msg = std::move(d->queue.front());
      d->queue.pop_front();
    }
    try {
      d->sub->write(msg);
      continue;
    }
    catch(TimeoutError&) {
      why = "write timed out";
    }
    catch(EofException&) {
      why = "EOF on write";
    }
    catch(std::exception& e) {
      why = string("write error: ")+e.what();
    }
    if(remove(d->id, why)) {
      d_dropped++;
      logAt(LogLevel::Warning, "Dropped subscriber #{} after failed write", d->id);
    }
    break;
  }
  d->done = true;
}
