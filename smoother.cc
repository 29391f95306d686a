#include "smoother.hh"
#include <math.h>

using namespace std;

SmoothingStore::UpdateResult SmoothingStore::update(const std::string& key, double raw, double t)
{
  std::lock_guard<std::mutex> l(d_mut);
  auto iter = d_states.find(key);
  if(iter == d_states.end()) {
    d_states[key] = {raw, t};
    return {Result::Initialized, raw};
  }
  State& s = iter->second;
  if(d_tau <= 0) {
    s.value = raw;
  }
  else {
    double dt = t - s.lastUpdate;
    if(dt < 0) // non-monotonic source clock
      dt = 0;
    double alpha = 1.0 - exp(-dt / d_tau);
    if(alpha > 0) {
      // raw - value can overflow for finite inputs
      double next = alpha * raw + (1.0 - alpha) * s.value;
      s.value = isfinite(next) ? next : raw;
    }
  }
  s.lastUpdate = t;
  return {Result::Updated, s.value};
}

std::optional<double> SmoothingStore::snapshot(const std::string& key) const
{
  std::lock_guard<std::mutex> l(d_mut);
  auto iter = d_states.find(key);
  if(iter == d_states.end())
    return std::optional<double>();
  return iter->second.value;
}

std::map<std::string, double> SmoothingStore::snapshotAll() const
{
  map<string, double> ret;
  std::lock_guard<std::mutex> l(d_mut);
  for(const auto& s : d_states)
    ret[s.first] = s.second.value;
  return ret;
}
