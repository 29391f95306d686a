#pragma once
#include <string>
#include <map>
#include <mutex>
#include <optional>

/* Exponential smoothing with a time-varying step, one state per metric key.
   alpha = 1 - exp(-dt/tau), so an observation that arrives after a long gap
   moves the value almost all the way, while a burst of observations in quick
   succession barely moves it per sample. Times are in seconds.
*/
class SmoothingStore
{
public:
  enum class Result { Initialized, Updated };
  struct UpdateResult
  {
    Result result;
    double value;
  };

  explicit SmoothingStore(double tau) : d_tau(tau) {}

  UpdateResult update(const std::string& key, double raw, double t);
  std::optional<double> snapshot(const std::string& key) const;
  std::map<std::string, double> snapshotAll() const;
  double getTau() const { return d_tau; }

private:
  struct State
  {
    double value;
    double lastUpdate;
  };
  const double d_tau;
  mutable std::mutex d_mut;
  std::map<std::string, State> d_states; // an entry exists iff a value was ever observed
};
