#pragma once
#include <string>
#include <vector>
#include <set>

// One smoothed quantity, and how a display should show it
struct MetricInfo
{
  std::string key;     // "BSP"
  std::string label;   // "Boat Speed"
  std::string unit;    // "kn"
  std::string format;  // printf style, "%.2f"
};

// the static, process-wide table of every metric key we know about
const std::vector<MetricInfo>& getMetricTable();
const MetricInfo* findMetric(const std::string& key);

// returns the keys that are not in the metric table, empty if all is well
std::vector<std::string> validateDisplayKeys(const std::vector<std::string>& keys);

class MetricDisplay
{
public:
  // throws std::invalid_argument listing every unknown key
  explicit MetricDisplay(const std::vector<std::string>& enabled);

  bool isEnabled(const std::string& key) const
  {
    return d_enabled.count(key);
  }
  // "KEY:value", value formatted as configured for this key
  std::string formatUnit(const std::string& key, double value) const;
  const std::set<std::string>& enabled() const { return d_enabled; }

private:
  std::set<std::string> d_enabled;
};
