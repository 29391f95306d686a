#include "metrics.hh"
#include <stdexcept>
#include "fmt/format.h"
#include "fmt/printf.h"

using namespace std;

const std::vector<MetricInfo>& getMetricTable()
{
  static const vector<MetricInfo> table{
    {"BSP", "Boat Speed",          "kn",  "%.2f"},
    {"HDT", "True Heading",        "deg", "%.0f"},
    {"HDG", "Magnetic Heading",    "deg", "%.0f"},
    {"AWA", "Apparent Wind Angle", "deg", "%.0f"},
    {"AWS", "Apparent Wind Speed", "kn",  "%.1f"},
    {"TWA", "True Wind Angle",     "deg", "%.0f"},
    {"TWS", "True Wind Speed",     "kn",  "%.1f"},
    {"TWD", "True Wind Direction", "deg", "%.0f"},
    {"SOG", "Speed Over Ground",   "kn",  "%.2f"},
    {"COG", "Course Over Ground",  "deg", "%.0f"},
    {"DPT", "Depth",               "m",   "%.1f"},
    {"MTW", "Water Temperature",   "C",   "%.1f"},
    {"LAT", "Latitude",            "deg", "%.5f"},
    {"LON", "Longitude",           "deg", "%.5f"},
    {"LOG", "Trip Log",            "nm",  "%.2f"}
  };
  return table;
}

const MetricInfo* findMetric(const std::string& key)
{
  for(const auto& mi : getMetricTable())
    if(mi.key == key)
      return &mi;
  return nullptr;
}

std::vector<std::string> validateDisplayKeys(const std::vector<std::string>& keys)
{
  vector<string> ret;
  for(const auto& k : keys)
    if(!findMetric(k))
      ret.push_back(k);
  return ret;
}

MetricDisplay::MetricDisplay(const std::vector<std::string>& enabled)
{
  auto bad = validateDisplayKeys(enabled);
  if(!bad.empty())
    throw std::invalid_argument(fmt::format("unknown metric key(s): {}", fmt::join(bad, ", ")));
  d_enabled.insert(enabled.begin(), enabled.end());
}

std::string MetricDisplay::formatUnit(const std::string& key, double value) const
{
  auto mi = findMetric(key);
  if(!mi)
    return key + ":" + fmt::sprintf("%g", value);
  return key + ":" + fmt::sprintf(mi->format, value);
}
