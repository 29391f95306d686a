#include "extract.hh"

using namespace std;

namespace {
template<class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

constexpr double c_knotsPerKmh = 1.0/1.852;
constexpr double c_knotsPerMs = 3600.0/1852.0;

void add(vector<Extraction>& ret, const char* key, const std::optional<double>& val)
{
  if(val)
    ret.push_back({key, *val});
}

std::optional<double> windKnots(const MWVSentence& s)
{
  if(!s.speed)
    return s.speed;
  switch(s.speedUnit) {
  case 'N':
    return *s.speed;
  case 'K':
    return *s.speed * c_knotsPerKmh;
  case 'M':
    return *s.speed * c_knotsPerMs;
  }
  return std::optional<double>();
}
}

std::vector<Extraction> extractObservations(const NMEASentence& sentence)
{
  vector<Extraction> ret;
  std::visit(overloaded {
      [&ret](const VHWSentence& s) {
        add(ret, "BSP", s.speedKnots);
        add(ret, "HDT", s.headingTrue);
        add(ret, "HDG", s.headingMagnetic);
      },
      [&ret](const HDGSentence& s) {
        add(ret, "HDG", s.heading);
      },
      [&ret](const HDTSentence& s) {
        add(ret, "HDT", s.heading);
      },
      [&ret](const HDMSentence& s) {
        add(ret, "HDG", s.heading);
      },
      [&ret](const MWVSentence& s) {
        if(!s.valid)
          return;
        if(s.reference == 'R') {
          add(ret, "AWA", s.angle);
          add(ret, "AWS", windKnots(s));
        }
        else if(s.reference == 'T') {
          add(ret, "TWA", s.angle);
          add(ret, "TWS", windKnots(s));
        }
      },
      [&ret](const MWDSentence& s) {
        add(ret, "TWD", s.directionTrue);
        if(s.speedKnots)
          add(ret, "TWS", s.speedKnots);
        else if(s.speedMs)
          add(ret, "TWS", *s.speedMs * c_knotsPerMs);
      },
      [&ret](const VTGSentence& s) {
        add(ret, "SOG", s.speedKnots);
        add(ret, "COG", s.courseTrue);
      },
      [&ret](const RMCSentence& s) {
        if(!s.valid)
          return;
        add(ret, "LAT", s.latitude);
        add(ret, "LON", s.longitude);
        add(ret, "SOG", s.speedKnots);
        add(ret, "COG", s.course);
      },
      [&ret](const GGASentence& s) {
        if(!s.quality) // no fix
          return;
        add(ret, "LAT", s.latitude);
        add(ret, "LON", s.longitude);
      },
      [&ret](const DPTSentence& s) {
        if(s.depth)
          add(ret, "DPT", *s.depth + s.offset.value_or(0));
      },
      [&ret](const DBTSentence& s) {
        add(ret, "DPT", s.depthMeters);
      },
      [&ret](const MTWSentence& s) {
        add(ret, "MTW", s.temperature);
      },
      [&ret](const VLWSentence& s) {
        add(ret, "LOG", s.tripNm);
      }
    }, sentence);
  return ret;
}
