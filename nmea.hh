#pragma once
#include <string>
#include <string_view>
#include <optional>
#include <variant>
#include <vector>
#include <stdint.h>

// NMEA 0183 sentences we know how to decode. Empty fields on the wire are absent.

struct VHWSentence // water speed and heading
{
  std::optional<double> headingTrue;
  std::optional<double> headingMagnetic;
  std::optional<double> speedKnots;
  std::optional<double> speedKmh;
};

struct HDGSentence // heading, deviation & variation
{
  std::optional<double> heading;
  std::optional<double> deviation;
  std::optional<double> variation;
};

struct HDTSentence
{
  std::optional<double> heading;
};

struct HDMSentence
{
  std::optional<double> heading;
};

struct MWVSentence // wind speed and angle
{
  std::optional<double> angle;
  char reference{0};  // 'R' relative (apparent), 'T' theoretical (true)
  std::optional<double> speed;
  char speedUnit{0};  // 'K', 'M', 'N'
  bool valid{false};
};

struct MWDSentence // wind direction and speed
{
  std::optional<double> directionTrue;
  std::optional<double> directionMagnetic;
  std::optional<double> speedKnots;
  std::optional<double> speedMs;
};

struct VTGSentence // track made good and ground speed
{
  std::optional<double> courseTrue;
  std::optional<double> courseMagnetic;
  std::optional<double> speedKnots;
  std::optional<double> speedKmh;
};

struct RMCSentence
{
  bool valid{false};
  std::optional<double> latitude;  // signed decimal degrees
  std::optional<double> longitude;
  std::optional<double> speedKnots;
  std::optional<double> course;
};

struct GGASentence
{
  std::optional<double> latitude;
  std::optional<double> longitude;
  int quality{0};
  std::optional<double> altitude;
};

struct DPTSentence
{
  std::optional<double> depth;   // below transducer, meters
  std::optional<double> offset;
};

struct DBTSentence
{
  std::optional<double> depthFeet;
  std::optional<double> depthMeters;
  std::optional<double> depthFathoms;
};

struct MTWSentence
{
  std::optional<double> temperature; // celsius
};

struct VLWSentence // distance traveled through water
{
  std::optional<double> totalNm;
  std::optional<double> tripNm;
};

typedef std::variant<VHWSentence, HDGSentence, HDTSentence, HDMSentence,
                     MWVSentence, MWDSentence, VTGSentence, RMCSentence,
                     GGASentence, DPTSentence, DBTSentence, MTWSentence,
                     VLWSentence> NMEASentence;

struct NMEAFrame
{
  std::string talker;    // "GP", "II", ..
  std::string type;      // "VHW", "MWV", ..
  std::vector<std::string_view> fields; // views into the input, after the address field
};

uint8_t calcNMEAChecksum(std::string_view body);

// splits & checks framing and checksum, no knowledge of the sentence types
std::optional<NMEAFrame> splitNMEA(std::string_view line, std::string* reason = nullptr);

// the full decode, never throws
std::optional<NMEASentence> parseNMEA(std::string_view line, std::string* reason = nullptr);

const char* sentenceName(const NMEASentence& s);
