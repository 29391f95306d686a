#include "nmea.hh"
#include <stdexcept>
#include <stdlib.h>
#include <math.h>
#include "fmt/format.h"

using namespace std;

namespace {
struct NMEAError : public std::runtime_error
{
  NMEAError(const std::string& str) : std::runtime_error(str){}
};

int hexValue(char c)
{
  if(c >= '0' && c <= '9')
    return c - '0';
  if(c >= 'A' && c <= 'F')
    return 10 + (c - 'A');
  if(c >= 'a' && c <= 'f')
    return 10 + (c - 'a');
  return -1;
}

bool isSpace(char c)
{
  return c==' ' || c=='\t' || c=='\r' || c=='\n' || c=='\0';
}

string_view trim(string_view in)
{
  while(!in.empty() && isSpace(in.back()))
    in.remove_suffix(1);
  while(!in.empty() && isSpace(in.front()))
    in.remove_prefix(1);
  return in;
}

// "" is absent, anything that is not entirely a number is an error
std::optional<double> getNum(const NMEAFrame& f, unsigned int pos)
{
  if(pos >= f.fields.size() || f.fields[pos].empty())
    return std::optional<double>();
  string str(f.fields[pos]);
  char* end;
  double ret = strtod(str.c_str(), &end);
  if(*end || !isfinite(ret))
    throw NMEAError(fmt::format("field {} of {} is not a number: '{}'", pos, f.type, str));
  return ret;
}

char getChar(const NMEAFrame& f, unsigned int pos)
{
  if(pos >= f.fields.size() || f.fields[pos].empty())
    return 0;
  return f.fields[pos][0];
}

// ddmm.mmmm + hemisphere to signed decimal degrees
std::optional<double> getCoord(const NMEAFrame& f, unsigned int pos, double maxDegrees)
{
  auto raw = getNum(f, pos);
  if(!raw)
    return raw;
  char hemi = getChar(f, pos+1);
  if(*raw < 0)
    throw NMEAError(fmt::format("negative coordinate in {}: {}", f.type, *raw));
  double deg = trunc(*raw / 100);
  double minutes = *raw - 100*deg;
  if(minutes >= 60)
    throw NMEAError(fmt::format("coordinate minutes out of range in {}: {}", f.type, *raw));
  double ret = deg + minutes / 60.0;
  if(ret > maxDegrees)
    throw NMEAError(fmt::format("coordinate out of range in {}: {}", f.type, *raw));
  if(hemi == 'S' || hemi == 'W')
    ret = -ret;
  else if(hemi != 'N' && hemi != 'E')
    throw NMEAError(fmt::format("invalid hemisphere in {}", f.type));
  return ret;
}

// E is positive, W is negative
std::optional<double> getSigned(const NMEAFrame& f, unsigned int pos)
{
  auto ret = getNum(f, pos);
  if(ret && getChar(f, pos+1) == 'W')
    *ret = -*ret;
  return ret;
}

NMEASentence decodeFrame(const NMEAFrame& f)
{
  const string& t = f.type;
  if(t == "VHW")
    return VHWSentence{getNum(f, 0), getNum(f, 2), getNum(f, 4), getNum(f, 6)};
  if(t == "HDG")
    return HDGSentence{getNum(f, 0), getSigned(f, 1), getSigned(f, 3)};
  if(t == "HDT")
    return HDTSentence{getNum(f, 0)};
  if(t == "HDM")
    return HDMSentence{getNum(f, 0)};
  if(t == "MWV") {
    MWVSentence s;
    s.angle = getNum(f, 0);
    s.reference = getChar(f, 1);
    s.speed = getNum(f, 2);
    s.speedUnit = getChar(f, 3);
    s.valid = getChar(f, 4) == 'A';
    return s;
  }
  if(t == "MWD")
    return MWDSentence{getNum(f, 0), getNum(f, 2), getNum(f, 4), getNum(f, 6)};
  if(t == "VTG")
    return VTGSentence{getNum(f, 0), getNum(f, 2), getNum(f, 4), getNum(f, 6)};
  if(t == "RMC") {
    RMCSentence s;
    s.valid = getChar(f, 1) == 'A';
    s.latitude = getCoord(f, 2, 90);
    s.longitude = getCoord(f, 4, 180);
    s.speedKnots = getNum(f, 6);
    s.course = getNum(f, 7);
    return s;
  }
  if(t == "GGA") {
    GGASentence s;
    s.latitude = getCoord(f, 1, 90);
    s.longitude = getCoord(f, 3, 180);
    auto q = getNum(f, 5);
    if(q) {
      // fix quality is a single digit, 0..9
      if(*q < 0 || *q > 9 || *q != trunc(*q))
        throw NMEAError(fmt::format("invalid fix quality in GGA: {}", *q));
      s.quality = static_cast<int>(*q);
    }
    s.altitude = getNum(f, 8);
    return s;
  }
  if(t == "DPT")
    return DPTSentence{getNum(f, 0), getNum(f, 1)};
  if(t == "DBT")
    return DBTSentence{getNum(f, 0), getNum(f, 2), getNum(f, 4)};
  if(t == "MTW")
    return MTWSentence{getNum(f, 0)};
  if(t == "VLW")
    return VLWSentence{getNum(f, 0), getNum(f, 2)};

  throw NMEAError("unsupported sentence type "+t);
}
}

uint8_t calcNMEAChecksum(std::string_view body)
{
  uint8_t ret=0;
  for(auto c : body)
    ret ^= (uint8_t)c;
  return ret;
}

std::optional<NMEAFrame> splitNMEA(std::string_view line, std::string* reason)
{
  auto fail = [reason](const std::string& why) {
    if(reason)
      *reason = why;
    return std::optional<NMEAFrame>();
  };

  line = trim(line);
  if(line.empty())
    return fail("empty sentence");
  if(line.front() != '$' && line.front() != '!')
    return fail("no $ start delimiter");
  line.remove_prefix(1);

  auto star = line.find('*');
  if(star != string_view::npos) {
    if(star + 3 != line.size())
      return fail("checksum field must be exactly two hex digits");
    int hi = hexValue(line[star+1]), lo = hexValue(line[star+2]);
    if(hi < 0 || lo < 0)
      return fail("invalid checksum digits");
    uint8_t expected = (hi << 4) | lo;
    uint8_t actual = calcNMEAChecksum(line.substr(0, star));
    if(expected != actual)
      return fail(fmt::format("checksum mismatch, got {:02X}, calculated {:02X}", expected, actual));
    line = line.substr(0, star);
  }

  auto comma = line.find(',');
  string_view address = line.substr(0, comma);
  if(address.size() != 5)
    return fail(fmt::format("address field '{}' is not talker + type", address));
  for(auto c : address)
    if(!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9')))
      return fail(fmt::format("invalid character in address field '{}'", address));
  if(address[0] == 'P')
    return fail("proprietary sentences are not supported");

  NMEAFrame ret;
  ret.talker = string(address.substr(0, 2));
  ret.type = string(address.substr(2));
  if(comma == string_view::npos)
    return ret;

  string_view rest = line.substr(comma+1);
  for(;;) {
    auto pos = rest.find(',');
    ret.fields.push_back(rest.substr(0, pos));
    if(pos == string_view::npos)
      break;
    rest.remove_prefix(pos+1);
  }
  return ret;
}

std::optional<NMEASentence> parseNMEA(std::string_view line, std::string* reason)
{
  auto frame = splitNMEA(line, reason);
  if(!frame)
    return std::optional<NMEASentence>();
  try {
    return decodeFrame(*frame);
  }
  catch(NMEAError& e) {
    if(reason)
      *reason = e.what();
  }
  return std::optional<NMEASentence>();
}

const char* sentenceName(const NMEASentence& s)
{
  static const char* names[]={"VHW", "HDG", "HDT", "HDM", "MWV", "MWD", "VTG", "RMC",
                              "GGA", "DPT", "DBT", "MTW", "VLW"};
  static_assert(sizeof(names)/sizeof(names[0]) == std::variant_size_v<NMEASentence>);
  return names[s.index()];
}
