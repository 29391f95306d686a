#pragma once
#include <string>
#include <vector>
#include "nmea.hh"

struct Extraction
{
  std::string key;
  double value;
};

// Maps a decoded sentence to the metric keys it feeds. Sentence types
// without a mapping, and absent fields, simply yield nothing.
std::vector<Extraction> extractObservations(const NMEASentence& sentence);
