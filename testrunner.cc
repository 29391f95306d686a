#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN

#include "doctest/doctest.h"
#include <thread>
#include <chrono>
#include <mutex>
#include <condition_variable>
#include <algorithm>
#include <stdexcept>
#include <map>
#include <math.h>
#include <ctype.h>
#include "fmt/format.h"
#include "nmeacast.hh"
#include "nmea.hh"
#include "extract.hh"
#include "metrics.hh"
#include "smoother.hh"
#include "broadcaster.hh"
#include "ingest.hh"

using namespace std;

static string withChecksum(const string& body)
{
  return fmt::format("${}*{:02X}", body, calcNMEAChecksum(body));
}

// records everything it is sent, can be told to stall or to fail
struct RecordingSubscriber : public Subscriber
{
  void write(const std::string& unit) override
  {
    std::unique_lock<std::mutex> l(mut);
    if(failAfter >= 0 && (int)units.size() >= failAfter)
      throw std::runtime_error("connection reset by peer");
    cv.wait(l, [this]{ return !stalled || closed; });
    units.push_back(unit);
    cv.notify_all();
  }
  void close() override
  {
    std::lock_guard<std::mutex> l(mut);
    closed = true;
    cv.notify_all();
  }
  std::string describe() const override { return "recorder"; }

  bool waitFor(size_t n)
  {
    std::unique_lock<std::mutex> l(mut);
    return cv.wait_for(l, std::chrono::seconds(5), [this, n]{ return units.size() >= n; });
  }
  bool isClosed()
  {
    std::lock_guard<std::mutex> l(mut);
    return closed;
  }
  vector<string> get()
  {
    std::lock_guard<std::mutex> l(mut);
    return units;
  }

  vector<string> units;
  std::mutex mut;
  std::condition_variable cv;
  bool stalled{false};
  bool closed{false};
  int failAfter{-1};
};

static bool waitForSize(Broadcaster& b, size_t n)
{
  for(int tries = 0; tries < 500; ++tries) {
    if(b.size() == n)
      return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

TEST_CASE("first observation is taken as is") {
  for(double tau : {0.0, 0.5, 1000.0}) {
    SmoothingStore ss(tau);
    CHECK(!ss.snapshot("BSP"));
    auto res = ss.update("BSP", 6.42, 100);
    CHECK(res.result == SmoothingStore::Result::Initialized);
    CHECK(res.value == 6.42);
    CHECK(*ss.snapshot("BSP") == 6.42);
  }
}

TEST_CASE("smoothing follows 1 - exp(-dt/tau)") {
  SmoothingStore ss(1.0);
  ss.update("TWA", 0, 0);
  auto res = ss.update("TWA", 10, 1);
  CHECK(res.result == SmoothingStore::Result::Updated);
  CHECK(res.value == doctest::Approx(10*(1-exp(-1.0))));

  SUBCASE("zero dt leaves the value alone") {
    CHECK(ss.update("TWA", 50, 1).value == res.value);
  }
  SUBCASE("a huge dt snaps to the new value") {
    CHECK(ss.update("TWA", 42, 1e6).value == doctest::Approx(42).epsilon(1e-12));
  }
  SUBCASE("a clock going backwards counts as zero dt") {
    CHECK(ss.update("TWA", 50, 0.5).value == res.value);
  }
}

TEST_CASE("tau zero means no smoothing") {
  SmoothingStore ss(0);
  ss.update("HDG", 10, 0);
  CHECK(ss.update("HDG", 20, 1).value == 20);
  CHECK(ss.update("HDG", 30, 1).value == 30);
  CHECK(ss.update("HDG", 5, 0.1).value == 5);
  CHECK(*ss.snapshot("HDG") == 5);
}

TEST_CASE("replay is deterministic") {
  vector<pair<double, double>> obs{{1, 5.1}, {1.2, 5.4}, {1.2, 5.3}, {2.7, 6.0}, {3.1, 4.9}, {10, 5.5}};
  auto run = [&obs]() {
    SmoothingStore ss(2.5);
    for(const auto& o : obs)
      ss.update("BSP", o.second, o.first);
    return *ss.snapshot("BSP");
  };
  CHECK(run() == run());
}

TEST_CASE("keys are smoothed independently") {
  SmoothingStore ss(1.0);
  ss.update("BSP", 3, 0);
  ss.update("TWA", 7, 0);
  ss.update("BSP", 4, 0);
  auto all = ss.snapshotAll();
  CHECK(all.size() == 2);
  CHECK(all["BSP"] == 3);
  CHECK(all["TWA"] == 7);
  CHECK(!ss.snapshot("HDG"));
}

TEST_CASE("extreme values never turn into nan") {
  SmoothingStore ss(2.0);
  ss.update("DPT", 1e308, 0);
  CHECK(ss.update("DPT", -1e308, 0).value == 1e308);
  double v = ss.update("DPT", -1e308, 1).value;
  CHECK(isfinite(v));
  CHECK(v < 1e308);
  CHECK(ss.update("DPT", 5.0, 1e6).value == doctest::Approx(5.0));
  CHECK(isfinite(*ss.snapshot("DPT")));
}

TEST_CASE("nmea framing and checksum") {
  string good = withChecksum("IIVHW,123.0,T,120.0,M,6.42,N,11.89,K");
  string reason;

  CHECK(parseNMEA(good));
  CHECK(parseNMEA(good + "\r\n"));
  CHECK(parseNMEA("  " + good + " \n"));

  SUBCASE("checksum is optional") {
    CHECK(parseNMEA("$IIVHW,123.0,T,120.0,M,6.42,N,11.89,K"));
  }
  SUBCASE("lowercase checksum digits") {
    string lower = good;
    transform(lower.end()-2, lower.end(), lower.end()-2, ::tolower);
    CHECK(parseNMEA(lower));
  }
  SUBCASE("checksum mismatch") {
    string bad = good;
    bad[bad.size()-1] = bad[bad.size()-1] == '0' ? '1' : '0';
    CHECK(!parseNMEA(bad, &reason));
    CHECK(reason.find("checksum") != string::npos);
  }
  SUBCASE("payload corrupted") {
    string bad = good;
    bad[20] = '9';
    CHECK(!parseNMEA(bad));
  }
  SUBCASE("garbage") {
    CHECK(!parseNMEA(""));
    CHECK(!parseNMEA("\r\n"));
    CHECK(!parseNMEA("hello world"));
    CHECK(!parseNMEA("$IIVH"));
    CHECK(!parseNMEA(string("\x01\x02\xff$", 4)));
    CHECK(!parseNMEA("$IIVHW,12*3"));
    CHECK(!parseNMEA("$II VHW,1"));
  }
  SUBCASE("unsupported") {
    CHECK(!parseNMEA(withChecksum("GPGSV,3,1,11,03,03,111,00"), &reason));
    CHECK(reason.find("GSV") != string::npos);
    CHECK(!parseNMEA(withChecksum("PGRME,15.0,M,45.0,M,25.0,M")));
  }
  SUBCASE("non-numeric field") {
    CHECK(!parseNMEA(withChecksum("IIVHW,12x.0,T,,M,6.42,N,,K")));
  }
}

TEST_CASE("nmea field decoding") {
  auto s = parseNMEA(withChecksum("IIVHW,,T,120.0,M,6.42,N,,K"));
  REQUIRE(s);
  REQUIRE(std::holds_alternative<VHWSentence>(*s));
  CHECK(string(sentenceName(*s)) == "VHW");
  const auto& vhw = std::get<VHWSentence>(*s);
  CHECK(!vhw.headingTrue);
  CHECK(*vhw.headingMagnetic == 120.0);
  CHECK(*vhw.speedKnots == 6.42);
  CHECK(!vhw.speedKmh);

  auto t = parseNMEA(withChecksum("GPRMC,123519,A,4807.038,S,01131.000,W,022.4,084.4,230394,003.1,W"));
  REQUIRE(t);
  const auto& rmc = std::get<RMCSentence>(*t);
  CHECK(rmc.valid);
  CHECK(*rmc.latitude == doctest::Approx(-(48 + 7.038/60)));
  CHECK(*rmc.longitude == doctest::Approx(-(11 + 31.0/60)));
  CHECK(*rmc.speedKnots == doctest::Approx(22.4));

  auto h = parseNMEA(withChecksum("HCHDG,98.3,0.0,E,12.6,W"));
  REQUIRE(h);
  CHECK(*std::get<HDGSentence>(*h).variation == doctest::Approx(-12.6));

  // trailing fields may be missing altogether
  auto m = parseNMEA("$IIMTW,17.5");
  REQUIRE(m);
  CHECK(*std::get<MTWSentence>(*m).temperature == 17.5);
}

TEST_CASE("gga quality and coordinates are range checked") {
  string reason;
  auto g = parseNMEA(withChecksum("GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,"));
  REQUIRE(g);
  CHECK(std::get<GGASentence>(*g).quality == 1);
  CHECK(*std::get<GGASentence>(*g).latitude == doctest::Approx(48 + 7.038/60));

  for(const char* q : {"1e20", "1.5", "-1", "10"}) {
    CAPTURE(q);
    CHECK(!parseNMEA(withChecksum(fmt::format("GPGGA,123519,4807.038,N,01131.000,E,{},08,0.9,545.4,M,46.9,M,,", q)), &reason));
    CHECK(reason.find("quality") != string::npos);
  }

  CHECK(parseNMEA(withChecksum("GPRMC,123519,A,4859.999,N,01131.000,E,022.4,084.4,230394,003.1,W")));
  CHECK(!parseNMEA(withChecksum("GPRMC,123519,A,4875.0,N,01131.000,E,022.4,084.4,230394,003.1,W"), &reason));
  CHECK(reason.find("minutes") != string::npos);
  CHECK(!parseNMEA(withChecksum("GPRMC,123519,A,4807.038,N,01160.5,E,022.4,084.4,230394,003.1,W")));
  CHECK(!parseNMEA(withChecksum("GPRMC,123519,A,-4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W"), &reason));
  CHECK(reason.find("negative") != string::npos);
  CHECK(!parseNMEA(withChecksum("GPGGA,123519,4807.038,N,-01131.000,E,1,08,0.9,545.4,M,46.9,M,,")));
}

static map<string, double> extractMap(const string& line)
{
  auto s = parseNMEA(line);
  REQUIRE(s);
  map<string, double> ret;
  for(const auto& e : extractObservations(*s))
    ret[e.key] = e.value;
  return ret;
}

TEST_CASE("extraction table") {
  auto vtg = extractMap(withChecksum("GPVTG,054.7,T,034.4,M,005.5,N,010.2,K"));
  CHECK(vtg.size() == 2);
  CHECK(vtg["SOG"] == 5.5);
  CHECK(vtg["COG"] == 54.7);

  auto awind = extractMap(withChecksum("WIMWV,045.0,R,10.0,K,A"));
  CHECK(awind.size() == 2);
  CHECK(awind["AWA"] == 45.0);
  CHECK(awind["AWS"] == doctest::Approx(10.0/1.852));

  auto twind = extractMap(withChecksum("WIMWV,135.0,T,5.0,M,A"));
  CHECK(twind["TWA"] == 135.0);
  CHECK(twind["TWS"] == doctest::Approx(5.0*3600/1852));

  CHECK(extractMap(withChecksum("WIMWV,045.0,R,10.0,N,V")).empty());
  CHECK(extractMap(withChecksum("GPRMC,123519,V,4807.038,N,01131.000,E,022.4,084.4,230394,003.1,W")).empty());
  CHECK(extractMap(withChecksum("GPGGA,123519,4807.038,N,01131.000,E,0,08,0.9,545.4,M,46.9,M,,")).empty());

  auto gga = extractMap(withChecksum("GPGGA,123519,4807.038,N,01131.000,E,1,08,0.9,545.4,M,46.9,M,,"));
  CHECK(gga.size() == 2);
  CHECK(gga["LAT"] == doctest::Approx(48 + 7.038/60));

  auto dpt = extractMap(withChecksum("SDDPT,12.5,0.5"));
  CHECK(dpt["DPT"] == 13.0);
  CHECK(extractMap(withChecksum("SDDPT,,0.5")).empty());

  CHECK(extractMap(withChecksum("HCHDT,274.1,T"))["HDT"] == 274.1);
  CHECK(extractMap(withChecksum("VWVLW,1022.5,N,12.25,N"))["LOG"] == 12.25);

  // everything produced is in the metric table
  for(const auto& line : {withChecksum("IIVHW,123.0,T,120.0,M,6.42,N,11.89,K"),
                          withChecksum("WIMWD,270.0,T,272.0,M,12.0,N,6.2,M")}) {
    for(const auto& e : extractMap(line))
      CHECK(findMetric(e.first));
  }
}

TEST_CASE("metric table and display configuration") {
  CHECK(validateDisplayKeys({"BSP", "TWA", "HDG"}).empty());
  auto bad = validateDisplayKeys({"BSP", "XYZ", "bsp"});
  REQUIRE(bad.size() == 2);
  CHECK(bad[0] == "XYZ");
  CHECK(bad[1] == "bsp");
  CHECK_THROWS_AS(MetricDisplay({"BSP", "NOPE"}), std::invalid_argument);

  MetricDisplay md({"BSP", "TWA"});
  CHECK(md.isEnabled("BSP"));
  CHECK(!md.isEnabled("HDG"));
  CHECK(md.formatUnit("BSP", 6.4249) == "BSP:6.42");
  CHECK(md.formatUnit("TWA", 44.6) == "TWA:45");

  CHECK(parseLogLevel("WARNING") == LogLevel::Warning);
  CHECK(!parseLogLevel("LOUD"));
}

TEST_CASE("new subscribers get a replay of observed keys only") {
  SmoothingStore ss(1.0);
  MetricDisplay md({"BSP", "TWA", "HDG"});
  Broadcaster b(ss, md);
  ss.update("BSP", 3.0, 0);
  ss.update("TWA", 7.0, 0);

  auto sub = make_shared<RecordingSubscriber>();
  b.join(sub);
  REQUIRE(sub->waitFor(2));
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  auto units = sub->get();
  sort(units.begin(), units.end());
  REQUIRE(units.size() == 2);
  CHECK(units[0] == "BSP:3.00");
  CHECK(units[1] == "TWA:7");
}

TEST_CASE("replay skips keys that are not displayed") {
  SmoothingStore ss(1.0);
  MetricDisplay md({"BSP"});
  Broadcaster b(ss, md);
  ss.update("BSP", 3.0, 0);
  ss.update("TWA", 7.0, 0);

  auto sub = make_shared<RecordingSubscriber>();
  b.join(sub);
  REQUIRE(sub->waitFor(1));
  b.publish("TWA", 8.0);
  b.publish("BSP", 4.0);
  REQUIRE(sub->waitFor(2));
  vector<string> expected{"BSP:3.00", "BSP:4.00"};
  CHECK(sub->get() == expected);
}

TEST_CASE("publish reaches every subscriber, failures are isolated") {
  SmoothingStore ss(1.0);
  MetricDisplay md({"BSP"});
  Broadcaster b(ss, md);

  auto good1 = make_shared<RecordingSubscriber>();
  auto good2 = make_shared<RecordingSubscriber>();
  auto broken = make_shared<RecordingSubscriber>();
  broken->failAfter = 1;
  b.join(good1);
  auto brokenId = b.join(broken);
  b.join(good2);
  CHECK(b.size() == 3);

  for(int n = 0; n < 5; ++n)
    b.publish("BSP", n);

  REQUIRE(good1->waitFor(5));
  REQUIRE(good2->waitFor(5));
  CHECK(good1->get() == good2->get());
  CHECK(good1->get()[4] == "BSP:4.00");
  CHECK(waitForSize(b, 2));
  CHECK(broken->get().size() == 1);
  CHECK(b.getDropped() == 1);

  // already gone, leaving again is fine
  b.leave(brokenId);
  b.leave(brokenId);
  b.publish("BSP", 5);
  REQUIRE(good1->waitFor(6));
  CHECK(b.size() == 2);
}

TEST_CASE("a stalled subscriber is dropped, not waited for") {
  SmoothingStore ss(1.0);
  MetricDisplay md({"BSP"});
  Broadcaster b(ss, md, 2);

  auto stalled = make_shared<RecordingSubscriber>();
  stalled->stalled = true;
  auto healthy = make_shared<RecordingSubscriber>();
  b.join(stalled);
  b.join(healthy);

  auto start = std::chrono::steady_clock::now();
  for(int n = 0; n < 5; ++n)
    b.publish("BSP", n);
  CHECK(std::chrono::steady_clock::now() - start < std::chrono::seconds(1));

  CHECK(waitForSize(b, 1));
  CHECK(stalled->isClosed());
  REQUIRE(healthy->waitFor(5));
  b.publish("BSP", 9);
  REQUIRE(healthy->waitFor(6));
}

TEST_CASE("leave stops delivery") {
  SmoothingStore ss(1.0);
  MetricDisplay md({"BSP"});
  Broadcaster b(ss, md);
  auto sub = make_shared<RecordingSubscriber>();
  auto id = b.join(sub);
  b.publish("BSP", 1);
  REQUIRE(sub->waitFor(1));
  b.leave(id);
  CHECK(b.size() == 0);
  CHECK(sub->isClosed());
  b.publish("BSP", 2);
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  CHECK(sub->get().size() == 1);
}

TEST_CASE("departed subscribers are released without a new join") {
  SmoothingStore ss(1.0);
  MetricDisplay md({"BSP"});
  Broadcaster b(ss, md);
  auto first = make_shared<RecordingSubscriber>();
  auto second = make_shared<RecordingSubscriber>();
  weak_ptr<RecordingSubscriber> w1(first), w2(second);
  auto id1 = b.join(first);
  auto id2 = b.join(second);
  b.leave(id1);
  b.leave(id2);
  first.reset();
  second.reset();

  bool released = false;
  for(int tries = 0; tries < 500 && !released; ++tries) {
    b.publish("BSP", tries);
    released = w1.expired() && w2.expired();
    if(!released)
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  CHECK(released);
  CHECK(b.size() == 0);
}

TEST_CASE("ingest gives up on an unusable socket") {
  SmoothingStore ss(0);
  MetricDisplay md({"BSP"});
  Broadcaster b(ss, md);
  Ingestor ing(ss, b);
  CHECK_THROWS_AS(ing.run(-1), std::runtime_error);
}

TEST_CASE("ingest survives garbage and publishes every observation") {
  SmoothingStore ss(0);
  MetricDisplay md({"BSP", "SOG", "COG"});
  Broadcaster b(ss, md);
  Ingestor ing(ss, b);
  auto sub = make_shared<RecordingSubscriber>();
  b.join(sub);

  CHECK(ing.processDatagram("$IIVHW,xx,T*ZZ", 1) == 0);
  CHECK(ing.processDatagram(string("\x00\x17\xfe", 3), 1) == 0);
  CHECK(ing.processDatagram(withChecksum("GPGSV,3,1,11"), 1) == 0);

  // VHW feeds BSP, HDT and HDG, only BSP is displayed
  CHECK(ing.processDatagram(withChecksum("IIVHW,123.0,T,120.0,M,6.42,N,11.89,K") + "\r\n", 2) == 3);
  REQUIRE(sub->waitFor(1));
  CHECK(sub->get()[0] == "BSP:6.42");
  CHECK(*ss.snapshot("HDT") == 123.0);
  CHECK(*ss.snapshot("HDG") == 120.0);

  CHECK(ing.processDatagram(withChecksum("GPVTG,054.7,T,034.4,M,005.5,N,010.2,K"), 3) == 2);
  REQUIRE(sub->waitFor(3));
  auto units = sub->get();
  CHECK(find(units.begin(), units.end(), "SOG:5.50") != units.end());
  CHECK(find(units.begin(), units.end(), "COG:55") != units.end());

  auto st = ing.getStats();
  CHECK(st.datagrams == 5);
  CHECK(st.decodeFailures == 3);
  CHECK(st.observations == 5);

  // a late joiner sees the current state
  auto late = make_shared<RecordingSubscriber>();
  b.join(late);
  REQUIRE(late->waitFor(3));
}
