#pragma once
#include <string>
#include <atomic>
#include "comboaddress.hh"
#include "sclasses.hh"
#include "broadcaster.hh"

// A subscriber connected over TCP, every unit is sent as one line
class TCPSubscriber : public Subscriber
{
public:
  TCPSubscriber(int fd, const ComboAddress& remote, double writeTimeout);
  void write(const std::string& unit) override;
  void close() override;
  std::string describe() const override;

  // discards whatever the client sends, returns once the connection is gone
  std::string readUntilClosed();

private:
  Socket d_sock;
  ComboAddress d_remote;
  std::atomic<bool> d_closed{false};
};

// one accepted connection: joins, then leaves once the client hangs up
void subscriberSession(int fd, ComboAddress remote, Broadcaster* broadcaster, double writeTimeout);
// accepts subscribers on s forever, one reader thread per connection
void subscriberListener(Socket&& s, ComboAddress local, Broadcaster* broadcaster, double writeTimeout);
