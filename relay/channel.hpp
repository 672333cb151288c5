#ifndef RELAY_CHANNEL_HPP
#define RELAY_CHANNEL_HPP

#include <chrono>
#include <memory>
#include <string>

#include "proto/relay.pb.h"
#include "relay/backoff.hpp"

namespace relay {

// Deadlines are wall-clock and attached to each call.
using Clock = std::chrono::system_clock;
using Deadline = Clock::time_point;

struct ConnectOptions {
  // Either "unix:/path/to/socket" or "host:port".
  std::string address;
  // How long to keep retrying while the peer is not listening yet.
  std::chrono::milliseconds grace_period{900000};
  BackoffOptions backoff;
};

// Dialer side of the relay. At most one call is issued at a time by the
// gateway; implementations must still allow Close() while a call is in
// progress, and concurrent calls.
class Channel {
 public:
  // Sends the envelope and blocks until the matching response arrives.
  // Throws timeout if the deadline expires (the channel stays usable),
  // transport_broken if the connection is gone, corrupt_envelope if the
  // response does not match the request.
  // An error envelope sent by the peer is returned, not thrown.
  virtual proto::Envelope Call(const proto::Envelope& request,
                               Deadline deadline) = 0;

  // Releases the connection. Further calls throw transport_broken.
  virtual void Close() = 0;

  Channel() = default;
  virtual ~Channel() = default;
  Channel(const Channel&) = delete;
  Channel& operator=(const Channel&) = delete;
  Channel(Channel&&) = delete;
  Channel& operator=(Channel&&) = delete;
};

// Connects to a listener at options.address, retrying with exponential
// backoff for the grace period. Throws connection_unavailable.
std::unique_ptr<Channel> Dial(const ConnectOptions& options);

}  // namespace relay

#endif
