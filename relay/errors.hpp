#ifndef RELAY_ERRORS_HPP
#define RELAY_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace relay {

class relay_error : public std::runtime_error {
 public:
  explicit relay_error(const std::string& msg) : std::runtime_error(msg) {}
};

// The peer did not become reachable within the startup grace period.
class connection_unavailable : public relay_error {
 public:
  explicit connection_unavailable(const std::string& msg) : relay_error(msg) {}
};

// Malformed bytes, or a response that does not match its request.
class corrupt_envelope : public relay_error {
 public:
  explicit corrupt_envelope(const std::string& msg) : relay_error(msg) {}
};

// The remote handler raised or returned something unusable.
class handler_failure : public relay_error {
 public:
  explicit handler_failure(const std::string& msg) : relay_error(msg) {}
};

class timeout : public relay_error {
 public:
  explicit timeout(const std::string& msg) : relay_error(msg) {}
};

// The connection dropped; no further calls can succeed on this channel.
class transport_broken : public relay_error {
 public:
  explicit transport_broken(const std::string& msg) : relay_error(msg) {}
};

class unknown_endpoint : public relay_error {
 public:
  explicit unknown_endpoint(const std::string& msg) : relay_error(msg) {}
};

}  // namespace relay

#endif
