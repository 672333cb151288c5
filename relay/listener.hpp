#ifndef RELAY_LISTENER_HPP
#define RELAY_LISTENER_HPP

#include <atomic>
#include <future>
#include <memory>
#include <queue>
#include <string>

#include "absl/base/thread_annotations.h"
#include "absl/synchronization/mutex.h"
#include "absl/types/optional.h"
#include "proto/relay.pb.h"

namespace grpc {
class Server;
}  // namespace grpc

namespace relay {

// A call received by the listener. It must be answered exactly once; if it
// is dropped unanswered the caller sees a transport error.
class IncomingCall {
 public:
  using Flag = std::shared_ptr<std::atomic<bool>>;

  IncomingCall(proto::Envelope request, std::promise<proto::Envelope> response,
               Flag abandoned = std::make_shared<std::atomic<bool>>(false))
      : request_(std::move(request)),
        response_(std::move(response)),
        abandoned_(std::move(abandoned)) {}

  const proto::Envelope& Request() const { return request_; }

  // True once the caller stopped waiting, e.g. because its deadline expired.
  bool Abandoned() const { return *abandoned_; }

  // The response is tagged with the request's endpoint and call id.
  void Respond(proto::Envelope response);
  void RespondError(const proto::Error& error);

  bool Answered() const { return answered_; }

  IncomingCall(IncomingCall&&) = default;
  IncomingCall& operator=(IncomingCall&&) = default;
  IncomingCall(const IncomingCall&) = delete;
  IncomingCall& operator=(const IncomingCall&) = delete;

 private:
  proto::Envelope request_;
  std::promise<proto::Envelope> response_;
  Flag abandoned_;
  bool answered_ = false;
};

// Listener side of the relay. Calls arrive on gRPC threads and are handed
// to the owner one at a time through Accept().
class Listener {
 public:
  // Binds the address ("unix:/path" or "host:port") and starts accepting.
  // Throws connection_unavailable if the address cannot be bound.
  static std::unique_ptr<Listener> Listen(const std::string& address);

  // Blocks until a call is available. Calls abandoned by their caller while
  // queued are discarded. Returns nothing once the listener is closed.
  absl::optional<IncomingCall> Accept();

  // Stops the server. Calls still queued are dropped; callers whose call
  // is being handled get an error once the shutdown grace expires.
  void Close();
  bool IsClosed();

  const std::string& Address() const { return address_; }

  ~Listener();
  Listener(const Listener&) = delete;
  Listener& operator=(const Listener&) = delete;

 private:
  class Service;

  explicit Listener(std::string address);
  // Returns false if the listener is closed.
  bool Enqueue(IncomingCall call);

  std::string address_;
  std::unique_ptr<Service> service_;
  std::unique_ptr<grpc::Server> server_;

  absl::Mutex queue_mutex_;
  std::queue<IncomingCall> queue_ GUARDED_BY(queue_mutex_);
  bool closed_ GUARDED_BY(queue_mutex_) = false;
};

}  // namespace relay

#endif
