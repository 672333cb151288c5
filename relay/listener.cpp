#include "relay/listener.hpp"

#include <chrono>

#include "absl/memory/memory.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "grpc++/server_context.h"
#include "grpc/grpc.h"
#include "proto/relay.grpc.pb.h"
#include "relay/errors.hpp"

namespace {
const auto CANCEL_POLL_INTERVAL = std::chrono::milliseconds(50);  // NOLINT
const auto SHUTDOWN_GRACE = std::chrono::seconds(1);              // NOLINT
}  // namespace

namespace relay {

void IncomingCall::Respond(proto::Envelope response) {
  if (answered_) {
    throw std::logic_error("Call " + std::to_string(request_.call_id()) +
                           " answered twice");
  }
  answered_ = true;
  response.set_endpoint(request_.endpoint());
  response.set_call_id(request_.call_id());
  response_.set_value(std::move(response));
}

void IncomingCall::RespondError(const proto::Error& error) {
  proto::Envelope response;
  response.set_is_error(true);
  error.SerializeToString(response.mutable_payload());
  Respond(std::move(response));
}

class Listener::Service : public proto::Relay::Service {
 public:
  explicit Service(Listener* listener) : listener_(listener) {}

  grpc::Status Call(grpc::ServerContext* context,
                    const proto::Envelope* request,
                    proto::Envelope* response) override {
    std::promise<proto::Envelope> promise;
    std::future<proto::Envelope> future = promise.get_future();
    auto abandoned = std::make_shared<std::atomic<bool>>(false);
    if (!listener_->Enqueue(
            IncomingCall(*request, std::move(promise), abandoned))) {
      return grpc::Status(grpc::StatusCode::UNAVAILABLE, "Listener closed");
    }
    while (future.wait_for(CANCEL_POLL_INTERVAL) !=
           std::future_status::ready) {
      if (context->IsCancelled()) {
        *abandoned = true;
        LOG(WARNING) << "Caller abandoned " << request->endpoint() << "#"
                     << request->call_id();
        return grpc::Status(grpc::StatusCode::CANCELLED, "Call abandoned");
      }
    }
    try {
      *response = future.get();
    } catch (const std::future_error&) {
      LOG(WARNING) << request->endpoint() << "#" << request->call_id()
                   << " dropped without an answer";
      return grpc::Status(grpc::StatusCode::UNAVAILABLE,
                          "Call dropped by the responder");
    }
    return grpc::Status::OK;
  }

 private:
  Listener* listener_;
};

Listener::Listener(std::string address)
    : address_(std::move(address)), service_(new Service(this)) {}

std::unique_ptr<Listener> Listener::Listen(const std::string& address) {
  std::unique_ptr<Listener> listener(new Listener(address));
  grpc::ServerBuilder builder;
  int bound_port = 0;
  builder.AddListeningPort(address, grpc::InsecureServerCredentials(),
                           &bound_port);
  builder.RegisterService(listener->service_.get());
  listener->server_ = builder.BuildAndStart();
  if (!listener->server_) {
    throw connection_unavailable("Cannot listen on " + address);
  }
  LOG(INFO) << "Listening on " << address;
  return listener;
}

bool Listener::Enqueue(IncomingCall call) {
  absl::MutexLock lck(&queue_mutex_);
  if (closed_) return false;
  queue_.push(std::move(call));
  return true;
}

absl::optional<IncomingCall> Listener::Accept() {
  absl::MutexLock lck(&queue_mutex_);
  auto cond = [this]() {
    queue_mutex_.AssertHeld();
    return closed_ || !queue_.empty();
  };
  while (true) {
    queue_mutex_.Await(absl::Condition(&cond));
    if (closed_) return {};
    absl::optional<IncomingCall> call = std::move(queue_.front());
    queue_.pop();
    if (!call->Abandoned()) return call;
    VLOG(1) << "Discarding abandoned " << call->Request().endpoint() << "#"
            << call->Request().call_id();
  }
}

bool Listener::IsClosed() {
  absl::MutexLock lck(&queue_mutex_);
  return closed_;
}

void Listener::Close() {
  {
    absl::MutexLock lck(&queue_mutex_);
    if (closed_) return;
    closed_ = true;
    // Destroying the queued promises wakes the gRPC threads waiting on them.
    while (!queue_.empty()) queue_.pop();
  }
  if (server_) {
    server_->Shutdown(std::chrono::system_clock::now() + SHUTDOWN_GRACE);
    server_->Wait();
  }
  LOG(INFO) << "Stopped listening on " << address_;
}

Listener::~Listener() { Close(); }

}  // namespace relay
