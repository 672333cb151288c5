#include <algorithm>
#include <atomic>

#include "absl/base/thread_annotations.h"
#include "absl/memory/memory.h"
#include "absl/synchronization/mutex.h"
#include "glog/logging.h"
#include "grpc++/channel.h"
#include "grpc++/client_context.h"
#include "grpc++/create_channel.h"
#include "grpc++/security/credentials.h"
#include "grpc++/support/channel_arguments.h"
#include "grpc/grpc.h"
#include "proto/relay.grpc.pb.h"
#include "relay/channel.hpp"
#include "relay/errors.hpp"

namespace relay {

namespace {

void ThrowForStatus(const grpc::Status& status, const std::string& endpoint) {
  std::string what = endpoint + ": " + status.error_message();
  switch (status.error_code()) {
    case grpc::StatusCode::DEADLINE_EXCEEDED:
      throw timeout(what);
    case grpc::StatusCode::INTERNAL:
    case grpc::StatusCode::DATA_LOSS:
      throw corrupt_envelope(what);
    default:
      throw transport_broken(what);
  }
}

class GrpcChannel final : public Channel {
 public:
  GrpcChannel(std::string address, std::shared_ptr<grpc::Channel> channel)
      : address_(std::move(address)),
        channel_(std::move(channel)),
        stub_(proto::Relay::NewStub(channel_)) {}

  proto::Envelope Call(const proto::Envelope& request,
                       Deadline deadline) override {
    std::shared_ptr<proto::Relay::Stub> stub;
    {
      absl::MutexLock lck(&mutex_);
      if (!stub_) throw transport_broken("Channel to " + address_ + " closed");
      stub = stub_;
    }
    proto::Envelope tagged = request;
    tagged.set_call_id(++last_call_id_);

    grpc::ClientContext context;
    context.set_deadline(deadline);
    proto::Envelope response;
    grpc::Status status = stub->Call(&context, tagged, &response);
    if (!status.ok()) ThrowForStatus(status, request.endpoint());
    if (response.call_id() != tagged.call_id() ||
        response.endpoint() != tagged.endpoint()) {
      throw corrupt_envelope("Response " + response.endpoint() + "#" +
                             std::to_string(response.call_id()) +
                             " does not match request " + tagged.endpoint() +
                             "#" + std::to_string(tagged.call_id()));
    }
    return response;
  }

  // Calls in progress keep their own reference and finish normally.
  void Close() override {
    absl::MutexLock lck(&mutex_);
    stub_.reset();
    channel_.reset();
  }

 private:
  std::string address_;
  absl::Mutex mutex_;
  std::shared_ptr<grpc::Channel> channel_ GUARDED_BY(mutex_);
  std::shared_ptr<proto::Relay::Stub> stub_ GUARDED_BY(mutex_);
  std::atomic<uint64_t> last_call_id_{0};
};

}  // namespace

std::unique_ptr<Channel> Dial(const ConnectOptions& options) {
  grpc::ChannelArguments args;
  // Keep gRPC's own reconnection schedule in line with ours, otherwise it
  // may sleep far past the point where the peer came up.
  args.SetInt(GRPC_ARG_INITIAL_RECONNECT_BACKOFF_MS,
              static_cast<int>(options.backoff.initial.count()));
  args.SetInt(GRPC_ARG_MIN_RECONNECT_BACKOFF_MS,
              static_cast<int>(options.backoff.initial.count()));
  args.SetInt(GRPC_ARG_MAX_RECONNECT_BACKOFF_MS,
              static_cast<int>(options.backoff.max.count()));
  std::shared_ptr<grpc::Channel> channel = grpc::CreateCustomChannel(
      options.address, grpc::InsecureChannelCredentials(), args);

  Deadline give_up = Clock::now() + options.grace_period;
  Backoff backoff(options.backoff);
  while (true) {
    Deadline attempt = std::min(Deadline(Clock::now() + backoff.Next()),
                                give_up);
    if (channel->WaitForConnected(attempt)) break;
    if (Clock::now() >= give_up) {
      LOG(ERROR) << "Responder at " << options.address
                 << " unreachable after " << backoff.Attempts()
                 << " attempts";
      throw connection_unavailable("Cannot connect to " + options.address +
                                   " within " +
                                   std::to_string(options.grace_period.count()) +
                                   "ms");
    }
    VLOG(1) << "Waiting for responder at " << options.address << " (attempt "
            << backoff.Attempts() << ")";
  }
  LOG(INFO) << "Connected to " << options.address << " after "
            << backoff.Attempts() << " attempt(s)";
  return absl::make_unique<GrpcChannel>(options.address, std::move(channel));
}

}  // namespace relay
