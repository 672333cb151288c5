#ifndef RESPONDER_RESPONDER_HPP
#define RESPONDER_RESPONDER_HPP

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "envelope/codec.hpp"
#include "proto/relay.pb.h"
#include "relay/listener.hpp"

namespace responder {

// Hosts named endpoints behind a relay listener. Handlers are registered by
// name before serving starts; a failing handler is reported to the caller
// as an error envelope and never stops the server.
class Responder {
 public:
  using Handler = std::function<std::unique_ptr<google::protobuf::Message>(
      const google::protobuf::Message& request)>;

  template <typename Request, typename Response>
  void Register(const std::string& endpoint,
                std::function<Response(const Request&)> handler) {
    codec_.Register<Request, Response>(endpoint);
    handlers_[endpoint] = [handler](const google::protobuf::Message& request) {
      std::unique_ptr<google::protobuf::Message> response(new Response(
          handler(static_cast<const Request&>(request))));
      return response;
    };
  }

  // Registers an endpoint taking proto::Shutdown. Serve returns after
  // answering it.
  void RegisterShutdown(const std::string& endpoint);

  // Throws relay::unknown_endpoint naming the first missing endpoint.
  void Require(const std::vector<std::string>& endpoints) const;

  // Runs the registered handler. Never throws: failures are converted to
  // error envelopes.
  proto::Envelope Dispatch(const proto::Envelope& request) const;

  // Answers calls one at a time until Stop() is called or the listener is
  // closed. Returns the number of calls served.
  int64_t Serve(relay::Listener* listener);

  // Makes Serve return after the call in progress, if any, and closes the
  // listener. Must not be called from a handler.
  void Stop();

  const envelope::Codec& Codec() const { return codec_; }

 private:
  envelope::Codec codec_;
  std::map<std::string, Handler> handlers_;
  std::atomic<relay::Listener*> serving_{nullptr};
  std::atomic<bool> stopped_{false};
};

}  // namespace responder

#endif
