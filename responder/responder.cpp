#include "responder/responder.hpp"

#include <typeinfo>

#include "glog/logging.h"
#include "relay/errors.hpp"

namespace responder {

void Responder::RegisterShutdown(const std::string& endpoint) {
  Register<proto::Shutdown, proto::Shutdown>(
      endpoint, [this, endpoint](const proto::Shutdown&) {
        LOG(INFO) << "Shutdown requested through " << endpoint;
        stopped_ = true;
        return proto::Shutdown();
      });
}

void Responder::Require(const std::vector<std::string>& endpoints) const {
  for (const std::string& endpoint : endpoints) {
    if (handlers_.count(endpoint) == 0) {
      throw relay::unknown_endpoint("Required endpoint " + endpoint +
                                    " has no handler");
    }
  }
}

proto::Envelope Responder::Dispatch(const proto::Envelope& request) const {
  const std::string& endpoint = request.endpoint();
  try {
    envelope::Decoded decoded = codec_.UnwrapRequest(request);
    if (decoded.is_error) {
      return codec_.WrapError(
          endpoint, envelope::Codec::MakeError(proto::Error::CORRUPT_ENVELOPE,
                                               "Request flagged as error"));
    }
    std::unique_ptr<google::protobuf::Message> response =
        handlers_.at(endpoint)(*decoded.value);
    if (!response) {
      return codec_.WrapError(
          endpoint, envelope::Codec::MakeError(proto::Error::INVALID_RESPONSE,
                                               "Handler returned nothing"));
    }
    return codec_.Wrap(endpoint, *response);
  } catch (const relay::unknown_endpoint& e) {
    LOG(WARNING) << "Call to unknown endpoint " << endpoint;
    return codec_.WrapError(
        endpoint,
        envelope::Codec::MakeError(proto::Error::UNKNOWN_ENDPOINT, e.what(),
                                   typeid(e).name()));
  } catch (const relay::corrupt_envelope& e) {
    LOG(WARNING) << "Corrupt request for " << endpoint << ": " << e.what();
    return codec_.WrapError(
        endpoint,
        envelope::Codec::MakeError(proto::Error::CORRUPT_ENVELOPE, e.what(),
                                   typeid(e).name()));
  } catch (const std::exception& e) {
    LOG(WARNING) << "Handler for " << endpoint << " failed: " << e.what();
    return codec_.WrapError(
        endpoint,
        envelope::Codec::MakeError(proto::Error::HANDLER_FAILURE, e.what(),
                                   typeid(e).name()));
  } catch (...) {
    LOG(WARNING) << "Handler for " << endpoint << " threw a non-exception";
    return codec_.WrapError(
        endpoint, envelope::Codec::MakeError(proto::Error::HANDLER_FAILURE,
                                             "Unknown exception"));
  }
}

int64_t Responder::Serve(relay::Listener* listener) {
  serving_ = listener;
  int64_t served = 0;
  LOG(INFO) << "Serving " << handlers_.size() << " endpoint(s) on "
            << listener->Address();
  while (!stopped_) {
    absl::optional<relay::IncomingCall> call = listener->Accept();
    if (!call) break;
    VLOG(1) << "Call " << call->Request().endpoint() << "#"
            << call->Request().call_id();
    call->Respond(Dispatch(call->Request()));
    served++;
  }
  serving_ = nullptr;
  LOG(INFO) << "Served " << served << " call(s)";
  return served;
}

void Responder::Stop() {
  stopped_ = true;
  relay::Listener* listener = serving_;
  if (listener != nullptr) listener->Close();
}

}  // namespace responder
