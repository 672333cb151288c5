#ifndef ENVELOPE_CODEC_HPP
#define ENVELOPE_CODEC_HPP

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "google/protobuf/message.h"
#include "proto/relay.pb.h"

namespace envelope {

// A typed value extracted from an envelope. When is_error is set, value holds
// a proto::Error.
struct Decoded {
  std::string endpoint;
  bool is_error = false;
  std::unique_ptr<google::protobuf::Message> value;
};

// Converts typed protobuf values to and from envelopes. The envelope schema
// is fixed; the payload shapes are registered per endpoint name, so new
// endpoints never require a new wire schema.
// Registering is not thread-safe and should be done before the codec is
// shared between threads.
class Codec {
 public:
  template <typename Request, typename Response>
  void Register(const std::string& endpoint) {
    Register(endpoint, &Request::default_instance(),
             &Response::default_instance());
  }
  void Register(const std::string& endpoint,
                const google::protobuf::Message* request_prototype,
                const google::protobuf::Message* response_prototype);

  bool Knows(const std::string& endpoint) const {
    return shapes_.count(endpoint) != 0;
  }
  std::vector<std::string> Endpoints() const;

  proto::Envelope Wrap(const std::string& endpoint,
                       const google::protobuf::Message& value) const;
  proto::Envelope WrapError(const std::string& endpoint,
                            const proto::Error& error) const;

  // Interprets the payload with the shape registered for the endpoint.
  // Throws unknown_endpoint or corrupt_envelope.
  Decoded UnwrapRequest(const proto::Envelope& envelope) const;
  Decoded UnwrapResponse(const proto::Envelope& envelope) const;

  // Byte-level helpers, used where the envelope leaves the process.
  std::string Encode(const std::string& endpoint,
                     const google::protobuf::Message& value) const {
    return Serialize(Wrap(endpoint, value));
  }
  Decoded DecodeRequest(const std::string& bytes) const {
    return UnwrapRequest(Parse(bytes));
  }
  Decoded DecodeResponse(const std::string& bytes) const {
    return UnwrapResponse(Parse(bytes));
  }

  static std::string Serialize(const proto::Envelope& envelope);
  // Throws corrupt_envelope if bytes are not a valid envelope.
  static proto::Envelope Parse(const std::string& bytes);

  // Builds the error payload carried by error envelopes.
  static proto::Error MakeError(proto::Error::Kind kind,
                                const std::string& message,
                                const std::string& type = "");

 private:
  struct Shapes {
    const google::protobuf::Message* request;
    const google::protobuf::Message* response;
  };
  Decoded Unwrap(const proto::Envelope& envelope, bool response) const;

  std::map<std::string, Shapes> shapes_;
};

}  // namespace envelope

#endif
