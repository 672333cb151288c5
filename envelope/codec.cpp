#include "envelope/codec.hpp"

#include "relay/errors.hpp"

namespace envelope {

void Codec::Register(const std::string& endpoint,
                     const google::protobuf::Message* request_prototype,
                     const google::protobuf::Message* response_prototype) {
  if (endpoint.empty()) {
    throw std::invalid_argument("Endpoint name cannot be empty");
  }
  if (!shapes_.emplace(endpoint, Shapes{request_prototype, response_prototype})
           .second) {
    throw std::invalid_argument("Endpoint " + endpoint +
                                " registered twice");
  }
}

std::vector<std::string> Codec::Endpoints() const {
  std::vector<std::string> endpoints;
  for (const auto& kv : shapes_) endpoints.push_back(kv.first);
  return endpoints;
}

proto::Envelope Codec::Wrap(const std::string& endpoint,
                            const google::protobuf::Message& value) const {
  if (!Knows(endpoint)) {
    throw relay::unknown_endpoint("Unknown endpoint " + endpoint);
  }
  proto::Envelope envelope;
  envelope.set_endpoint(endpoint);
  if (!value.SerializeToString(envelope.mutable_payload())) {
    throw relay::corrupt_envelope("Cannot serialize " +
                                  value.GetTypeName() + " for " + endpoint);
  }
  return envelope;
}

proto::Envelope Codec::WrapError(const std::string& endpoint,
                                 const proto::Error& error) const {
  proto::Envelope envelope;
  envelope.set_endpoint(endpoint);
  envelope.set_is_error(true);
  error.SerializeToString(envelope.mutable_payload());
  return envelope;
}

Decoded Codec::UnwrapRequest(const proto::Envelope& envelope) const {
  return Unwrap(envelope, false);
}

Decoded Codec::UnwrapResponse(const proto::Envelope& envelope) const {
  return Unwrap(envelope, true);
}

Decoded Codec::Unwrap(const proto::Envelope& envelope, bool response) const {
  Decoded decoded;
  decoded.endpoint = envelope.endpoint();
  decoded.is_error = envelope.is_error();
  if (envelope.is_error()) {
    decoded.value.reset(new proto::Error);
  } else {
    auto it = shapes_.find(envelope.endpoint());
    if (it == shapes_.end()) {
      throw relay::unknown_endpoint("Unknown endpoint " + envelope.endpoint());
    }
    const google::protobuf::Message* prototype =
        response ? it->second.response : it->second.request;
    decoded.value.reset(prototype->New());
  }
  if (!decoded.value->ParseFromString(envelope.payload())) {
    throw relay::corrupt_envelope("Payload for " + envelope.endpoint() +
                                  " is not a valid " +
                                  decoded.value->GetTypeName());
  }
  return decoded;
}

std::string Codec::Serialize(const proto::Envelope& envelope) {
  return envelope.SerializeAsString();
}

proto::Envelope Codec::Parse(const std::string& bytes) {
  proto::Envelope envelope;
  if (!envelope.ParseFromString(bytes)) {
    throw relay::corrupt_envelope("Malformed envelope (" +
                                  std::to_string(bytes.size()) + " bytes)");
  }
  return envelope;
}

proto::Error Codec::MakeError(proto::Error::Kind kind,
                              const std::string& message,
                              const std::string& type) {
  proto::Error error;
  error.set_kind(kind);
  error.set_message(message);
  error.set_type(type);
  return error;
}

}  // namespace envelope
