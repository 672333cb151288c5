#include "envelope/codec.hpp"
#include "gmock/gmock.h"
#include "google/protobuf/util/message_differencer.h"
#include "gtest/gtest.h"
#include "proto/solver.pb.h"
#include "relay/errors.hpp"

namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;

using google::protobuf::util::MessageDifferencer;

envelope::Codec MakeCodec() {
  envelope::Codec codec;
  codec.Register<proto::PredictRequest, proto::PredictResponse>("predict");
  return codec;
}

// NOLINTNEXTLINE
TEST(Codec, RequestRoundTrip) {
  envelope::Codec codec = MakeCodec();
  proto::PredictRequest request;
  request.set_id("p1");
  request.set_problem("What is $1+1$? Give the answer mod $10^5$.");
  envelope::Decoded decoded =
      codec.DecodeRequest(codec.Encode("predict", request));
  EXPECT_EQ(decoded.endpoint, "predict");
  EXPECT_FALSE(decoded.is_error);
  ASSERT_TRUE(decoded.value);
  EXPECT_TRUE(MessageDifferencer::Equals(*decoded.value, request));
}

// NOLINTNEXTLINE
TEST(Codec, ResponseUsesResponseShape) {
  envelope::Codec codec = MakeCodec();
  proto::PredictResponse response;
  response.set_answer(99999);
  envelope::Decoded decoded =
      codec.DecodeResponse(codec.Encode("predict", response));
  ASSERT_TRUE(decoded.value);
  EXPECT_EQ(decoded.value->GetTypeName(), "proto.PredictResponse");
  EXPECT_TRUE(MessageDifferencer::Equals(*decoded.value, response));
}

// NOLINTNEXTLINE
TEST(Codec, EmptyPayloadRoundTrip) {
  envelope::Codec codec = MakeCodec();
  proto::PredictResponse response;
  envelope::Decoded decoded =
      codec.DecodeResponse(codec.Encode("predict", response));
  EXPECT_TRUE(MessageDifferencer::Equals(*decoded.value, response));
}

// NOLINTNEXTLINE
TEST(Codec, ErrorRoundTrip) {
  envelope::Codec codec = MakeCodec();
  proto::Error error = envelope::Codec::MakeError(
      proto::Error::HANDLER_FAILURE, "division by zero", "std::domain_error");
  envelope::Decoded decoded = codec.DecodeResponse(
      envelope::Codec::Serialize(codec.WrapError("predict", error)));
  EXPECT_EQ(decoded.endpoint, "predict");
  EXPECT_TRUE(decoded.is_error);
  EXPECT_TRUE(MessageDifferencer::Equals(*decoded.value, error));
}

// NOLINTNEXTLINE
TEST(Codec, ErrorForUnknownEndpoint) {
  envelope::Codec codec = MakeCodec();
  proto::Error error = envelope::Codec::MakeError(
      proto::Error::UNKNOWN_ENDPOINT, "no such endpoint");
  envelope::Decoded decoded =
      codec.UnwrapResponse(codec.WrapError("solve", error));
  EXPECT_EQ(decoded.endpoint, "solve");
  EXPECT_TRUE(decoded.is_error);
}

// NOLINTNEXTLINE
TEST(Codec, UnknownEndpoint) {
  envelope::Codec codec = MakeCodec();
  proto::PredictRequest request;
  EXPECT_THROW(codec.Encode("solve", request), relay::unknown_endpoint);

  proto::Envelope envelope;
  envelope.set_endpoint("solve");
  EXPECT_THROW(codec.UnwrapRequest(envelope), relay::unknown_endpoint);
}

// NOLINTNEXTLINE
TEST(Codec, MalformedBytes) {
  envelope::Codec codec = MakeCodec();
  // Field 1, length-delimited, claims 127 bytes but none follow.
  std::string bytes("\x0a\x7f", 2);
  EXPECT_THROW(envelope::Codec::Parse(bytes), relay::corrupt_envelope);
  EXPECT_THROW(codec.DecodeRequest(bytes), relay::corrupt_envelope);
}

// NOLINTNEXTLINE
TEST(Codec, MalformedPayload) {
  envelope::Codec codec = MakeCodec();
  proto::Envelope envelope;
  envelope.set_endpoint("predict");
  envelope.set_payload(std::string("\x12\x40", 2));
  try {
    codec.UnwrapRequest(envelope);
    FAIL() << "corrupt payload accepted";
  } catch (const relay::corrupt_envelope& e) {
    EXPECT_THAT(e.what(), HasSubstr("proto.PredictRequest"));
  }
}

// NOLINTNEXTLINE
TEST(Codec, DuplicateRegistration) {
  envelope::Codec codec = MakeCodec();
  EXPECT_THROW(
      (codec.Register<proto::PredictRequest, proto::PredictResponse>(
          "predict")),
      std::invalid_argument);
  EXPECT_THAT(codec.Endpoints(), ElementsAre("predict"));
}

}  // namespace
