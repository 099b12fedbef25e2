#include <gtest/gtest.h>

#include "tokengw/credential_validator.hpp"

namespace {

TEST(CredentialValidatorTest, AcceptsCompleteCredentials) {
  tokengw::GatewayFailure failure;
  auto creds = tokengw::ValidateCredentials(R"({"client_id":"svc-a","client_secret":"s3cret"})", failure);
  ASSERT_TRUE(creds.has_value());
  EXPECT_EQ(creds->client_id, "svc-a");
  EXPECT_EQ(creds->client_secret, "s3cret");
}

TEST(CredentialValidatorTest, IgnoresUnknownFields) {
  tokengw::GatewayFailure failure;
  auto creds =
      tokengw::ValidateCredentials(R"({"client_id":"svc-a","client_secret":"x","grant_type":"client"})", failure);
  EXPECT_TRUE(creds.has_value());
}

TEST(CredentialValidatorTest, RejectsUndecodableBody) {
  for (const char* body : {"", "{not json", "[1,2]", "\"text\""}) {
    tokengw::GatewayFailure failure;
    EXPECT_FALSE(tokengw::ValidateCredentials(body, failure).has_value()) << body;
    EXPECT_EQ(failure.kind, tokengw::ErrorKind::kMalformedRequest) << body;
    EXPECT_EQ(failure.message, "Invalid request format");
  }
}

TEST(CredentialValidatorTest, RejectsWrongFieldType) {
  tokengw::GatewayFailure failure;
  EXPECT_FALSE(tokengw::ValidateCredentials(R"({"client_id":42,"client_secret":"x"})", failure).has_value());
  EXPECT_EQ(failure.kind, tokengw::ErrorKind::kMalformedRequest);
}

TEST(CredentialValidatorTest, RequiresBothFields) {
  for (const char* body : {R"({"client_id":"svc-a","client_secret":""})", R"({"client_secret":"x"})",
                           R"({"client_id":"svc-a","client_secret":null})", "{}"}) {
    tokengw::GatewayFailure failure;
    EXPECT_FALSE(tokengw::ValidateCredentials(body, failure).has_value()) << body;
    EXPECT_EQ(failure.kind, tokengw::ErrorKind::kMissingCredential) << body;
    EXPECT_EQ(failure.message, "Client ID and Client Secret are required");
  }
}

}  // namespace
