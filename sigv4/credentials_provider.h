// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <absl/status/statusor.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sigv4/credentials.h"
#include "sigv4/signer.h"

namespace sigv4 {

// CredentialsProvider is a source of the key pair a Signer is created with.
class CredentialsProvider {
 public:
  virtual ~CredentialsProvider() = default;

  virtual std::string name() const = 0;

  // Returns nullopt unless both the access key id and the secret access key
  // are available.
  virtual std::optional<Credentials> LoadCredentials() = 0;
};

// Reads the key pair from a pair of environment variables.
class EnvironmentCredentialsProvider : public CredentialsProvider {
 public:
  static constexpr char kAccessKeyIdVar[] = "AWS_ACCESS_KEY_ID";
  static constexpr char kSecretAccessKeyVar[] = "AWS_SECRET_ACCESS_KEY";

  explicit EnvironmentCredentialsProvider(std::string access_key_id_var = kAccessKeyIdVar,
                                          std::string secret_access_key_var = kSecretAccessKeyVar);

  std::string name() const override {
    return "environment";
  }

  std::optional<Credentials> LoadCredentials() override;

 private:
  std::string access_key_id_var_;

  std::string secret_access_key_var_;
};

// Returns a key pair given up front, such as one from command line flags.
class StaticCredentialsProvider : public CredentialsProvider {
 public:
  explicit StaticCredentialsProvider(Credentials credentials);

  std::string name() const override {
    return "static";
  }

  std::optional<Credentials> LoadCredentials() override;

 private:
  Credentials credentials_;
};

// Asks each provider in turn and returns the first complete key pair.
class CredentialsProviderChain : public CredentialsProvider {
 public:
  explicit CredentialsProviderChain(std::vector<std::unique_ptr<CredentialsProvider>> providers);

  // "chain(<provider>,...)".
  std::string name() const override;

  std::optional<Credentials> LoadCredentials() override;

 private:
  std::vector<std::unique_ptr<CredentialsProvider>> providers_;
};

// Returns a chain that tries the explicit credentials, when both parts are
// set, and then the AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY variables.
std::unique_ptr<CredentialsProvider> DefaultCredentialsProvider(Credentials explicit_credentials);

// Creates a signer from the credentials the provider yields. Returns an
// INVALID_ARGUMENT error naming the provider when it has none.
absl::StatusOr<Signer> CreateSigner(CredentialsProvider* provider);

}  // namespace sigv4
