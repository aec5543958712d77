// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/credentials_provider.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <glog/logging.h>

#include <cstdlib>

#include "sigv4/errors.h"

namespace sigv4 {

namespace {

bool IsComplete(const Credentials& credentials) {
  return !credentials.access_key_id.empty() && !credentials.secret_access_key.empty();
}

}  // namespace

EnvironmentCredentialsProvider::EnvironmentCredentialsProvider(std::string access_key_id_var,
                                                               std::string secret_access_key_var)
    : access_key_id_var_{std::move(access_key_id_var)},
      secret_access_key_var_{std::move(secret_access_key_var)} {
}

std::optional<Credentials> EnvironmentCredentialsProvider::LoadCredentials() {
  const char* access_key_id = std::getenv(access_key_id_var_.c_str());
  const char* secret_access_key = std::getenv(secret_access_key_var_.c_str());
  if (access_key_id == nullptr || secret_access_key == nullptr) {
    VLOG(1) << "sigv4: credentials: " << access_key_id_var_ << " and " << secret_access_key_var_
            << " must both be set";
    return std::nullopt;
  }

  Credentials credentials{access_key_id, secret_access_key};
  if (!IsComplete(credentials)) {
    VLOG(1) << "sigv4: credentials: empty " << access_key_id_var_ << " or "
            << secret_access_key_var_;
    return std::nullopt;
  }
  return credentials;
}

StaticCredentialsProvider::StaticCredentialsProvider(Credentials credentials)
    : credentials_{std::move(credentials)} {
}

std::optional<Credentials> StaticCredentialsProvider::LoadCredentials() {
  if (!IsComplete(credentials_)) {
    return std::nullopt;
  }
  return credentials_;
}

CredentialsProviderChain::CredentialsProviderChain(
    std::vector<std::unique_ptr<CredentialsProvider>> providers)
    : providers_{std::move(providers)} {
}

std::string CredentialsProviderChain::name() const {
  return absl::StrCat(
      "chain(",
      absl::StrJoin(providers_, ",",
                    [](std::string* out, const std::unique_ptr<CredentialsProvider>& provider) {
                      absl::StrAppend(out, provider->name());
                    }),
      ")");
}

std::optional<Credentials> CredentialsProviderChain::LoadCredentials() {
  for (const std::unique_ptr<CredentialsProvider>& provider : providers_) {
    std::optional<Credentials> credentials = provider->LoadCredentials();
    if (credentials) {
      VLOG(1) << "sigv4: credentials: loaded; provider=" << provider->name();
      return credentials;
    }
  }
  return std::nullopt;
}

std::unique_ptr<CredentialsProvider> DefaultCredentialsProvider(Credentials explicit_credentials) {
  std::vector<std::unique_ptr<CredentialsProvider>> providers;
  providers.push_back(std::make_unique<StaticCredentialsProvider>(std::move(explicit_credentials)));
  providers.push_back(std::make_unique<EnvironmentCredentialsProvider>());
  return std::make_unique<CredentialsProviderChain>(std::move(providers));
}

absl::StatusOr<Signer> CreateSigner(CredentialsProvider* provider) {
  std::optional<Credentials> credentials = provider->LoadCredentials();
  if (!credentials) {
    return SignError(SignErrorType::INVALID_ARGUMENT,
                     absl::StrCat("no credentials found; provider=", provider->name()));
  }
  return Signer::Create(*std::move(credentials));
}

}  // namespace sigv4
