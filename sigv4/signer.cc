// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/signer.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/time/time.h>
#include <glog/logging.h>

#include "sigv4/canonical_request.h"
#include "sigv4/errors.h"
#include "sigv4/hash.h"

namespace sigv4 {

std::string StringToSign(absl::string_view amz_date, const CredentialScope& scope,
                         absl::string_view canonical_request) {
  return absl::StrJoin({absl::string_view(kAlgorithm), amz_date,
                        absl::string_view(scope.ToString()),
                        absl::string_view(Sha256Hex(canonical_request))},
                       "\n");
}

std::string AuthorizationHeader(absl::string_view access_key_id, const CredentialScope& scope,
                                absl::string_view signed_headers, absl::string_view signature) {
  return absl::StrCat(kAlgorithm, " ", "Credential=", access_key_id, "/", scope.ToString(), ", ",
                      "SignedHeaders=", signed_headers, ", ", "Signature=", signature);
}

Signer::Signer(Credentials credentials) : credentials_{std::move(credentials)} {
}

absl::StatusOr<Signer> Signer::Create(Credentials credentials) {
  if (credentials.access_key_id.empty()) {
    return SignError(SignErrorType::INVALID_ARGUMENT, "access key id is empty");
  }
  if (credentials.secret_access_key.empty()) {
    return SignError(SignErrorType::INVALID_ARGUMENT, "secret access key is empty");
  }
  return Signer{std::move(credentials)};
}

absl::Status Signer::Sign(SignableRequest* req, absl::string_view service,
                          absl::string_view region, absl::Time time) const {
  if (req == nullptr) {
    return SignError(SignErrorType::INVALID_ARGUMENT, "request is null");
  }
  if (service.empty()) {
    return SignError(SignErrorType::INVALID_ARGUMENT, "service is empty");
  }
  if (region.empty()) {
    return SignError(SignErrorType::INVALID_ARGUMENT, "region is empty");
  }
  if (!IsSignableTime(time)) {
    return SignError(SignErrorType::MALFORMED_REQUEST,
                     absl::StrCat("time cannot be formatted as a timestamp: ",
                                  absl::FormatTime(time, absl::UTCTimeZone())));
  }
  if (req->HasHeader(kAuthorizationHeader)) {
    return SignError(SignErrorType::MALFORMED_REQUEST,
                     "request already has an authorization header");
  }

  absl::StatusOr<CanonicalRequest> canonical = BuildCanonicalRequest(*req, time);
  if (!canonical.ok()) {
    return canonical.status();
  }
  VLOG(1) << "sigv4: signer: canonical request: " << canonical->canonical_request;

  const CredentialScope scope{FormatDateStamp(time), std::string(region), std::string(service)};

  const std::string string_to_sign =
      StringToSign(canonical->amz_date, scope, canonical->canonical_request);
  VLOG(1) << "sigv4: signer: string to sign: " << string_to_sign;

  const Sha256Digest signing_key = DeriveSigningKey(credentials_.secret_access_key, scope);
  const std::string signature = HmacSha256Hex(AsStringView(signing_key), string_to_sign);

  const std::string authorization =
      AuthorizationHeader(credentials_.access_key_id, scope, canonical->signed_headers, signature);
  VLOG(1) << "sigv4: signer: authorization: " << authorization;

  if (!canonical->host.empty()) {
    req->SetHeader("Host", canonical->host);
  }
  req->SetHeader(kAmzDateHeader, canonical->amz_date);
  req->SetHeader(kAuthorizationHeader, authorization);

  return absl::OkStatus();
}

}  // namespace sigv4
