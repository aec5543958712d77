// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/string_view.h>
#include <absl/time/clock.h>

#include <string>

#include "sigv4/credentials.h"
#include "sigv4/request.h"
#include "sigv4/signing_key.h"

namespace sigv4 {

constexpr char kAuthorizationHeader[] = "Authorization";

// Returns "AWS4-HMAC-SHA256\n<amz_date>\n<scope>\n<hex sha256 of canonical_request>".
std::string StringToSign(absl::string_view amz_date, const CredentialScope& scope,
                         absl::string_view canonical_request);

std::string AuthorizationHeader(absl::string_view access_key_id, const CredentialScope& scope,
                                absl::string_view signed_headers, absl::string_view signature);

// Signer signs requests with AWS V4 signatures.
//
// See https://docs.aws.amazon.com/general/latest/gr/sigv4_signing.html
// for details.
//
// The signer only holds its credentials. Sign keeps all derived state local,
// so one signer may sign different requests from multiple threads.
class Signer {
 public:
  // Returns an INVALID_ARGUMENT error if the access key id or the secret
  // access key is empty.
  static absl::StatusOr<Signer> Create(Credentials credentials);

  const std::string& access_key_id() const {
    return credentials_.access_key_id;
  }

  // Signs the request for the service and region as of the given time.
  //
  // On success the request has x-amz-date and Authorization headers, and a
  // Host header if it had none. On error the request is left unchanged.
  //
  // Returns INVALID_ARGUMENT if req is null or service or region is empty,
  // and MALFORMED_REQUEST if the time is outside years 0000 to 9999, the
  // request already has an Authorization header or its target cannot be
  // parsed.
  absl::Status Sign(SignableRequest* req, absl::string_view service, absl::string_view region,
                    absl::Time time = absl::Now()) const;

 private:
  explicit Signer(Credentials credentials);

  Credentials credentials_;
};

}  // namespace sigv4
