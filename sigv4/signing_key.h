// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <absl/strings/string_view.h>
#include <absl/time/time.h>

#include <string>

#include "sigv4/hash.h"

namespace sigv4 {

constexpr char kAlgorithm[] = "AWS4-HMAC-SHA256";

constexpr char kScopeTerminator[] = "aws4_request";

// Formats the time in UTC as YYYYMMDDTHHMMSSZ, the x-amz-date format.
std::string FormatAmzDate(absl::Time time);

// Formats the time in UTC as YYYYMMDD.
std::string FormatDateStamp(absl::Time time);

// Returns whether the time is finite and its UTC year has four digits, so
// that FormatAmzDate and FormatDateStamp yield their fixed-width forms.
bool IsSignableTime(absl::Time time);

// CredentialScope limits a derived signing key to one day, region and
// service.
struct CredentialScope {
  // YYYYMMDD.
  std::string date;
  std::string region;
  std::string service;

  // Returns "date/region/service/aws4_request".
  std::string ToString() const;
};

// Derives the signing key for the scope from the secret access key:
//
//   kDate    = HMAC("AWS4" + secret, date)
//   kRegion  = HMAC(kDate, region)
//   kService = HMAC(kRegion, service)
//   kSigning = HMAC(kService, "aws4_request")
//
// Each step is keyed with the raw output of the previous one.
Sha256Digest DeriveSigningKey(absl::string_view secret_access_key, const CredentialScope& scope);

}  // namespace sigv4
