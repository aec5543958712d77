// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/signing_key.h"

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/time/civil_time.h>

namespace sigv4 {

std::string FormatAmzDate(absl::Time time) {
  return absl::FormatTime("%Y%m%dT%H%M%SZ", time, absl::UTCTimeZone());
}

std::string FormatDateStamp(absl::Time time) {
  return absl::FormatTime("%Y%m%d", time, absl::UTCTimeZone());
}

bool IsSignableTime(absl::Time time) {
  if (time == absl::InfiniteFuture() || time == absl::InfinitePast()) {
    return false;
  }
  const absl::CivilSecond civil = absl::ToCivilSecond(time, absl::UTCTimeZone());
  return civil.year() >= 0 && civil.year() <= 9999;
}

std::string CredentialScope::ToString() const {
  return absl::StrJoin({absl::string_view(date), absl::string_view(region),
                        absl::string_view(service), absl::string_view(kScopeTerminator)},
                       "/");
}

Sha256Digest DeriveSigningKey(absl::string_view secret_access_key, const CredentialScope& scope) {
  const std::string secret = absl::StrCat("AWS4", secret_access_key);

  Sha256Digest key = HmacSha256(secret, scope.date);
  key = HmacSha256(AsStringView(key), scope.region);
  key = HmacSha256(AsStringView(key), scope.service);
  return HmacSha256(AsStringView(key), kScopeTerminator);
}

}  // namespace sigv4
