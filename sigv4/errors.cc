// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/errors.h"

#include <absl/strings/str_cat.h>

namespace sigv4 {

std::string ToString(SignErrorType type) {
  switch (type) {
    case SignErrorType::INVALID_ARGUMENT:
      return "invalid_argument";
    case SignErrorType::MALFORMED_REQUEST:
      return "malformed_request";
    default:
      return "unknown";
  }
}

absl::Status SignError(SignErrorType type, absl::string_view message) {
  const std::string full_message = absl::StrCat(ToString(type), ": ", message);
  switch (type) {
    case SignErrorType::INVALID_ARGUMENT:
      return absl::InvalidArgumentError(full_message);
    case SignErrorType::MALFORMED_REQUEST:
      return absl::FailedPreconditionError(full_message);
    default:
      return absl::UnknownError(full_message);
  }
}

SignErrorType GetSignErrorType(const absl::Status& status) {
  if (absl::IsInvalidArgument(status)) {
    return SignErrorType::INVALID_ARGUMENT;
  }
  if (absl::IsFailedPrecondition(status)) {
    return SignErrorType::MALFORMED_REQUEST;
  }
  return SignErrorType::UNKNOWN;
}

}  // namespace sigv4
