// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <absl/status/status.h>
#include <absl/strings/string_view.h>

#include <string>

namespace sigv4 {

enum class SignErrorType {
  // An argument is empty or missing.
  INVALID_ARGUMENT,
  // The request cannot be signed as is, such as when it already carries an
  // Authorization header or its target cannot be parsed.
  MALFORMED_REQUEST,
  UNKNOWN,
};

std::string ToString(SignErrorType type);

// Returns a status carrying the given error type. The message is prefixed
// with the type name.
absl::Status SignError(SignErrorType type, absl::string_view message);

// Returns the error type of a status created by SignError. An OK status or a
// status from elsewhere maps to UNKNOWN.
SignErrorType GetSignErrorType(const absl::Status& status);

inline bool IsMalformedRequest(const absl::Status& status) {
  return GetSignErrorType(status) == SignErrorType::MALFORMED_REQUEST;
}

}  // namespace sigv4
