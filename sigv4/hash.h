// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <absl/strings/string_view.h>

#include <array>
#include <cstdint>
#include <string>

namespace sigv4 {

constexpr size_t kSha256Size = 256 / 8;

using Sha256Digest = std::array<uint8_t, kSha256Size>;

// One-shot SHA-256 and HMAC-SHA256 helpers.
//
// Each call uses its own OpenSSL context, so the functions can be called
// concurrently without synchronization.

Sha256Digest Sha256(absl::string_view data);

// Returns the lowercase hex SHA-256 digest of data.
std::string Sha256Hex(absl::string_view data);

Sha256Digest HmacSha256(absl::string_view key, absl::string_view data);

// Returns the lowercase hex HMAC-SHA256 of data under key.
std::string HmacSha256Hex(absl::string_view key, absl::string_view data);

std::string HexEncode(const Sha256Digest& digest);

// Views the raw digest bytes, to be used as the key of a following HMAC.
inline absl::string_view AsStringView(const Sha256Digest& digest) {
  return absl::string_view(reinterpret_cast<const char*>(digest.data()), digest.size());
}

}  // namespace sigv4
