// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/hash.h"

#include <absl/strings/escaping.h>
#include <glog/logging.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace sigv4 {

Sha256Digest Sha256(absl::string_view data) {
  Sha256Digest digest;
  unsigned size;
  CHECK_EQ(1, EVP_Digest(data.data(), data.size(), digest.data(), &size, EVP_sha256(), nullptr));
  CHECK_EQ(size, kSha256Size);
  return digest;
}

std::string Sha256Hex(absl::string_view data) {
  return HexEncode(Sha256(data));
}

Sha256Digest HmacSha256(absl::string_view key, absl::string_view data) {
  Sha256Digest hmac;
  unsigned hmac_len;
  CHECK_NE(nullptr, HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
                         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
                         hmac.data(), &hmac_len));
  CHECK_EQ(hmac_len, kSha256Size);
  return hmac;
}

std::string HmacSha256Hex(absl::string_view key, absl::string_view data) {
  return HexEncode(HmacSha256(key, data));
}

std::string HexEncode(const Sha256Digest& digest) {
  return absl::BytesToHexString(AsStringView(digest));
}

}  // namespace sigv4
