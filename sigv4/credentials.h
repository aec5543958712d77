// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <string>

namespace sigv4 {

struct Credentials {
  // AWS Access key ID
  std::string access_key_id;

  // AWS Secret Access Key
  std::string secret_access_key;
};

}  // namespace sigv4
