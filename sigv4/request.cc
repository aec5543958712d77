// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/request.h"

#include <absl/strings/match.h>
#include <absl/strings/str_join.h>

#include <algorithm>

namespace sigv4 {

Request::Request(h2::verb method, Url url) : method_{method}, url_{std::move(url)} {
}

std::string Request::method() const {
  const auto verb = h2::to_string(method_);
  return std::string(verb.data(), verb.size());
}

std::string Request::host() const {
  return url_.HostHeader();
}

std::string Request::target() const {
  return url_.Target();
}

bool Request::HasHeader(absl::string_view name) const {
  return std::any_of(headers_.begin(), headers_.end(), [name](const Header& header) {
    return absl::EqualsIgnoreCase(header.first, name);
  });
}

void Request::SetHeader(absl::string_view name, absl::string_view value) {
  headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                [name](const Header& header) {
                                  return absl::EqualsIgnoreCase(header.first, name);
                                }),
                 headers_.end());
  AddHeader(name, value);
}

std::string Request::GetHeader(absl::string_view name) const {
  std::vector<absl::string_view> values;
  for (const Header& header : headers_) {
    if (absl::EqualsIgnoreCase(header.first, name)) {
      values.push_back(header.second);
    }
  }
  return absl::StrJoin(values, ",");
}

void Request::AddHeader(absl::string_view name, absl::string_view value) {
  headers_.emplace_back(std::string(name), std::string(value));
}

}  // namespace sigv4
