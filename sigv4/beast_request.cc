// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/beast_request.h"

namespace sigv4 {

namespace {

std::string ToStdString(boost::beast::string_view s) {
  return std::string(s.data(), s.size());
}

boost::beast::string_view ToBeast(absl::string_view s) {
  return boost::beast::string_view(s.data(), s.size());
}

}  // namespace

BeastRequest::BeastRequest(Message* req, std::string host) : req_{req}, host_{std::move(host)} {
}

std::string BeastRequest::method() const {
  return ToStdString(req_->method_string());
}

std::string BeastRequest::target() const {
  return ToStdString(req_->target());
}

std::vector<Header> BeastRequest::headers() const {
  std::vector<Header> headers;
  for (const auto& field : req_->base()) {
    headers.emplace_back(ToStdString(field.name_string()), ToStdString(field.value()));
  }
  return headers;
}

bool BeastRequest::HasHeader(absl::string_view name) const {
  // Beast compares field names case-insensitively.
  return req_->find(ToBeast(name)) != req_->end();
}

void BeastRequest::SetHeader(absl::string_view name, absl::string_view value) {
  req_->set(ToBeast(name), ToBeast(value));
}

}  // namespace sigv4
