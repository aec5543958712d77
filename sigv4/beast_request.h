// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

#include "sigv4/request.h"

namespace sigv4 {

// BeastRequest signs a Beast request in place.
//
// The wrapped request must outlive the adapter. The host is only used when the
// request has no Host header.
class BeastRequest : public SignableRequest {
 public:
  using Message = h2::request<h2::string_body>;

  BeastRequest(Message* req, std::string host);

  std::string method() const override;

  std::string host() const override {
    return host_;
  }

  std::string target() const override;

  std::vector<Header> headers() const override;

  bool HasHeader(absl::string_view name) const override;

  void SetHeader(absl::string_view name, absl::string_view value) override;

  absl::string_view body() const override {
    return req_->body();
  }

 private:
  Message* req_;

  std::string host_;
};

}  // namespace sigv4
