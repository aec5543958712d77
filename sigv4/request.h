// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#pragma once

#include <absl/strings/string_view.h>
#include <boost/beast/http/verb.hpp>

#include <string>
#include <utility>
#include <vector>

#include "sigv4/url.h"

namespace sigv4 {

namespace h2 = boost::beast::http;

using Header = std::pair<std::string, std::string>;

// SignableRequest is the view of an HTTP request the signer needs.
//
// Header names are case-insensitive. A name may appear more than once.
class SignableRequest {
 public:
  virtual ~SignableRequest() = default;

  virtual std::string method() const = 0;

  // Host the request is sent to, used when the request has no Host header.
  virtual std::string host() const = 0;

  // Origin-form request target: the encoded path and the query string.
  virtual std::string target() const = 0;

  // Returns all headers in the order they were added, names as given.
  virtual std::vector<Header> headers() const = 0;

  virtual bool HasHeader(absl::string_view name) const = 0;

  // Replaces all headers with the given name by a single header.
  virtual void SetHeader(absl::string_view name, absl::string_view value) = 0;

  virtual absl::string_view body() const = 0;
};

// Request is a self-contained request to sign.
class Request : public SignableRequest {
 public:
  Request(h2::verb method, Url url);

  std::string method() const override;

  std::string host() const override;

  std::string target() const override;

  std::vector<Header> headers() const override {
    return headers_;
  }

  bool HasHeader(absl::string_view name) const override;

  void SetHeader(absl::string_view name, absl::string_view value) override;

  absl::string_view body() const override {
    return body_;
  }

  const Url& url() const {
    return url_;
  }

  // Returns the comma joined values of the named header, or an empty string if
  // there is no such header.
  std::string GetHeader(absl::string_view name) const;

  // Appends a header, keeping any header with the same name.
  void AddHeader(absl::string_view name, absl::string_view value);

  void set_body(std::string body) {
    body_ = std::move(body);
  }

 private:
  h2::verb method_;

  Url url_;

  std::vector<Header> headers_;

  std::string body_;
};

}  // namespace sigv4
