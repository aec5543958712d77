// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include "sigv4/url.h"

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <absl/strings/str_replace.h>
#include <absl/strings/str_split.h>

#include "sigv4/errors.h"

namespace sigv4 {

namespace {

bool IsUnreserved(char c) {
  return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.' ||
         c == '~';
}

int HexValue(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

absl::Status MalformedUrl(absl::string_view what, absl::string_view input) {
  return SignError(SignErrorType::MALFORMED_REQUEST, absl::StrCat(what, ": \"", input, "\""));
}

// Query components use form encoding, where '+' stands for a space.
absl::StatusOr<std::string> DecodeQueryComponent(absl::string_view s) {
  return UrlDecode(absl::StrReplaceAll(s, {{"+", " "}}));
}

absl::Status ValidatePath(absl::string_view path) {
  if (!path.empty() && path.front() != '/') {
    return MalformedUrl("request target is not in origin form", path);
  }
  for (char c : path) {
    const unsigned char uc = static_cast<unsigned char>(c);
    if (uc <= 0x20 || uc == 0x7f) {
      return MalformedUrl("invalid character in path", path);
    }
  }
  absl::StatusOr<std::string> decoded = UrlDecode(path);
  if (!decoded.ok()) {
    return MalformedUrl("invalid percent encoding in path", path);
  }
  return absl::OkStatus();
}

}  // namespace

std::string ToString(Scheme s) {
  if (s == Scheme::HTTP) {
    return "http";
  }
  // Default to HTTPS.
  return "https";
}

Scheme FromString(absl::string_view s) {
  const std::string lower_s = absl::AsciiStrToLower(s);
  if (lower_s == "http") {
    return Scheme::HTTP;
  }
  // Default to HTTPS.
  return Scheme::HTTPS;
}

std::string UrlEncode(absl::string_view s) {
  static constexpr char kHex[] = "0123456789ABCDEF";

  std::string escaped;
  escaped.reserve(s.size());
  for (char c : s) {
    if (IsUnreserved(c)) {
      escaped.push_back(c);
    } else {
      const unsigned char uc = static_cast<unsigned char>(c);
      escaped.push_back('%');
      escaped.push_back(kHex[uc >> 4]);
      escaped.push_back(kHex[uc & 0xF]);
    }
  }
  return escaped;
}

absl::StatusOr<std::string> UrlDecode(absl::string_view s) {
  std::string decoded;
  decoded.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] != '%') {
      decoded.push_back(s[i]);
      continue;
    }
    if (i + 2 >= s.size()) {
      return MalformedUrl("truncated percent escape", s);
    }
    const int hi = HexValue(s[i + 1]);
    const int lo = HexValue(s[i + 2]);
    if (hi < 0 || lo < 0) {
      return MalformedUrl("invalid percent escape", s);
    }
    decoded.push_back(static_cast<char>((hi << 4) | lo));
    i += 2;
  }
  return decoded;
}

Url::Url() {
}

absl::StatusOr<Url> Url::Parse(absl::string_view url) {
  const size_t scheme_end = url.find("://");
  if (scheme_end == absl::string_view::npos) {
    return MalformedUrl("missing url scheme", url);
  }
  const std::string scheme = absl::AsciiStrToLower(url.substr(0, scheme_end));
  if (scheme != "http" && scheme != "https") {
    return MalformedUrl("unsupported url scheme", url);
  }

  const absl::string_view rest = url.substr(scheme_end + 3);
  const size_t authority_end = rest.find_first_of("/?#");
  const absl::string_view authority = rest.substr(0, authority_end);
  absl::string_view target;
  if (authority_end != absl::string_view::npos) {
    target = rest.substr(authority_end);
  }

  absl::StatusOr<Url> parsed = ParseTarget(target);
  if (!parsed.ok()) {
    return parsed.status();
  }
  // Set the scheme first so an explicit port in the authority wins.
  parsed->SetScheme(FromString(scheme));
  absl::Status status = parsed->SetHost(authority);
  if (!status.ok()) {
    return status;
  }
  return parsed;
}

absl::StatusOr<Url> Url::ParseTarget(absl::string_view target) {
  // Fragments are never sent to the server.
  target = target.substr(0, target.find('#'));

  const size_t query_start = target.find('?');
  const absl::string_view path = target.substr(0, query_start);
  absl::string_view query;
  if (query_start != absl::string_view::npos) {
    query = target.substr(query_start + 1);
  }

  absl::Status status = ValidatePath(path);
  if (!status.ok()) {
    return status;
  }

  Url url;
  url.path_ = std::string(path);

  for (absl::string_view pair : absl::StrSplit(query, '&', absl::SkipEmpty())) {
    const size_t eq = pair.find('=');
    absl::StatusOr<std::string> key = DecodeQueryComponent(pair.substr(0, eq));
    if (!key.ok()) {
      return key.status();
    }
    absl::StatusOr<std::string> value = std::string();
    if (eq != absl::string_view::npos) {
      value = DecodeQueryComponent(pair.substr(eq + 1));
    }
    if (!value.ok()) {
      return value.status();
    }
    url.params_.emplace_back(*std::move(key), *std::move(value));
  }

  return url;
}

std::string Url::HostHeader() const {
  if (port_ == DefaultPort()) {
    return host_;
  }
  return absl::StrCat(host_, ":", port_);
}

std::string Url::QueryString() const {
  return absl::StrJoin(params_, "&", [](std::string* out, const Param& param) {
    absl::StrAppend(out, UrlEncode(param.first), "=", UrlEncode(param.second));
  });
}

std::string Url::Target() const {
  std::string target = path_.empty() ? "/" : path_;
  if (!params_.empty()) {
    absl::StrAppend(&target, "?", QueryString());
  }
  return target;
}

void Url::SetScheme(Scheme s) {
  scheme_ = s;
  if (port_ == kHttpPort || port_ == kHttpsPort) {
    // If the port is a default HTTP/HTTPS port, update it to match the
    // new scheme. Don't override a custom port.
    port_ = DefaultPort();
  }
}

absl::Status Url::SetHost(absl::string_view host) {
  if (host.find('@') != absl::string_view::npos) {
    return MalformedUrl("user info is not supported in host", host);
  }

  // Skip the brackets of an IPv6 literal when looking for the port.
  size_t port_search_start = 0;
  if (!host.empty() && host.front() == '[') {
    port_search_start = host.find(']');
    if (port_search_start == absl::string_view::npos) {
      return MalformedUrl("unterminated IPv6 literal", host);
    }
  }

  const size_t port_idx = host.find(':', port_search_start);
  const absl::string_view name = host.substr(0, port_idx);
  if (name.empty()) {
    return MalformedUrl("missing host", host);
  }

  uint16_t port = port_;
  if (port_idx != absl::string_view::npos) {
    uint32_t parsed_port;
    if (!absl::SimpleAtoi(host.substr(port_idx + 1), &parsed_port) || parsed_port == 0 ||
        parsed_port >= (1u << 16)) {
      return MalformedUrl("invalid port", host);
    }
    port = static_cast<uint16_t>(parsed_port);
  }

  host_ = std::string(name);
  port_ = port;
  return absl::OkStatus();
}

std::string Url::ToString() const {
  return absl::StrCat(sigv4::ToString(scheme_), "://", HostHeader(), Target());
}

uint16_t Url::DefaultPort() const {
  return (scheme_ == Scheme::HTTP) ? kHttpPort : kHttpsPort;
}

}  // namespace sigv4
