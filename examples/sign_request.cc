// Copyright 2023, Roman Gershman.  All rights reserved.
// See LICENSE for licensing terms.

#include <absl/flags/flag.h>
#include <absl/flags/parse.h>
#include <boost/beast/http/write.hpp>
#include <glog/logging.h>

#include <iostream>
#include <memory>

#include "sigv4/beast_request.h"
#include "sigv4/credentials_provider.h"
#include "sigv4/signer.h"

ABSL_FLAG(std::string, url, "https://example.execute-api.ap-northeast-1.amazonaws.com/",
          "Request URL");
ABSL_FLAG(std::string, method, "POST", "Request method");
ABSL_FLAG(std::string, body, "{\"sampleKey\":\"sampleValue\"}", "Request body");
ABSL_FLAG(std::string, content_type, "application/json", "Content-Type of the body");
ABSL_FLAG(std::string, service, "execute-api", "AWS service name");
ABSL_FLAG(std::string, region, "ap-northeast-1", "AWS region");
ABSL_FLAG(std::string, aws_access_key_id, "", "AWS access key ID");
ABSL_FLAG(std::string, aws_secret_access_key, "", "AWS secret access key");

namespace h2 = boost::beast::http;

int main(int argc, char* argv[]) {
  absl::ParseCommandLine(argc, argv);
  google::InitGoogleLogging(argv[0]);

  // Flags take precedence over the environment.
  std::unique_ptr<sigv4::CredentialsProvider> provider =
      sigv4::DefaultCredentialsProvider(sigv4::Credentials{
          absl::GetFlag(FLAGS_aws_access_key_id), absl::GetFlag(FLAGS_aws_secret_access_key)});
  absl::StatusOr<sigv4::Signer> signer = sigv4::CreateSigner(provider.get());
  if (!signer.ok()) {
    LOG(ERROR) << "failed to create signer: " << signer.status();
    return 1;
  }

  absl::StatusOr<sigv4::Url> url = sigv4::Url::Parse(absl::GetFlag(FLAGS_url));
  if (!url.ok()) {
    LOG(ERROR) << "invalid url: " << url.status();
    return 1;
  }

  const std::string method = absl::GetFlag(FLAGS_method);
  const h2::verb verb = h2::string_to_verb(method);
  if (verb == h2::verb::unknown) {
    LOG(ERROR) << "unknown method: " << method;
    return 1;
  }

  const std::string target = url->Target();
  sigv4::BeastRequest::Message req{verb, target, 11};
  const std::string body = absl::GetFlag(FLAGS_body);
  if (!body.empty()) {
    req.set(h2::field::content_type, absl::GetFlag(FLAGS_content_type));
    req.body() = body;
  }
  req.prepare_payload();

  sigv4::BeastRequest signable{&req, url->HostHeader()};
  absl::Status status =
      signer->Sign(&signable, absl::GetFlag(FLAGS_service), absl::GetFlag(FLAGS_region));
  if (!status.ok()) {
    LOG(ERROR) << "failed to sign request: " << status;
    return 1;
  }

  LOG(INFO) << "signed request; method=" << method << "; url=" << url->ToString();
  std::cout << req << std::endl;
  return 0;
}
