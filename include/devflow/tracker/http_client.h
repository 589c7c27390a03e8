#pragma once

#include "devflow/core/result.h"

#include <string>
#include <vector>

namespace devflow::tracker {

struct HttpResponse {
  long status{0};
  std::string body;
};

// IHttpClient is the transport seam under the GraphQL backends.
// Transport failures (DNS, TLS, timeout) come back as BackendError; any HTTP
// status, including 4xx/5xx, is a successful exchange and is returned as-is.
class IHttpClient {
 public:
  virtual ~IHttpClient() = default;

  [[nodiscard]] virtual core::Result<HttpResponse, core::BackendError> post(
      const std::string& url, const std::string& body, const std::vector<std::string>& headers) = 0;

 protected:
  IHttpClient() = default;
  IHttpClient(const IHttpClient&) = default;
  IHttpClient& operator=(const IHttpClient&) = default;
  IHttpClient(IHttpClient&&) = default;
  IHttpClient& operator=(IHttpClient&&) = default;
};

// libcurl implementation. One easy handle, reused across requests.
// Fixed connect/transfer timeout; no retry.
class CurlHttpClient final : public IHttpClient {
 public:
  // Throws std::runtime_error when libcurl cannot create a handle.
  explicit CurlHttpClient(long timeout_ms = 30000);
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient&) = delete;
  CurlHttpClient& operator=(const CurlHttpClient&) = delete;
  CurlHttpClient(CurlHttpClient&&) = delete;
  CurlHttpClient& operator=(CurlHttpClient&&) = delete;

  [[nodiscard]] core::Result<HttpResponse, core::BackendError> post(
      const std::string& url, const std::string& body,
      const std::vector<std::string>& headers) override;

 private:
  void* handle_;  // CURL*; kept opaque so curl.h stays out of the public headers
  long timeout_ms_;
};

}  // namespace devflow::tracker
