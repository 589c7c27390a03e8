#pragma once

#include "devflow/core/result.h"
#include "devflow/tracker/http_client.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace devflow::tracker {

// GraphQLClient posts {"query", "variables"} to one endpoint and unwraps "data".
// Every failure mode becomes a BackendError:
// - transport failure: the curl message
// - non-2xx status: "HTTP <status>: <message or body>"
// - GraphQL "errors": "GraphQL Error: <message>[; <message>...]"
// - a body that is not JSON, or has no "data" object
class GraphQLClient {
 public:
  // authorization is the full Authorization header value ("Bearer ...", or a
  // bare Linear API key).
  GraphQLClient(IHttpClient& http, std::string endpoint, std::string authorization);

  [[nodiscard]] core::Result<nlohmann::json, core::BackendError> execute(
      const std::string& query, const nlohmann::json& variables = nlohmann::json::object());

  [[nodiscard]] const std::string& endpoint() const { return endpoint_; }

 private:
  IHttpClient& http_;
  std::string endpoint_;
  std::vector<std::string> headers_;
};

// Null-tolerant accessors for GraphQL payloads, where absent and null fields
// are common. Missing or mistyped values read as "", {} and [] respectively.
[[nodiscard]] std::string json_string(const nlohmann::json& j, const char* key);
[[nodiscard]] const nlohmann::json& json_object(const nlohmann::json& j, const char* key);
// j[key]["nodes"], the shape of every GraphQL connection.
[[nodiscard]] const nlohmann::json& json_nodes(const nlohmann::json& j, const char* key);

}  // namespace devflow::tracker
