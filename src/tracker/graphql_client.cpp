#include "devflow/tracker/graphql_client.h"

#include <utility>

namespace devflow::tracker {

using json = nlohmann::json;
using GraphQLResult = core::Result<json, core::BackendError>;

GraphQLClient::GraphQLClient(IHttpClient& http, std::string endpoint, std::string authorization)
    : http_(http),
      endpoint_(std::move(endpoint)),
      headers_{"Content-Type: application/json", "Accept: application/json",
               "Authorization: " + std::move(authorization)} {}

GraphQLResult GraphQLClient::execute(const std::string& query, const json& variables) {
  json payload = {{"query", query}};
  if (!variables.empty()) {
    payload["variables"] = variables;
  }

  auto response = http_.post(endpoint_, payload.dump(), headers_);
  if (!response.has_value()) {
    return GraphQLResult::err(response.error());
  }
  const HttpResponse& http = response.value();

  const json body = json::parse(http.body, nullptr, false);

  if (http.status < 200 || http.status >= 300) {
    std::string detail = http.body;
    if (body.is_object() && body.contains("message") && body["message"].is_string()) {
      detail = body["message"].get<std::string>();
    }
    return GraphQLResult::err(
        core::BackendError{"HTTP " + std::to_string(http.status) + ": " + detail});
  }

  if (body.is_discarded() || !body.is_object()) {
    return GraphQLResult::err(core::BackendError{"Invalid JSON response from " + endpoint_});
  }

  if (body.contains("errors") && body["errors"].is_array() && !body["errors"].empty()) {
    std::string message = "GraphQL Error: ";
    bool first = true;
    for (const auto& error : body["errors"]) {
      if (!first) {
        message += "; ";
      }
      first = false;
      if (error.is_object() && error.contains("message") && error["message"].is_string()) {
        message += error["message"].get<std::string>();
      } else {
        message += error.dump();
      }
    }
    return GraphQLResult::err(core::BackendError{message});
  }

  if (!body.contains("data") || !body["data"].is_object()) {
    return GraphQLResult::err(core::BackendError{"GraphQL response has no data"});
  }
  return GraphQLResult::ok(body["data"]);
}

std::string json_string(const json& j, const char* key) {
  if (j.is_object() && j.contains(key) && j[key].is_string()) {
    return j[key].get<std::string>();
  }
  return "";
}

const json& json_object(const json& j, const char* key) {
  static const json kEmpty = json::object();
  if (j.is_object() && j.contains(key) && j[key].is_object()) {
    return j[key];
  }
  return kEmpty;
}

const json& json_nodes(const json& j, const char* key) {
  static const json kEmpty = json::array();
  const json& connection = json_object(j, key);
  if (connection.contains("nodes") && connection["nodes"].is_array()) {
    return connection["nodes"];
  }
  return kEmpty;
}

}  // namespace devflow::tracker
