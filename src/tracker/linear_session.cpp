#include "devflow/tracker/linear_session.h"

namespace devflow::tracker {

std::string_view linear_auth_method_to_string(const LinearAuthMethod method) {
  switch (method) {
    case LinearAuthMethod::kOAuthToken:
      return "oauth_token";
    case LinearAuthMethod::kApiKey:
      return "api_key";
  }
  return "unknown";
}

std::string LinearCredentials::authorization() const {
  if (method == LinearAuthMethod::kOAuthToken) {
    return "Bearer " + token;
  }
  return token;
}

core::Result<LinearCredentials, std::string> resolve_linear_credentials(
    const core::EnvLookup& env) {
  using CredentialsResult = core::Result<LinearCredentials, std::string>;

  if (auto token = env("LINEAR_OAUTH_ACCESS_TOKEN"); token.has_value()) {
    return CredentialsResult::ok(LinearCredentials{LinearAuthMethod::kOAuthToken, token.value()});
  }
  if (auto key = env("LINEAR_API_KEY"); key.has_value()) {
    return CredentialsResult::ok(LinearCredentials{LinearAuthMethod::kApiKey, key.value()});
  }

  if (env("LINEAR_OAUTH_CLIENT_ID").has_value() && env("LINEAR_OAUTH_CLIENT_SECRET").has_value()) {
    return CredentialsResult::err(
        "Error: LINEAR_OAUTH_CLIENT_ID/LINEAR_OAUTH_CLIENT_SECRET are set, but the client "
        "credentials exchange is not supported.\n"
        "       Exchange them for a token and set LINEAR_OAUTH_ACCESS_TOKEN, or set LINEAR_API_KEY.");
  }

  return CredentialsResult::err(
      "Error: No Linear authentication configured.\n"
      "       Set one of the following:\n"
      "         LINEAR_OAUTH_ACCESS_TOKEN - Pre-generated OAuth token\n"
      "         LINEAR_API_KEY            - Personal API key (lin_api_*)");
}

}  // namespace devflow::tracker
