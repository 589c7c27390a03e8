#include "devflow/tracker/http_client.h"

#include <curl/curl.h>

#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace devflow::tracker {

namespace {

// RAII wrapper for a curl header list.
struct CurlSlist {
  curl_slist* list = nullptr;
  CurlSlist() = default;
  ~CurlSlist() { curl_slist_free_all(list); }
  CurlSlist(const CurlSlist&) = delete;
  CurlSlist& operator=(const CurlSlist&) = delete;

  void append(const std::string& header) { list = curl_slist_append(list, header.c_str()); }
  [[nodiscard]] curl_slist* get() const { return list; }
};

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
  const size_t total = size * nmemb;
  static_cast<std::string*>(userp)->append(static_cast<const char*>(contents), total);
  return total;
}

std::string format_curl_error(const std::string& url, CURLcode code, const char* errbuf) {
  std::ostringstream oss;
  oss << "curl POST " << url << " failed: " << curl_easy_strerror(code);
  if (errbuf != nullptr && errbuf[0] != '\0') {
    oss << " - " << errbuf;
  }
  return oss.str();
}

}  // namespace

CurlHttpClient::CurlHttpClient(const long timeout_ms) : handle_(nullptr), timeout_ms_(timeout_ms) {
  static std::once_flag flag;
  std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
  handle_ = curl_easy_init();
  if (handle_ == nullptr) {
    throw std::runtime_error("Failed to initialize curl");
  }
}

CurlHttpClient::~CurlHttpClient() { curl_easy_cleanup(static_cast<CURL*>(handle_)); }

core::Result<HttpResponse, core::BackendError> CurlHttpClient::post(
    const std::string& url, const std::string& body, const std::vector<std::string>& headers) {
  using PostResult = core::Result<HttpResponse, core::BackendError>;

  CURL* curl = static_cast<CURL*>(handle_);
  curl_easy_reset(curl);

  std::string response;
  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';

  CurlSlist header_list;
  for (const auto& header : headers) {
    header_list.append(header);
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms_);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "devflow");

  const CURLcode res = curl_easy_perform(curl);
  if (res != CURLE_OK) {
    return PostResult::err(core::BackendError{format_curl_error(url, res, errbuf)});
  }

  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  return PostResult::ok(HttpResponse{status, std::move(response)});
}

}  // namespace devflow::tracker
