#include "forkyard/naming/http_client.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace forkyard::naming {

namespace {

struct EasyDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

struct SlistDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

size_t append_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  static_cast<std::string *>(userdata)->append(ptr, total);
  return total;
}

HeaderList build_headers(const HttpHeaders &headers) {
  HeaderList list;
  const auto append = [&list](const std::string &line) {
    // curl_slist_append returns the list head, or null when allocation fails.
    if (curl_slist *head = curl_slist_append(list.get(), line.c_str()); head != nullptr) {
      (void)list.release();
      list.reset(head);
    }
  };
  append("content-type: application/json");
  for (const auto &[key, value] : headers) {
    append(key + ": " + value);
  }
  return list;
}

} // namespace

CurlHttpClient::CurlHttpClient() {
  // Global init is not thread-safe and must run once per process.
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpReply CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                    const std::string &body, const std::uint64_t timeout_ms) {
  HttpReply reply;
  EasyHandle curl(curl_easy_init());
  if (curl == nullptr) {
    reply.transport_error = "curl_easy_init failed";
    return reply;
  }
  const HeaderList header_list = build_headers(headers);

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "forkyard/0.1");
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &reply.body);

  if (const CURLcode code = curl_easy_perform(curl.get()); code != CURLE_OK) {
    reply.transport_error = curl_easy_strerror(code);
    reply.timed_out = code == CURLE_OPERATION_TIMEDOUT;
    return reply;
  }
  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  reply.status = static_cast<std::uint16_t>(status);
  return reply;
}

} // namespace forkyard::naming
