#include "clonekit/http.hpp"

#include "clonekit/error.hpp"

#include <curl/curl.h>
#include <mutex>
#include <stdexcept>

namespace clonekit::http {

namespace {

struct EasyDeleter {
  void operator()(CURL *h) const noexcept { curl_easy_cleanup(h); }
};
struct SlistDeleter {
  void operator()(curl_slist *l) const noexcept { curl_slist_free_all(l); }
};
using EasyHandle = std::unique_ptr<CURL, EasyDeleter>;
using HeaderList = std::unique_ptr<curl_slist, SlistDeleter>;

void global_init_once() {
  static std::once_flag once;
  std::call_once(once, [] {
    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
      throw std::runtime_error("curl_global_init failed");
    }
  });
}

std::size_t append_body(char *ptr, std::size_t size, std::size_t nmemb, void *userdata) {
  auto *out = static_cast<std::vector<std::uint8_t> *>(userdata);
  const std::size_t n = size * nmemb;
  out->insert(out->end(), reinterpret_cast<const std::uint8_t *>(ptr),
              reinterpret_cast<const std::uint8_t *>(ptr) + n);
  return n;
}

void check(CURLcode rc, std::string_view what) {
  if (rc != CURLE_OK) {
    throw Error(ErrorKind::TransportError,
                std::string(what) + ": " + curl_easy_strerror(rc));
  }
}

} // namespace

struct CurlClient::Impl {
  Options options;
  EasyHandle handle;

  // Reset the handle to our defaults before each request.
  void prepare(const std::string &url, std::vector<std::uint8_t> &sink) {
    CURL *h = handle.get();
    curl_easy_reset(h);
    check(curl_easy_setopt(h, CURLOPT_URL, url.c_str()), "CURLOPT_URL");
    check(curl_easy_setopt(h, CURLOPT_USERAGENT, options.user_agent.c_str()),
          "CURLOPT_USERAGENT");
    check(curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, options.follow_redirects ? 1L : 0L),
          "CURLOPT_FOLLOWLOCATION");
    if (options.connect_timeout_seconds > 0) {
      check(curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, options.connect_timeout_seconds),
            "CURLOPT_CONNECTTIMEOUT");
    }
    check(curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, append_body), "CURLOPT_WRITEFUNCTION");
    check(curl_easy_setopt(h, CURLOPT_WRITEDATA, static_cast<void *>(&sink)),
          "CURLOPT_WRITEDATA");
  }

  void perform(const std::string &url) {
    CURL *h = handle.get();
    check(curl_easy_perform(h), "request to " + url);
    long status = 0;
    check(curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status), "CURLINFO_RESPONSE_CODE");
    if (status < 200 || status >= 300) {
      throw Error(ErrorKind::TransportError,
                  "HTTP " + std::to_string(status) + " from " + url);
    }
  }
};

CurlClient::CurlClient(Options options) : impl_(std::make_unique<Impl>()) {
  global_init_once();
  impl_->options = std::move(options);
  impl_->handle.reset(curl_easy_init());
  if (!impl_->handle) {
    throw Error(ErrorKind::TransportError, "curl_easy_init failed");
  }
}

CurlClient::~CurlClient() = default;

auto CurlClient::get(const std::string &url) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> body;
  impl_->prepare(url, body);
  check(curl_easy_setopt(impl_->handle.get(), CURLOPT_HTTPGET, 1L), "CURLOPT_HTTPGET");
  impl_->perform(url);
  return body;
}

auto CurlClient::post(const std::string &url, std::string_view content_type,
                      std::span<const std::uint8_t> request) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> body;
  impl_->prepare(url, body);

  CURL *h = impl_->handle.get();
  const std::string type_header = "Content-Type: " + std::string(content_type);
  HeaderList headers{curl_slist_append(nullptr, type_header.c_str())};
  if (!headers) {
    throw Error(ErrorKind::TransportError, "curl_slist_append failed");
  }
  check(curl_easy_setopt(h, CURLOPT_POST, 1L), "CURLOPT_POST");
  check(curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.data()), "CURLOPT_POSTFIELDS");
  check(curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                         static_cast<curl_off_t>(request.size())),
        "CURLOPT_POSTFIELDSIZE_LARGE");
  check(curl_easy_setopt(h, CURLOPT_HTTPHEADER, headers.get()), "CURLOPT_HTTPHEADER");
  impl_->perform(url);
  return body;
}

} // namespace clonekit::http
