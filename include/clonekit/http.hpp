#pragma once
#include "clonekit/consts.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace clonekit::http {

// The two round trips of a smart-HTTP clone. Implementations return the
// response body of a 2xx reply and throw Error{TransportError} otherwise.
class Client {
public:
  Client() = default;
  Client(const Client &) = delete;
  auto operator=(const Client &) -> Client & = delete;
  virtual ~Client() = default;

  virtual auto get(const std::string &url) -> std::vector<std::uint8_t> = 0;
  virtual auto post(const std::string &url, std::string_view content_type,
                    std::span<const std::uint8_t> body) -> std::vector<std::uint8_t> = 0;
};

struct Options {
  std::string user_agent{consts::kDefaultUserAgent};
  long connect_timeout_seconds = 30; // 0 = libcurl default
  bool follow_redirects = true;
};

// libcurl-backed client; one easy handle reused for both requests.
class CurlClient final : public Client {
public:
  explicit CurlClient(Options options = {});
  ~CurlClient() override;

  auto get(const std::string &url) -> std::vector<std::uint8_t> override;
  auto post(const std::string &url, std::string_view content_type,
            std::span<const std::uint8_t> body) -> std::vector<std::uint8_t> override;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace clonekit::http
