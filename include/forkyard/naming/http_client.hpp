#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace forkyard::naming {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpReply {
  std::uint16_t status = 0;
  std::string body;
  /// Set when no HTTP status was received.
  std::optional<std::string> transport_error;
  bool timed_out = false;

  [[nodiscard]] bool succeeded() const {
    return !transport_error.has_value() && status >= 200 && status < 300;
  }
};

/// JSON POST transport used by the name suggester.
class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpReply post_json(const std::string &url, const HttpHeaders &headers,
                                            const std::string &body,
                                            std::uint64_t timeout_ms) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();

  [[nodiscard]] HttpReply post_json(const std::string &url, const HttpHeaders &headers,
                                    const std::string &body, std::uint64_t timeout_ms) override;
};

} // namespace forkyard::naming
