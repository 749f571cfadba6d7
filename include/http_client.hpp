#pragma once

#include "context.hpp"
#include <expected>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace credscan {

enum class HttpError {
    NetworkError,
    InvalidUrl,
    HttpStatusError,
    Timeout,
    ConnectionFailed,
    HostNotFound,
    Cancelled,
    ProtocolError
};

struct HttpErrorInfo {
    HttpError error;
    std::string message;
    int status_code = 0;
};

using HttpHeaders = std::map<std::string, std::string>;

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;  // names lower-cased
    std::string body;

    std::string header(std::string_view name) const;
};

struct HttpConfig {
    long timeout_seconds = 10;
    long connect_timeout_seconds = 5;
    std::string user_agent = "credscan/1.0";
    size_t max_body_size = 1024 * 1024;
    bool enable_http2 = true;
    bool follow_redirects = false;
    bool enable_tcp_keepalive = true;
};

// Blocking HTTP client used by detectors for verification. One instance is
// shared by all detectors; each request uses its own curl handle, so calls
// from several threads are safe. Non-2xx statuses are returned as responses,
// not errors, since detectors interpret them.
class HttpClient {
public:
    HttpClient();
    explicit HttpClient(HttpConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpClient(HttpClient&&) noexcept;
    HttpClient& operator=(HttpClient&&) noexcept;

    std::expected<HttpResponse, HttpErrorInfo> get(const Context& ctx, std::string_view url,
                                                   const HttpHeaders& headers = {}) const;

    std::expected<HttpResponse, HttpErrorInfo> post(const Context& ctx, std::string_view url, std::string_view body,
                                                    const HttpHeaders& headers = {}) const;

    const HttpConfig& config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl_;
};

} // namespace credscan
