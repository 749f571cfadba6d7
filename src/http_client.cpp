#include "http_client.hpp"
#include "encoding.hpp"
#include "log.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <format>
#include <mutex>

namespace credscan {

namespace {

struct TransferState {
    const Context* ctx;
    std::string body;
    HttpResponse* response;
    size_t max_body_size;
    bool truncated = false;
};

size_t write_string_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* state = static_cast<TransferState*>(userp);
    if (state->body.size() + realsize > state->max_body_size) {
        state->truncated = true;
        return 0;
    }
    state->body.append(static_cast<char*>(contents), realsize);
    return realsize;
}

size_t header_callback(char* contents, size_t size, size_t nmemb, void* userp) {
    size_t realsize = size * nmemb;
    auto* state = static_cast<TransferState*>(userp);
    std::string_view line(contents, realsize);
    if (auto colon = line.find(':'); colon != std::string_view::npos) {
        auto key = to_lower_ascii(line.substr(0, colon));
        std::string value(line.substr(colon + 1));
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        state->response->headers[key] = value;
    }
    return realsize;
}

// Aborts the transfer once the caller's context is cancelled or past its deadline.
int xferinfo_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* state = static_cast<TransferState*>(clientp);
    return state->ctx->done() ? 1 : 0;
}

void set_http_version(CURL* curl, const HttpConfig& config, std::string_view url) {
    if (config.enable_http2 && url.starts_with("https://")) {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_2TLS);
    } else {
        curl_easy_setopt(curl, CURLOPT_HTTP_VERSION, CURL_HTTP_VERSION_1_1);
    }
}

HttpErrorInfo context_error(const Context& ctx) {
    if (ctx.cancelled()) return HttpErrorInfo{HttpError::Cancelled, "request cancelled"};
    return HttpErrorInfo{HttpError::Timeout, "deadline exceeded"};
}

HttpErrorInfo map_curl_error(CURLcode res, const Context& ctx, const TransferState& state) {
    switch (res) {
        case CURLE_ABORTED_BY_CALLBACK:
            return context_error(ctx);
        case CURLE_OPERATION_TIMEDOUT:
            return HttpErrorInfo{HttpError::Timeout, curl_easy_strerror(res)};
        case CURLE_COULDNT_RESOLVE_HOST:
            return HttpErrorInfo{HttpError::HostNotFound, curl_easy_strerror(res)};
        case CURLE_COULDNT_CONNECT:
            return HttpErrorInfo{HttpError::ConnectionFailed, curl_easy_strerror(res)};
        case CURLE_URL_MALFORMAT:
        case CURLE_UNSUPPORTED_PROTOCOL:
            return HttpErrorInfo{HttpError::InvalidUrl, curl_easy_strerror(res)};
        case CURLE_WRITE_ERROR:
            if (state.truncated) return HttpErrorInfo{HttpError::ProtocolError, "response body too large"};
            return HttpErrorInfo{HttpError::NetworkError, curl_easy_strerror(res)};
        default:
            return HttpErrorInfo{HttpError::NetworkError, curl_easy_strerror(res)};
    }
}

void global_init() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_ALL); });
}

} // namespace

std::string HttpResponse::header(std::string_view name) const {
    auto it = headers.find(to_lower_ascii(name));
    return it == headers.end() ? std::string{} : it->second;
}

class HttpClient::Impl {
public:
    HttpConfig config;

    explicit Impl(HttpConfig c) : config(std::move(c)) { global_init(); }

    std::expected<HttpResponse, HttpErrorInfo> perform(const Context& ctx, std::string_view url_sv,
                                                       const std::string* post_body,
                                                       const HttpHeaders& headers) const {
        if (ctx.done()) return std::unexpected(context_error(ctx));

        std::string url(url_sv);
        std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
        if (!curl) return std::unexpected(HttpErrorInfo{HttpError::NetworkError, "Failed to init CURL"});

        struct curl_slist* raw_list = nullptr;
        for (const auto& [k, v] : headers) {
            std::string h = k;
            h += ": ";
            h += v;
            raw_list = curl_slist_append(raw_list, h.c_str());
        }
        std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_list(raw_list, curl_slist_free_all);

        HttpResponse response;
        TransferState state{&ctx, {}, &response, config.max_body_size};

        long timeout_ms = config.timeout_seconds * 1000;
        if (auto left = ctx.remaining()) timeout_ms = std::min<long>(timeout_ms, std::max<long>(1, static_cast<long>(left->count())));

        CURL* h = curl.get();
        curl_easy_setopt(h, CURLOPT_URL, url.c_str());
        curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(h, CURLOPT_USERAGENT, config.user_agent.c_str());
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, config.follow_redirects ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, timeout_ms);
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, config.connect_timeout_seconds);
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        curl_easy_setopt(h, CURLOPT_TCP_KEEPALIVE, config.enable_tcp_keepalive ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_string_callback);
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
        curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
        curl_easy_setopt(h, CURLOPT_XFERINFODATA, &state);
        curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);
        if (post_body) {
            curl_easy_setopt(h, CURLOPT_POSTFIELDS, post_body->c_str());
            curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE, static_cast<long>(post_body->size()));
        }
        set_http_version(h, config, url);

        CURLcode res = curl_easy_perform(h);
        if (res != CURLE_OK) {
            auto err = map_curl_error(res, ctx, state);
            log::debug(3, "http request failed: {}", err.message);
            return std::unexpected(std::move(err));
        }

        long http_code = 0;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &http_code);
        response.status_code = static_cast<int>(http_code);
        response.body = std::move(state.body);
        return response;
    }
};

HttpClient::HttpClient() : pImpl_(std::make_unique<Impl>(HttpConfig{})) {}
HttpClient::HttpClient(HttpConfig config) : pImpl_(std::make_unique<Impl>(std::move(config))) {}
HttpClient::~HttpClient() = default;
HttpClient::HttpClient(HttpClient&&) noexcept = default;
HttpClient& HttpClient::operator=(HttpClient&&) noexcept = default;

const HttpConfig& HttpClient::config() const { return pImpl_->config; }

std::expected<HttpResponse, HttpErrorInfo> HttpClient::get(const Context& ctx, std::string_view url,
                                                           const HttpHeaders& headers) const {
    return pImpl_->perform(ctx, url, nullptr, headers);
}

std::expected<HttpResponse, HttpErrorInfo> HttpClient::post(const Context& ctx, std::string_view url,
                                                            std::string_view body, const HttpHeaders& headers) const {
    std::string owned(body);
    auto with_type = headers;
    with_type.try_emplace("Content-Type", "application/json");
    return pImpl_->perform(ctx, url, &owned, with_type);
}

} // namespace credscan
