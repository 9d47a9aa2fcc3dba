#pragma once

#include <chrono>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lyricflow::net {

class ProviderError : public std::runtime_error {
public:
    explicit ProviderError(const std::string& msg) : std::runtime_error(msg) {}
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::string content_type;

    bool ok() const { return status >= 200 && status < 300; }
    bool not_found() const { return status == 404; }
};

using HttpHeaders = std::map<std::string, std::string>;
using QueryParams = std::vector<std::pair<std::string, std::string>>;

// Single GET capability the providers need. Implementations throw ProviderError
// when no usable response arrives (transport failure, timeout, non-2xx other than 404).
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const std::string& url, const HttpHeaders& headers = {}) = 0;
};

struct HttpOptions {
    std::chrono::seconds timeout{30};
    std::chrono::seconds connect_timeout{10};
    int max_retries = 2;                                 // Attempts after the first
    std::chrono::milliseconds initial_backoff{500};      // Doubles per retry
    std::string user_agent = "lyricflow/1.0";
};

/**
 * libcurl-backed transport. One easy handle per request, so a single client is
 * shared by all worker threads. Retries transport errors, 429 and 5xx with
 * exponential backoff; other statuses are returned or thrown immediately.
 */
class CurlHttpClient : public HttpTransport {
public:
    explicit CurlHttpClient(HttpOptions options = {});
    ~CurlHttpClient() override;

    CurlHttpClient(const CurlHttpClient&) = delete;
    CurlHttpClient& operator=(const CurlHttpClient&) = delete;

    HttpResponse get(const std::string& url, const HttpHeaders& headers = {}) override;

private:
    // One attempt. Throws ProviderError on transport failure.
    HttpResponse perform(const std::string& url, const HttpHeaders& headers);

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);

    HttpOptions options_;
};

// Percent-encodes a query value
std::string url_encode(const std::string& value);

// base + "?" + k=v&... ; empty params yield base unchanged
std::string build_url(const std::string& base, const QueryParams& params);

}  // namespace lyricflow::net
