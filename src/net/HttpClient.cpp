#include "net/HttpClient.hpp"
#include "util/Logger.hpp"
#include <curl/curl.h>
#include <memory>
#include <thread>

namespace lyricflow::net {

// curl_global_init is not thread-safe; run it once before any worker exists
struct CurlInitializer {
    CurlInitializer() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlInitializer() { curl_global_cleanup(); }
};
static CurlInitializer g_curl_init;

namespace {
    constexpr size_t MAX_RESPONSE_BYTES = 32 * 1024 * 1024;

    struct CurlHandleDeleter {
        void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
    };
    struct CurlListDeleter {
        void operator()(curl_slist* list) const { curl_slist_free_all(list); }
    };

    bool is_retryable_status(long status) {
        return status == 429 || (status >= 500 && status < 600);
    }
}

CurlHttpClient::CurlHttpClient(HttpOptions options)
    : options_(std::move(options)) {}

CurlHttpClient::~CurlHttpClient() = default;

size_t CurlHttpClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* data = static_cast<std::string*>(userp);
    size_t total_size = size * nmemb;
    if (data->size() + total_size > MAX_RESPONSE_BYTES) {
        return 0;  // Aborts the transfer with CURLE_WRITE_ERROR
    }
    data->append(static_cast<const char*>(contents), total_size);
    return total_size;
}

HttpResponse CurlHttpClient::perform(const std::string& url, const HttpHeaders& headers) {
    std::unique_ptr<CURL, CurlHandleDeleter> curl(curl_easy_init());
    if (!curl) {
        throw ProviderError("curl_easy_init failed");
    }

    std::unique_ptr<curl_slist, CurlListDeleter> header_list;
    for (const auto& [name, value] : headers) {
        curl_slist* appended = curl_slist_append(header_list.get(), (name + ": " + value).c_str());
        if (!appended) {
            throw ProviderError("curl_slist_append failed");
        }
        header_list.release();
        header_list.reset(appended);
    }

    HttpResponse response;
    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);  // Required for timeouts in worker threads
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.timeout).count()));
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(options_.connect_timeout).count()));
    curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);
    if (header_list) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list.get());
    }

    CURLcode res = curl_easy_perform(handle);
    if (res != CURLE_OK) {
        throw ProviderError(std::string("HTTP request failed: ") + curl_easy_strerror(res));
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);
    char* content_type = nullptr;
    if (curl_easy_getinfo(handle, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type = content_type;
    }
    return response;
}

HttpResponse CurlHttpClient::get(const std::string& url, const HttpHeaders& headers) {
    auto backoff = options_.initial_backoff;
    std::string last_error;

    for (int attempt = 0; attempt <= options_.max_retries; ++attempt) {
        if (attempt > 0) {
            util::Logger::debug("HttpClient: Retry " + std::to_string(attempt) + " for " + url +
                                " in " + std::to_string(backoff.count()) + "ms");
            std::this_thread::sleep_for(backoff);
            backoff *= 2;
        }

        try {
            HttpResponse response = perform(url, headers);
            if (response.ok() || response.not_found()) {
                return response;
            }
            last_error = "HTTP " + std::to_string(response.status) + " from " + url;
            if (!is_retryable_status(response.status)) {
                break;
            }
        } catch (const ProviderError& e) {
            last_error = e.what();
        }
        util::Logger::warn("HttpClient: " + last_error);
    }

    throw ProviderError(last_error);
}

std::string url_encode(const std::string& value) {
    char* escaped = curl_easy_escape(nullptr, value.c_str(), static_cast<int>(value.size()));
    if (!escaped) {
        throw ProviderError("curl_easy_escape failed");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

std::string build_url(const std::string& base, const QueryParams& params) {
    if (params.empty()) {
        return base;
    }
    std::string url = base;
    url += (base.find('?') == std::string::npos) ? '?' : '&';
    bool first = true;
    for (const auto& [key, value] : params) {
        if (!first) url += '&';
        url += url_encode(key) + "=" + url_encode(value);
        first = false;
    }
    return url;
}

}  // namespace lyricflow::net
