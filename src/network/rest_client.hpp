#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <unordered_map>

#include <curl/curl.h>

namespace etfarb {

struct HttpResponse {
    long status_code = 0;
    std::string body;
    std::map<std::string, std::string> headers;
    long response_time_ms = 0;

    bool IsSuccess() const { return status_code >= 200 && status_code < 300; }
    bool IsServerError() const { return status_code >= 500; }
};

struct HttpRequest {
    std::string url;
    std::string method = "GET";
    std::unordered_map<std::string, std::string> headers;
    std::string body;
    long timeout_ms = 2000;
};

// Blocking libcurl client. Every request is bounded by a total timeout;
// transport failures throw TimeoutException or ConnectionException, while
// any HTTP status (including 4xx/5xx) is returned to the caller.
class RestClient {
public:
    RestClient();
    ~RestClient();

    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    // Process-wide libcurl setup; call once from main before any request.
    static bool GlobalInit();
    static void GlobalCleanup();

    void SetBaseUrl(const std::string& base_url);
    void SetDefaultTimeout(long timeout_ms);
    void SetConnectTimeout(long timeout_ms);
    void SetUserAgent(const std::string& user_agent);
    void AddHeader(const std::string& key, const std::string& value);

    HttpResponse Get(const std::string& endpoint,
                     const std::map<std::string, std::string>& params = {});
    HttpResponse Post(const std::string& endpoint,
                      const std::map<std::string, std::string>& params = {},
                      const std::string& body = "");

    HttpResponse Request(const HttpRequest& request);

    std::string BuildUrl(const std::string& endpoint,
                         const std::map<std::string, std::string>& params = {}) const;

    long long GetTotalRequests() const;
    long long GetFailedRequests() const;
    double GetAverageResponseTime() const;

private:
    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* data);
    static size_t HeaderCallback(char* buffer, size_t size, size_t nitems,
                                 std::map<std::string, std::string>* headers);

    static std::string UrlEncode(const std::string& value);
    void UpdateStatistics(long response_time_ms);

    CURL* curl_handle_;
    std::mutex curl_mutex_;

    std::string base_url_;
    std::string user_agent_;
    long default_timeout_ms_;
    long connect_timeout_ms_;
    std::unordered_map<std::string, std::string> headers_;

    std::atomic<long long> total_requests_;
    std::atomic<long long> failed_requests_;
    mutable std::mutex stats_mutex_;
    double average_response_time_ms_;
};

} // namespace etfarb
