#include "rest_client.hpp"
#include "network_exception.hpp"
#include "../utils/logger.hpp"

#include <cctype>
#include <chrono>
#include <memory>

namespace etfarb {

namespace {
struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;
}

RestClient::RestClient()
    : curl_handle_(curl_easy_init())
    , user_agent_("etfarb/1.0")
    , default_timeout_ms_(2000)
    , connect_timeout_ms_(1000)
    , total_requests_(0)
    , failed_requests_(0)
    , average_response_time_ms_(0.0) {
    if (!curl_handle_) {
        throw ConnectionException("failed to initialize CURL handle");
    }
}

RestClient::~RestClient() {
    if (curl_handle_) {
        curl_easy_cleanup(curl_handle_);
    }
}

bool RestClient::GlobalInit() {
    CURLcode result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (result != CURLE_OK) {
        ETFARB_LOG_ERROR("Failed to initialize libcurl: {}", curl_easy_strerror(result));
        return false;
    }
    return true;
}

void RestClient::GlobalCleanup() {
    curl_global_cleanup();
}

void RestClient::SetBaseUrl(const std::string& base_url) {
    base_url_ = base_url;
    if (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

void RestClient::SetDefaultTimeout(long timeout_ms) {
    default_timeout_ms_ = timeout_ms;
}

void RestClient::SetConnectTimeout(long timeout_ms) {
    connect_timeout_ms_ = timeout_ms;
}

void RestClient::SetUserAgent(const std::string& user_agent) {
    user_agent_ = user_agent;
}

void RestClient::AddHeader(const std::string& key, const std::string& value) {
    headers_[key] = value;
}

HttpResponse RestClient::Get(const std::string& endpoint,
                             const std::map<std::string, std::string>& params) {
    HttpRequest request;
    request.url = BuildUrl(endpoint, params);
    request.method = "GET";
    request.headers = headers_;
    request.timeout_ms = default_timeout_ms_;
    return Request(request);
}

HttpResponse RestClient::Post(const std::string& endpoint,
                              const std::map<std::string, std::string>& params,
                              const std::string& body) {
    HttpRequest request;
    request.url = BuildUrl(endpoint, params);
    request.method = "POST";
    request.body = body;
    request.headers = headers_;
    request.timeout_ms = default_timeout_ms_;
    return Request(request);
}

HttpResponse RestClient::Request(const HttpRequest& request) {
    std::lock_guard<std::mutex> lock(curl_mutex_);
    auto start_time = std::chrono::steady_clock::now();
    total_requests_.fetch_add(1);

    HttpResponse response;
    curl_easy_reset(curl_handle_);

    curl_easy_setopt(curl_handle_, CURLOPT_URL, request.url.c_str());
    if (request.method == "POST") {
        curl_easy_setopt(curl_handle_, CURLOPT_POST, 1L);
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    }

    curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, RestClient::WriteCallback);
    curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl_handle_, CURLOPT_HEADERFUNCTION, RestClient::HeaderCallback);
    curl_easy_setopt(curl_handle_, CURLOPT_HEADERDATA, &response.headers);

    curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl_handle_, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms_);
    curl_easy_setopt(curl_handle_, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl_handle_, CURLOPT_USERAGENT, user_agent_.c_str());

    CurlHeaderList header_list;
    for (const auto& header : request.headers) {
        std::string header_str = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(header_list.get(), header_str.c_str());
        if (!appended) {
            throw ConnectionException("failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, header_list.get());
    }

    CURLcode result = curl_easy_perform(curl_handle_);

    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    response.response_time_ms = static_cast<long>(duration.count());
    UpdateStatistics(response.response_time_ms);

    if (result != CURLE_OK) {
        failed_requests_.fetch_add(1);
        std::string error_message = curl_easy_strerror(result);
        ETFARB_LOG_DEBUG("CURL request failed: {} {} ({})", request.method, request.url, error_message);
        if (result == CURLE_OPERATION_TIMEDOUT) {
            throw TimeoutException(request.method + " " + request.url + ": " + error_message);
        }
        throw ConnectionException(request.method + " " + request.url + ": " + error_message);
    }

    long response_code = 0;
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = response_code;

    if (response_code >= 400) {
        failed_requests_.fetch_add(1);
        ETFARB_LOG_DEBUG("HTTP error {}: {}", response_code, request.url);
    }
    ETFARB_LOG_TRACE("HTTP {} {} -> {} ({} bytes, {} ms)", request.method, request.url,
                     response_code, response.body.length(), response.response_time_ms);
    return response;
}

std::string RestClient::BuildUrl(const std::string& endpoint,
                                 const std::map<std::string, std::string>& params) const {
    std::string url = base_url_;
    if (!endpoint.empty()) {
        if (endpoint[0] != '/') {
            url += "/";
        }
        url += endpoint;
    }

    if (!params.empty()) {
        url += "?";
        bool first = true;
        for (const auto& pair : params) {
            if (!first) {
                url += "&";
            }
            url += UrlEncode(pair.first) + "=" + UrlEncode(pair.second);
            first = false;
        }
    }
    return url;
}

std::string RestClient::UrlEncode(const std::string& value) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string encoded;
    encoded.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += kHex[c >> 4];
            encoded += kHex[c & 0x0F];
        }
    }
    return encoded;
}

void RestClient::UpdateStatistics(long response_time_ms) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    if (total_requests_.load() == 1) {
        average_response_time_ms_ = static_cast<double>(response_time_ms);
    } else {
        const double alpha = 0.1;
        average_response_time_ms_ = alpha * response_time_ms + (1.0 - alpha) * average_response_time_ms_;
    }
}

long long RestClient::GetTotalRequests() const {
    return total_requests_.load();
}

long long RestClient::GetFailedRequests() const {
    return failed_requests_.load();
}

double RestClient::GetAverageResponseTime() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return average_response_time_ms_;
}

size_t RestClient::WriteCallback(void* contents, size_t size, size_t nmemb, std::string* data) {
    size_t total_size = size * nmemb;
    data->append(static_cast<char*>(contents), total_size);
    return total_size;
}

size_t RestClient::HeaderCallback(char* buffer, size_t size, size_t nitems,
                                  std::map<std::string, std::string>* headers) {
    size_t total_size = size * nitems;
    std::string header(buffer, total_size);

    size_t pos = header.find(':');
    if (pos != std::string::npos) {
        std::string key = header.substr(0, pos);
        std::string value = header.substr(pos + 1);
        key.erase(0, key.find_first_not_of(" \t"));
        key.erase(key.find_last_not_of(" \t\r\n") + 1);
        value.erase(0, value.find_first_not_of(" \t"));
        value.erase(value.find_last_not_of(" \t\r\n") + 1);
        (*headers)[key] = value;
    }
    return total_size;
}

} // namespace etfarb
