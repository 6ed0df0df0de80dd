#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace sedasbulk::net {

enum class HttpMethod {
    GET,
    POST
};

bool is_success_status(long status);

std::string url_encode(const std::string& str);

// HTTP headers (case-insensitive names)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void remove(const std::string& name);

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_authorization(const std::string& scheme, const std::string& credentials);

private:
    // Stored as lowercase name -> (original name, value)
    std::map<std::string, HeaderPair> headers_;

    static std::string normalize_name(const std::string& name);
};

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::string body;

    // Timeouts
    std::chrono::milliseconds connect_timeout{30000};
    std::chrono::milliseconds total_timeout{300000};

    // SSL options
    bool verify_ssl = true;
    std::string ca_bundle_path;  // Empty = system default

    static HttpRequest get(const std::string& url);
    static HttpRequest post(const std::string& url, const std::string& body);

    void set_json_body(const std::string& json);
};

struct HttpResponse {
    long status_code = 0;
    std::string body;

    std::chrono::milliseconds total_time{0};
    uint64_t bytes_received = 0;

    bool ok() const { return error.empty() && is_success_status(status_code); }

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // True if error was network-level, not HTTP status
};

struct HttpClientConfig {
    // Response size limit for buffered requests (0 = unlimited).
    // Downloads to file are not limited.
    size_t max_response_size = 16 * 1024 * 1024;

    std::string user_agent = "sedas-bulk/1.0";

    bool verbose = false;
};

// Blocking libcurl client. Safe to share between threads; each call uses
// its own easy handle.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Execute and buffer the response body in memory.
    HttpResponse execute(const HttpRequest& request);

    // Execute and stream the response body to `path`. The body is written to
    // <path>.part and renamed on success; on any failure the partial file is
    // removed and the response carries the error (and, for HTTP errors, the
    // first part of the body).
    HttpResponse download_to_file(const HttpRequest& request,
                                  const std::filesystem::path& path);

private:
    HttpClientConfig config_;
};

}  // namespace sedasbulk::net
