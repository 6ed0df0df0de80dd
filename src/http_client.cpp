#include "sedasbulk/http.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace sedasbulk::net {

// ============================================================================
// Utility functions
// ============================================================================

bool is_success_status(long status) {
    return status >= 200 && status < 300;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded.fill('0');
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << static_cast<int>(c);
        }
    }

    return encoded.str();
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {name, value};
}

void HttpHeaders::remove(const std::string& name) {
    headers_.erase(normalize_name(name));
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    result.reserve(headers_.size());
    for (const auto& [key, pair] : headers_) {
        result.push_back(pair);
    }
    return result;
}

void HttpHeaders::set_content_type(const std::string& content_type) {
    set("Content-Type", content_type);
}

void HttpHeaders::set_authorization(const std::string& scheme, const std::string& credentials) {
    set("Authorization", scheme + " " + credentials);
}

// ============================================================================
// HttpRequest
// ============================================================================

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.method = HttpMethod::GET;
    req.url = url;
    return req;
}

HttpRequest HttpRequest::post(const std::string& url, const std::string& body) {
    HttpRequest req;
    req.method = HttpMethod::POST;
    req.url = url;
    req.body = body;
    return req;
}

void HttpRequest::set_json_body(const std::string& json) {
    body = json;
    headers.set_content_type("application/json");
}

// ============================================================================
// libcurl plumbing
// ============================================================================

namespace {

// Context for bounded response accumulation
struct WriteCallbackContext {
    std::string* response;
    size_t max_size;
    size_t current_size;
    bool size_exceeded;
};

size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<WriteCallbackContext*>(userdata);
    size_t bytes = size * nmemb;

    // Check if adding this data would exceed the limit
    if (ctx->max_size > 0 && ctx->current_size + bytes > ctx->max_size) {
        ctx->size_exceeded = true;
        return 0;  // Return 0 to signal error and abort transfer
    }

    ctx->response->append(ptr, bytes);
    ctx->current_size += bytes;
    return bytes;
}

// Streams 2xx bodies to a file; keeps a short prefix of error bodies for messages.
struct FileWriteContext {
    CURL* curl;
    std::ofstream* file;
    std::string error_body;
    uint64_t bytes_written;
    bool write_failed;
};

constexpr size_t MAX_ERROR_BODY = 4096;

size_t file_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<FileWriteContext*>(userdata);
    size_t bytes = size * nmemb;

    long status = 0;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &status);
    if (!is_success_status(status)) {
        size_t keep = std::min(bytes, MAX_ERROR_BODY - std::min(MAX_ERROR_BODY, ctx->error_body.size()));
        ctx->error_body.append(ptr, keep);
        return bytes;
    }

    ctx->file->write(ptr, static_cast<std::streamsize>(bytes));
    if (!ctx->file->good()) {
        ctx->write_failed = true;
        return 0;
    }
    ctx->bytes_written += bytes;
    return bytes;
}

void global_init() {
    // Initialize CURL globally (thread-safe)
    static std::once_flag curl_init_flag;
    std::call_once(curl_init_flag, []() {
        curl_global_init(CURL_GLOBAL_ALL);
    });
}

struct CurlDeleter {
    void operator()(CURL* c) const { curl_easy_cleanup(c); }
};
struct SlistDeleter {
    void operator()(curl_slist* l) const { curl_slist_free_all(l); }
};
using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;
using CurlHeaders = std::unique_ptr<curl_slist, SlistDeleter>;

// Apply everything common to buffered and streamed requests.
CurlHeaders prepare(CURL* curl, const HttpRequest& request, const HttpClientConfig& config) {
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());

    switch (request.method) {
        case HttpMethod::GET:
            curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
            break;
        case HttpMethod::POST:
            curl_easy_setopt(curl, CURLOPT_POST, 1L);
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.data());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
            break;
    }

    curl_slist* headers_list = nullptr;
    for (const auto& [name, value] : request.headers.all()) {
        std::string header = name + ": " + value;
        headers_list = curl_slist_append(headers_list, header.c_str());
    }
    if (headers_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
    }

    if (!config.user_agent.empty()) {
        curl_easy_setopt(curl, CURLOPT_USERAGENT, config.user_agent.c_str());
    }

    // Timeouts
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                     static_cast<long>(request.connect_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                     static_cast<long>(request.total_timeout.count()));
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    if (request.verify_ssl) {
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);
    } else {
        static std::once_flag ssl_warning_flag;
        std::call_once(ssl_warning_flag, []() {
            std::cerr << "SECURITY WARNING: SSL verification disabled via configuration.\n"
                      << "This exposes connections to man-in-the-middle attacks.\n";
        });
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 0L);
        curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 0L);
    }
    if (!request.ca_bundle_path.empty()) {
        curl_easy_setopt(curl, CURLOPT_CAINFO, request.ca_bundle_path.c_str());
    }

    // Download URLs redirect to the storage tier
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    if (config.verbose) {
        curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
    }

    return CurlHeaders(headers_list);
}

}  // namespace

// ============================================================================
// HttpClient
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config) : config_(config) {
    global_init();
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute(const HttpRequest& request) {
    HttpResponse response;

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        response.error = "Failed to create curl handle";
        response.is_network_error = true;
        return response;
    }

    auto headers = prepare(curl.get(), request, config_);

    WriteCallbackContext write_ctx{&response.body, config_.max_response_size, 0, false};
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &write_ctx);

    auto start_time = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl.get());
    response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    response.bytes_received = write_ctx.current_size;

    if (write_ctx.size_exceeded) {
        response.error = "Response body exceeded maximum size limit of " +
                         std::to_string(config_.max_response_size) + " bytes";
        response.status_code = 413;  // Payload Too Large
    } else if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        response.is_network_error = true;
    } else {
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    }

    return response;
}

HttpResponse HttpClient::download_to_file(const HttpRequest& request,
                                          const std::filesystem::path& path) {
    HttpResponse response;

    auto part_path = path;
    part_path += ".part";

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        response.error = "Failed to create curl handle";
        response.is_network_error = true;
        return response;
    }

    std::ofstream file(part_path, std::ios::binary | std::ios::trunc);
    if (!file) {
        response.error = "Failed to open file for writing: " + part_path.string();
        return response;
    }

    auto headers = prepare(curl.get(), request, config_);

    FileWriteContext write_ctx{curl.get(), &file, {}, 0, false};
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, file_write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &write_ctx);

    auto start_time = std::chrono::steady_clock::now();
    CURLcode res = curl_easy_perform(curl.get());
    response.total_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);
    response.bytes_received = write_ctx.bytes_written;

    file.close();

    if (write_ctx.write_failed || (res == CURLE_OK && !file.good())) {
        response.error = "Failed writing to " + part_path.string();
    } else if (res != CURLE_OK) {
        response.error = curl_easy_strerror(res);
        response.is_network_error = true;
    } else {
        curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
        if (!is_success_status(response.status_code)) {
            response.body = std::move(write_ctx.error_body);
        }
    }

    std::error_code ec;
    if (!response.ok()) {
        std::filesystem::remove(part_path, ec);
        return response;
    }

    std::filesystem::rename(part_path, path, ec);
    if (ec) {
        response.error = "Failed to rename " + part_path.string() + ": " + ec.message();
        std::filesystem::remove(part_path, ec);
    }
    return response;
}

}  // namespace sedasbulk::net
