#pragma once

#include "sedasbulk/archive_client.hpp"
#include "sedasbulk/bulk_config.hpp"
#include "sedasbulk/http.hpp"
#include "sedasbulk/product.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sedasbulk {

/// Area-of-interest search. Dates are ISO8601; `filters` is passed through as
/// SeDAS product filters.
struct SearchQuery {
    std::string wkt;
    std::string start;
    std::string end;
    std::string sensor = "All";  // All, SAR or Optical
    std::string satellite_name;
    std::string source_group;
    nlohmann::json filters = nlohmann::json::object();
};

/// ArchiveClient for the SeDAS REST API.
///
/// Logs in lazily and keeps the session token until five minutes before it
/// expires. Any call that fails with a token error (401, 403, or 400 "User
/// token does not exist") logs in again and is retried once; every other
/// failure is thrown as ArchiveError.
///
/// Thread-safe: the downloader calls it from the caller's thread, the request
/// poller and every download worker.
class SedasClient : public ArchiveClient {
public:
    explicit SedasClient(const SedasConfig& config);
    ~SedasClient() override;

    SedasClient(const SedasClient&) = delete;
    SedasClient& operator=(const SedasClient&) = delete;

    /// Authenticate if there is no valid token.
    /// Throws std::invalid_argument on blank credentials, ArchiveError on failure.
    void login();

    std::string request(const Product& product) override;
    std::optional<std::string> is_request_ready(const std::string& request_id) override;
    void download(const Product& product, const std::filesystem::path& destination) override;

    /// Look up products by SeDAS product id.
    std::vector<Product> search_product(const std::vector<std::string>& product_ids);

    /// Search an area of interest. Throws ArchiveError on failure.
    std::vector<Product> search(const SearchQuery& query);
    std::vector<Product> search_sar(SearchQuery query);
    std::vector<Product> search_optical(SearchQuery query);

    /// Request body sent to the search endpoint.
    static nlohmann::json build_search_query(const SearchQuery& query);

    /// True for responses that mean the session token is no longer accepted.
    static bool is_token_error(long status_code, const std::string& body);

private:
    using Call = std::function<net::HttpResponse(const std::string& token)>;

    // Run an authenticated call, re-authenticating and retrying once on a token error.
    net::HttpResponse call_with_reauth(const std::string& what, const Call& call);

    // Current session token, logging in first if needed.
    std::string auth_token();
    // Drop the token only if it is still the one that was rejected.
    void invalidate_token(const std::string& rejected);
    void login_locked();
    net::HttpRequest make_request(net::HttpMethod method, const std::string& url) const;
    std::string endpoint(const std::string& path) const;

    SedasConfig config_;
    net::HttpClient http_;

    std::mutex token_mutex_;
    std::string token_;
    std::chrono::system_clock::time_point token_expiry_{};
};

}  // namespace sedasbulk
