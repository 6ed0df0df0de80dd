#include "sedasbulk/sedas_client.hpp"

#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace sedasbulk {

namespace {

// Tokens are renewed this long before SeDAS says they expire
constexpr auto TOKEN_EXPIRY_MARGIN = std::chrono::minutes(5);

void log_info(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vfprintf(stdout, fmt, args);
    va_end(args);
    fputc('\n', stdout);
    fflush(stdout);
}

void log_error(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
void log_error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    fprintf(stderr, "ERROR: ");
    vfprintf(stderr, fmt, args);
    va_end(args);
    fputc('\n', stderr);
}

std::string describe(const net::HttpResponse& resp) {
    if (!resp.error.empty()) {
        return resp.is_network_error ? "network error: " + resp.error : resp.error;
    }
    std::string msg = "HTTP " + std::to_string(resp.status_code);
    if (!resp.body.empty()) {
        msg += ": " + resp.body.substr(0, 512);
    }
    return msg;
}

nlohmann::json parse_body(const net::HttpResponse& resp, const std::string& what) {
    try {
        return nlohmann::json::parse(resp.body);
    } catch (const nlohmann::json::exception& e) {
        throw ArchiveError(what + ": invalid JSON response: " + e.what(), resp.status_code);
    }
}

// Parse "2019-05-12T23:59:59Z" as UTC.
std::optional<std::chrono::system_clock::time_point> parse_utc(const std::string& text) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (iss.fail()) return std::nullopt;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string join_ids(const std::vector<std::string>& ids) {
    std::string joined;
    for (const auto& id : ids) {
        if (!joined.empty()) joined += ',';
        joined += net::url_encode(id);
    }
    return joined;
}

}  // namespace

SedasClient::SedasClient(const SedasConfig& config) : config_(config) {
    if (!config_.base_url.empty() && config_.base_url.back() != '/') {
        config_.base_url += '/';
    }
}

SedasClient::~SedasClient() = default;

bool SedasClient::is_token_error(long status_code, const std::string& body) {
    if (status_code == 401 || status_code == 403) return true;
    return status_code == 400 && body.find("User token does not exist") != std::string::npos;
}

std::string SedasClient::endpoint(const std::string& path) const {
    return config_.base_url + path;
}

net::HttpRequest SedasClient::make_request(net::HttpMethod method, const std::string& url) const {
    net::HttpRequest req = method == net::HttpMethod::POST
        ? net::HttpRequest::post(url, "")
        : net::HttpRequest::get(url);
    req.headers.set_content_type("application/json");
    req.total_timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.timeout);
    req.verify_ssl = config_.verify_ssl;
    req.ca_bundle_path = config_.ca_cert.string();
    return req;
}

// --- Authentication ---

void SedasClient::login() {
    std::lock_guard lock(token_mutex_);
    login_locked();
}

void SedasClient::login_locked() {
    if (!token_.empty() && std::chrono::system_clock::now() < token_expiry_) {
        return;
    }

    if (config_.username.empty() || config_.password.empty()) {
        throw std::invalid_argument("username and password must not be blank");
    }

    nlohmann::json credentials = {
        {"username", config_.username},
        {"password", config_.password},
    };
    auto req = make_request(net::HttpMethod::POST, endpoint("authentication"));
    req.set_json_body(credentials.dump());

    // Not retried: bad credentials would just fail again
    auto resp = http_.execute(req);
    if (!resp.ok()) {
        log_error("SeDAS login failed: %s", describe(resp).c_str());
        throw ArchiveError("SeDAS login failed: " + describe(resp), resp.status_code);
    }

    auto j = parse_body(resp, "SeDAS login");
    if (!j.contains("token") || !j["token"].is_string()) {
        throw ArchiveError("SeDAS login response has no token", resp.status_code);
    }
    std::optional<std::chrono::system_clock::time_point> valid_until;
    if (j.contains("validUntil") && j["validUntil"].is_string()) {
        valid_until = parse_utc(j["validUntil"].get<std::string>());
    }
    if (!valid_until) {
        throw ArchiveError("SeDAS login response has no usable validUntil", resp.status_code);
    }

    token_ = j["token"].get<std::string>();
    token_expiry_ = *valid_until - TOKEN_EXPIRY_MARGIN;
    log_info("SeDAS login successful for %s", config_.username.c_str());
}

std::string SedasClient::auth_token() {
    std::lock_guard lock(token_mutex_);
    login_locked();
    return token_;
}

void SedasClient::invalidate_token(const std::string& rejected) {
    std::lock_guard lock(token_mutex_);
    if (token_ == rejected) {
        token_.clear();
        token_expiry_ = {};
    }
}

net::HttpResponse SedasClient::call_with_reauth(const std::string& what, const Call& call) {
    auto token = auth_token();
    auto resp = call(token);

    if (resp.error.empty() && is_token_error(resp.status_code, resp.body)) {
        log_info("%s: token rejected (HTTP %ld), logging in again", what.c_str(), resp.status_code);
        invalidate_token(token);
        resp = call(auth_token());
    }

    if (!resp.ok()) {
        log_error("%s failed: %s", what.c_str(), describe(resp).c_str());
        throw ArchiveError(what + " failed: " + describe(resp), resp.status_code);
    }
    return resp;
}

// --- Archive operations ---

std::string SedasClient::request(const Product& product) {
    auto url = endpoint("request/" + net::url_encode(product.supplier_id));
    auto what = "Archive request for " + product.supplier_id;

    auto resp = call_with_reauth(what, [&](const std::string& token) {
        auto req = make_request(net::HttpMethod::POST, url);
        req.headers.set_authorization("Token", token);
        return http_.execute(req);
    });

    auto j = parse_body(resp, what);
    if (!j.is_object() || !j.contains("requestId")) {
        throw ArchiveError(what + ": response has no requestId", resp.status_code);
    }
    const auto& id = j["requestId"];
    return id.is_string() ? id.get<std::string>() : id.dump();
}

std::optional<std::string> SedasClient::is_request_ready(const std::string& request_id) {
    auto url = endpoint("request?ids=" + net::url_encode(request_id));
    auto what = "Status check for request " + request_id;

    auto resp = call_with_reauth(what, [&](const std::string& token) {
        auto req = make_request(net::HttpMethod::GET, url);
        req.headers.set_authorization("Token", token);
        return http_.execute(req);
    });

    auto j = parse_body(resp, what);
    if (!j.is_array() || j.empty() || !j[0].is_object()) return std::nullopt;

    auto it = j[0].find("downloadUrl");
    if (it == j[0].end() || !it->is_string() || it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

void SedasClient::download(const Product& product, const std::filesystem::path& destination) {
    if (!product.has_download_url()) {
        throw ArchiveError("no download url defined for product " + product.supplier_id);
    }

    std::error_code ec;
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            throw ArchiveError("cannot create " + destination.parent_path().string() + ": " + ec.message());
        }
    }

    const auto& url = *product.download_url;
    auto resp = call_with_reauth("Download of " + product.supplier_id, [&](const std::string& token) {
        auto req = make_request(net::HttpMethod::GET, url);
        req.headers.remove("Content-Type");
        req.headers.set_authorization("Token", token);
        return http_.download_to_file(req, destination);
    });
    log_info("Fetched %s: %llu bytes in %lld ms", product.supplier_id.c_str(),
             static_cast<unsigned long long>(resp.bytes_received),
             static_cast<long long>(resp.total_time.count()));
}

std::vector<Product> SedasClient::search_product(const std::vector<std::string>& product_ids) {
    if (product_ids.empty()) return {};

    auto url = endpoint("search/products?ids=" + join_ids(product_ids));
    const std::string what = "Product search";

    auto resp = call_with_reauth(what, [&](const std::string& token) {
        auto req = make_request(net::HttpMethod::GET, url);
        req.headers.set_authorization("Token", token);
        return http_.execute(req);
    });

    auto j = parse_body(resp, what);
    try {
        return parse_products(j);
    } catch (const std::invalid_argument& e) {
        throw ArchiveError(what + ": " + e.what(), resp.status_code);
    }
}

// --- Area-of-interest search ---

nlohmann::json SedasClient::build_search_query(const SearchQuery& query) {
    nlohmann::json body = {
        {"sensorFilters", {{"type", query.sensor}}},
        {"filters", query.filters.is_object() ? query.filters : nlohmann::json::object()},
        {"aoiWKT", query.wkt},
        {"start", query.start},
        {"stop", query.end},
    };
    if (!query.satellite_name.empty()) body["satelliteName"] = query.satellite_name;
    if (!query.source_group.empty()) body["sourceGroup"] = query.source_group;
    return body;
}

std::vector<Product> SedasClient::search(const SearchQuery& query) {
    auto url = endpoint("search");
    auto body = build_search_query(query).dump();
    const std::string what = "Search";

    auto resp = call_with_reauth(what, [&](const std::string& token) {
        auto req = make_request(net::HttpMethod::POST, url);
        req.set_json_body(body);
        req.headers.set_authorization("Token", token);
        return http_.execute(req);
    });

    auto j = parse_body(resp, what);
    try {
        return parse_products(j);
    } catch (const std::invalid_argument& e) {
        throw ArchiveError(what + ": " + e.what(), resp.status_code);
    }
}

std::vector<Product> SedasClient::search_sar(SearchQuery query) {
    query.sensor = "SAR";
    return search(query);
}

std::vector<Product> SedasClient::search_optical(SearchQuery query) {
    query.sensor = "Optical";
    return search(query);
}

}  // namespace sedasbulk
