#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace sedasbulk {

/// Connection settings for the SeDAS REST API.
struct SedasConfig {
    std::string base_url = "https://geobrowser.satapps.org/api/";
    std::string username;
    std::string password;

    bool verify_ssl = true;
    std::filesystem::path ca_cert;
    std::chrono::seconds timeout{300};

    /// Validate required fields.
    /// Returns error message or empty string on success.
    std::string validate() const;
};

/// Configuration for a bulk download session.
struct BulkConfig {
    // Downloads land at <output_dir>/<supplierId>.zip
    std::filesystem::path output_dir;

    // Download workers
    static constexpr size_t MAX_PARALLEL = 256;
    size_t parallel = 2;

    // Tuning
    std::chrono::milliseconds poll_interval{5000};     // archive request sweep
    std::chrono::milliseconds worker_idle_wait{1000};  // empty ready queue backoff
    size_t stats_interval_secs = 5;                    // 0 disables the progress monitor

    bool verbose = false;

    // Products to fetch (CLI only)
    std::filesystem::path products_file;
    std::vector<std::string> product_ids;

    // Area-of-interest search (CLI only); used when search_wkt is set
    std::string search_wkt;
    std::string search_start;   // ISO8601
    std::string search_end;     // ISO8601
    std::string search_sensor = "All";  // All, SAR or Optical
    std::string search_satellite;
    std::string search_source_group;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    SedasConfig sedas;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<BulkConfig> from_args(int argc, char* argv[]);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in credentials from the environment when not set explicitly.
    void apply_defaults();

    /// Validate the fields the downloader itself needs (not credentials).
    /// Returns error message or empty string.
    std::string validate() const;
};

}  // namespace sedasbulk
