#include "sedasbulk/bulk_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace sedasbulk {

// --- SedasConfig ---

std::string SedasConfig::validate() const {
    if (base_url.empty()) return "sedas base_url is required";
    if (base_url.compare(0, 7, "http://") != 0 && base_url.compare(0, 8, "https://") != 0)
        return "sedas base_url must be http(s): " + base_url;
    if (username.empty()) return "sedas username is required (--username or SEDAS_USERNAME)";
    if (password.empty()) return "sedas password is required (--password or SEDAS_PASSWORD)";
    if (!ca_cert.empty() && !std::filesystem::exists(ca_cert))
        return "ca_cert does not exist: " + ca_cert.string();
    return {};
}

// --- BulkConfig ---

std::optional<BulkConfig> BulkConfig::from_args(int argc, char* argv[]) {
    BulkConfig config;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--output-dir") {
                auto* v = next_arg(i, "--output-dir");
                if (!v) return std::nullopt;
                config.output_dir = v;
            } else if (arg == "--parallel") {
                auto* v = next_arg(i, "--parallel");
                if (!v) return std::nullopt;
                config.parallel = std::stoull(v);
            } else if (arg == "--poll-interval-ms") {
                auto* v = next_arg(i, "--poll-interval-ms");
                if (!v) return std::nullopt;
                config.poll_interval = std::chrono::milliseconds(std::stoull(v));
            } else if (arg == "--stats-interval") {
                auto* v = next_arg(i, "--stats-interval");
                if (!v) return std::nullopt;
                config.stats_interval_secs = std::stoull(v);
            } else if (arg == "--products") {
                auto* v = next_arg(i, "--products");
                if (!v) return std::nullopt;
                config.products_file = v;
            } else if (arg == "--product") {
                auto* v = next_arg(i, "--product");
                if (!v) return std::nullopt;
                config.product_ids.emplace_back(v);
            } else if (arg == "--wkt") {
                auto* v = next_arg(i, "--wkt");
                if (!v) return std::nullopt;
                config.search_wkt = v;
            } else if (arg == "--start") {
                auto* v = next_arg(i, "--start");
                if (!v) return std::nullopt;
                config.search_start = v;
            } else if (arg == "--end") {
                auto* v = next_arg(i, "--end");
                if (!v) return std::nullopt;
                config.search_end = v;
            } else if (arg == "--sensor") {
                auto* v = next_arg(i, "--sensor");
                if (!v) return std::nullopt;
                config.search_sensor = v;
            } else if (arg == "--satellite") {
                auto* v = next_arg(i, "--satellite");
                if (!v) return std::nullopt;
                config.search_satellite = v;
            } else if (arg == "--source-group") {
                auto* v = next_arg(i, "--source-group");
                if (!v) return std::nullopt;
                config.search_source_group = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--sedas-url") {
                auto* v = next_arg(i, "--sedas-url");
                if (!v) return std::nullopt;
                config.sedas.base_url = v;
            } else if (arg == "--username") {
                auto* v = next_arg(i, "--username");
                if (!v) return std::nullopt;
                config.sedas.username = v;
            } else if (arg == "--password") {
                auto* v = next_arg(i, "--password");
                if (!v) return std::nullopt;
                config.sedas.password = v;
            } else if (arg == "--no-verify-ssl") {
                config.sedas.verify_ssl = false;
            } else if (arg == "--ca-cert") {
                auto* v = next_arg(i, "--ca-cert");
                if (!v) return std::nullopt;
                config.sedas.ca_cert = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--help" || arg == "-h") {
                std::cerr <<
                    "Usage: sedas-bulk --output-dir <dir> (--products <file> | --product <id>... | --wkt <wkt> --start <date> --end <date>) [options]\n"
                    "\n"
                    "Products:\n"
                    "  --products <file>                JSON search response or array of products\n"
                    "  --product <id>                   SeDAS product id to look up (repeatable)\n"
                    "  --wkt <wkt>                      Search an area of interest (WKT polygon)\n"
                    "  --start <iso8601>                Search start date\n"
                    "  --end <iso8601>                  Search end date\n"
                    "  --sensor <All|SAR|Optical>       Search sensor type (default: All)\n"
                    "  --satellite <name>               Search only this satellite\n"
                    "  --source-group <name>            Search only this source group\n"
                    "\n"
                    "SeDAS:\n"
                    "  --sedas-url <url>                API base URL (default: https://geobrowser.satapps.org/api/)\n"
                    "  --username <name>                Username (or SEDAS_USERNAME env)\n"
                    "  --password <password>            Password (or SEDAS_PASSWORD env)\n"
                    "  --ca-cert <path>                 CA certificate for SSL\n"
                    "  --no-verify-ssl                  Skip SSL verification\n"
                    "\n"
                    "Download options:\n"
                    "  --config <path>                  JSON config file\n"
                    "  --output-dir <dir>               Where <supplierId>.zip files are written\n"
                    "  --parallel <N>                   Download worker threads (default: 2)\n"
                    "  --poll-interval-ms <ms>          Archive request poll interval (default: 5000)\n"
                    "  --stats-interval <secs>          Progress log interval, 0 disables (default: 5)\n"
                    "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
                    "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
                    "  --verbose                        Verbose output\n"
                    "  --help                           Show this help\n";
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool BulkConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("output_dir")) output_dir = j["output_dir"].get<std::string>();
        if (j.contains("parallel")) parallel = j["parallel"].get<size_t>();
        if (j.contains("poll_interval_ms"))
            poll_interval = std::chrono::milliseconds(j["poll_interval_ms"].get<uint64_t>());
        if (j.contains("worker_idle_wait_ms"))
            worker_idle_wait = std::chrono::milliseconds(j["worker_idle_wait_ms"].get<uint64_t>());
        if (j.contains("stats_interval")) stats_interval_secs = j["stats_interval"].get<size_t>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("products_file")) products_file = j["products_file"].get<std::string>();
        if (j.contains("product_ids")) {
            for (auto& id : j["product_ids"]) {
                product_ids.push_back(id.get<std::string>());
            }
        }
        if (j.contains("search") && j["search"].is_object()) {
            auto& jq = j["search"];
            if (jq.contains("wkt")) search_wkt = jq["wkt"].get<std::string>();
            if (jq.contains("start")) search_start = jq["start"].get<std::string>();
            if (jq.contains("end")) search_end = jq["end"].get<std::string>();
            if (jq.contains("sensor")) search_sensor = jq["sensor"].get<std::string>();
            if (jq.contains("satellite")) search_satellite = jq["satellite"].get<std::string>();
            if (jq.contains("source_group")) search_source_group = jq["source_group"].get<std::string>();
        }
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        if (j.contains("sedas") && j["sedas"].is_object()) {
            auto& js = j["sedas"];
            if (js.contains("base_url")) sedas.base_url = js["base_url"].get<std::string>();
            if (js.contains("username")) sedas.username = js["username"].get<std::string>();
            if (js.contains("password")) sedas.password = js["password"].get<std::string>();
            if (js.contains("verify_ssl")) sedas.verify_ssl = js["verify_ssl"].get<bool>();
            if (js.contains("ca_cert")) sedas.ca_cert = js["ca_cert"].get<std::string>();
            if (js.contains("timeout"))
                sedas.timeout = std::chrono::seconds(js["timeout"].get<uint64_t>());
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void BulkConfig::apply_defaults() {
    if (sedas.username.empty()) {
        if (const char* v = std::getenv("SEDAS_USERNAME")) sedas.username = v;
    }
    if (sedas.password.empty()) {
        if (const char* v = std::getenv("SEDAS_PASSWORD")) sedas.password = v;
    }

    // Endpoint paths are appended directly to the base URL
    if (!sedas.base_url.empty() && sedas.base_url.back() != '/') {
        sedas.base_url += '/';
    }
}

std::string BulkConfig::validate() const {
    if (output_dir.empty()) return "output_dir is required (--output-dir)";
    if (std::filesystem::exists(output_dir) && !std::filesystem::is_directory(output_dir))
        return "output_dir is not a directory: " + output_dir.string();
    if (parallel == 0) return "parallel must be > 0";
    if (parallel > MAX_PARALLEL)
        return "parallel must be <= " + std::to_string(MAX_PARALLEL);
    if (poll_interval.count() <= 0) return "poll_interval must be > 0";
    if (worker_idle_wait.count() <= 0) return "worker_idle_wait must be > 0";
    if (!search_wkt.empty()) {
        if (search_start.empty() || search_end.empty())
            return "--wkt needs --start and --end";
        if (search_sensor != "All" && search_sensor != "SAR" && search_sensor != "Optical")
            return "sensor must be All, SAR or Optical: " + search_sensor;
    }
    return {};
}

}  // namespace sedasbulk
