#include "sedasbulk/bulk_config.hpp"
#include "sedasbulk/bulk_download.hpp"
#include "sedasbulk/metrics.hpp"
#include "sedasbulk/sedas_client.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

std::vector<sedasbulk::Product> load_products_file(const std::filesystem::path& path) {
    std::ifstream ifs(path);
    if (!ifs) {
        throw std::runtime_error("cannot open products file: " + path.string());
    }
    return sedasbulk::parse_products(nlohmann::json::parse(ifs));
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = sedasbulk::BulkConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (err.empty()) err = config.sedas.validate();
    if (err.empty() && config.products_file.empty() && config.product_ids.empty() &&
        config.search_wkt.empty()) {
        err = "nothing to download (--products, --product or --wkt)";
    }
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    std::cout << "sedas-bulk starting..." << std::endl;
    std::cout << "  sedas-url: " << config.sedas.base_url << std::endl;
    std::cout << "  username: " << config.sedas.username << std::endl;
    std::cout << "  password: ****" << std::endl;
    std::cout << "  output-dir: " << config.output_dir << std::endl;
    std::cout << "  parallel: " << config.parallel << std::endl;
    std::cout << "  poll-interval: " << config.poll_interval.count() << " ms" << std::endl;
    if (!config.metrics_file.empty()) {
        std::cout << "  metrics-file: " << config.metrics_file << std::endl;
    }

    sedasbulk::SedasClient client(config.sedas);

    // Collect products before starting any threads so setup errors exit cleanly
    std::vector<sedasbulk::Product> products;
    try {
        if (!config.products_file.empty()) {
            products = load_products_file(config.products_file);
        }
        if (!config.product_ids.empty()) {
            auto found = client.search_product(config.product_ids);
            if (found.size() < config.product_ids.size()) {
                std::cerr << "Warning: " << (config.product_ids.size() - found.size())
                          << " product id(s) not found" << std::endl;
            }
            products.insert(products.end(), found.begin(), found.end());
        }
        if (!config.search_wkt.empty()) {
            sedasbulk::SearchQuery query;
            query.wkt = config.search_wkt;
            query.start = config.search_start;
            query.end = config.search_end;
            query.sensor = config.search_sensor;
            query.satellite_name = config.search_satellite;
            query.source_group = config.search_source_group;
            auto found = client.search(query);
            std::cout << "  search matched " << found.size() << " product(s)" << std::endl;
            products.insert(products.end(), found.begin(), found.end());
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load products: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "  products: " << products.size() << std::endl;

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    std::unique_ptr<sedasbulk::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<sedasbulk::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"output_dir", config.output_dir.string()}});
    }

    auto done_queue = std::make_shared<sedasbulk::CompletionQueue>();
    std::unique_ptr<sedasbulk::BulkDownload> downloader;
    try {
        downloader = std::make_unique<sedasbulk::BulkDownload>(client, config, done_queue);
    } catch (const std::exception& e) {
        std::cerr << "Failed to start downloader: " << e.what() << std::endl;
        return 1;
    }
    if (metrics) {
        downloader->set_metrics(metrics.get());
        metrics->set_downloader(downloader.get());
        metrics->start();
    }

    int exit_code = 0;
    try {
        downloader->add(products);
    } catch (const std::exception& e) {
        std::cerr << "Failed to queue products: " << e.what() << std::endl;
        exit_code = 1;
        g_shutdown_requested = 1;
    }

    // Print each completion, stop when everything is done or on signal
    while (!g_shutdown_requested) {
        auto record = done_queue->pop_for(std::chrono::milliseconds(500));
        if (record) {
            std::cout << record->to_json().dump() << std::endl;
            continue;
        }
        if (downloader->is_done()) break;
    }
    while (auto record = done_queue->try_pop()) {
        std::cout << record->to_json().dump() << std::endl;
    }

    downloader->shutdown();
    auto stats = downloader->get_stats();
    bool finished = downloader->is_done();

    if (metrics) {
        metrics->stop();
        metrics->set_downloader(nullptr);
    }
    // Joins the workers; in-progress downloads finish first
    downloader.reset();

    std::cout << "Downloaded " << stats.downloads_completed << " product(s), "
              << stats.downloads_failed << " failed" << std::endl;
    if (exit_code != 0) return exit_code;
    if (!finished) {
        std::cout << "Interrupted before all products were downloaded" << std::endl;
        return 1;
    }
    return stats.downloads_failed > 0 ? 2 : 0;
}
