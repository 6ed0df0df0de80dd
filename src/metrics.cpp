#include "sedasbulk/metrics.hpp"
#include "sedasbulk/bulk_download.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace sedasbulk {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& requests_family = prometheus::BuildCounter()
        .Name("sedasbulk_requests_total")
        .Help("Archive requests by outcome")
        .Labels(labels)
        .Register(*registry_);
    requests_submitted_ = &requests_family.Add({{"result", "submitted"}});
    requests_failed_ = &requests_family.Add({{"result", "failed"}});
    requests_completed_ = &requests_family.Add({{"result", "completed"}});

    auto& downloads_family = prometheus::BuildCounter()
        .Name("sedasbulk_downloads_total")
        .Help("Total downloads finished")
        .Labels(labels)
        .Register(*registry_);
    downloads_success_ = &downloads_family.Add({{"result", "success"}});
    downloads_failure_ = &downloads_family.Add({{"result", "failure"}});

    download_bytes_total_ = &prometheus::BuildCounter()
        .Name("sedasbulk_download_bytes_total")
        .Help("Total bytes downloaded")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    poll_errors_total_ = &prometheus::BuildCounter()
        .Name("sedasbulk_poll_errors_total")
        .Help("Archive request status checks that failed")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    ready_queue_ = &gauge_reg("sedasbulk_ready_queue", "Products waiting for a download worker");
    downloads_in_flight_ = &gauge_reg("sedasbulk_downloads_in_flight", "Downloads in progress");
    requests_pending_ = &gauge_reg("sedasbulk_requests_pending", "Archive requests not yet ready");

    // --- Histograms ---

    download_duration_ = &prometheus::BuildHistogram()
        .Name("sedasbulk_download_duration_seconds")
        .Help("Download duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 120, 300, 600, 1800, 3600});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::set_downloader(const BulkDownload* downloader) {
    std::lock_guard lock(downloader_mutex_);
    downloader_ = downloader;
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    std::lock_guard lock(downloader_mutex_);
    if (!downloader_) return;

    auto p = downloader_->progress();
    ready_queue_->Set(static_cast<double>(p.ready));
    downloads_in_flight_->Set(static_cast<double>(p.in_flight));
    requests_pending_->Set(static_cast<double>(p.pending_requests));
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace sedasbulk
