#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace sedasbulk {

class BulkDownload;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports bulk download metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file.
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Downloader whose queue depths are sampled into the gauges (not owned).
    void set_downloader(const BulkDownload* downloader);

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    prometheus::Counter& requests_submitted() { return *requests_submitted_; }
    prometheus::Counter& requests_failed() { return *requests_failed_; }
    prometheus::Counter& requests_completed() { return *requests_completed_; }
    prometheus::Counter& downloads_success() { return *downloads_success_; }
    prometheus::Counter& downloads_failure() { return *downloads_failure_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& poll_errors_total() { return *poll_errors_total_; }

    prometheus::Histogram& download_duration() { return *download_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    std::mutex downloader_mutex_;
    const BulkDownload* downloader_ = nullptr;

    // --- Counters ---
    prometheus::Counter* requests_submitted_;
    prometheus::Counter* requests_failed_;
    prometheus::Counter* requests_completed_;
    prometheus::Counter* downloads_success_;
    prometheus::Counter* downloads_failure_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* poll_errors_total_;

    // --- Gauges ---
    prometheus::Gauge* ready_queue_;
    prometheus::Gauge* downloads_in_flight_;
    prometheus::Gauge* requests_pending_;

    // --- Histograms ---
    prometheus::Histogram* download_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace sedasbulk
