#pragma once

#include "sedasbulk/archive_client.hpp"
#include "sedasbulk/bulk_config.hpp"
#include "sedasbulk/product.hpp"
#include "sedasbulk/work_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sedasbulk {

class MetricsExporter;

/// Thrown by BulkDownload::start() when the background threads already run.
class AlreadyStartedError : public std::logic_error {
public:
    AlreadyStartedError() : std::logic_error("bulk downloader already started") {}
};

/// Asynchronous bulk retrieval engine.
///
/// Products that already carry a download URL go straight to the ready
/// queue. The rest are requested from the long-term archive once each and
/// parked in the pending map until the request poller sees them become
/// ready. A fixed pool of download workers drains the ready queue.
///
/// Threads:
///   - 1 request poller, sweeping every poll_interval
///   - `parallel` download workers
///   - 1 progress monitor (when stats_interval_secs > 0)
///
/// Shutdown is cooperative: shutdown() only clears the running flag. Each
/// loop notices at its next boundary, so an in-progress sweep or download
/// runs to completion. The destructor joins the threads.
class BulkDownload {
public:
    /// Starts all background threads. The client must outlive the downloader.
    /// @param done_queue  Optional; receives one CompletionRecord per download.
    BulkDownload(ArchiveClient& client, const BulkConfig& config,
                 std::shared_ptr<CompletionQueue> done_queue = nullptr);
    ~BulkDownload();

    BulkDownload(const BulkDownload&) = delete;
    BulkDownload& operator=(const BulkDownload&) = delete;

    /// Launch the poller, workers and monitor. Called by the constructor.
    /// Throws AlreadyStartedError on a second call, std::runtime_error if the
    /// config is invalid or the output directory cannot be created.
    void start();

    /// Ask every background loop to stop at its next safe point. Never blocks.
    void shutdown();

    /// Queue products for download. Safe to call repeatedly and concurrently
    /// with the background threads. A supplier id seen before (with or without
    /// a URL) is skipped. Archive request failures propagate.
    void add(const std::vector<Product>& products);

    /// True once every accepted product has finished downloading (or failed).
    bool is_done() const;

    bool is_running() const { return running_.load(); }

    /// Attach a metrics exporter (not owned; must outlive the downloader).
    void set_metrics(MetricsExporter* metrics) { metrics_.store(metrics); }

    /// Destination for a product: <output_dir>/<supplierId>.zip
    std::filesystem::path destination_for(const Product& product) const;

    // --- Statistics ---

    struct Progress {
        uint64_t ready = 0;             // waiting for a worker
        uint64_t in_flight = 0;         // being downloaded
        uint64_t pending_requests = 0;  // waiting on the archive
        uint64_t outstanding = 0;       // accepted but not finished
    };
    Progress progress() const;

    struct Stats {
        uint64_t products_added = 0;
        uint64_t duplicates_skipped = 0;
        uint64_t requests_submitted = 0;
        uint64_t requests_failed = 0;
        uint64_t requests_completed = 0;
        uint64_t poll_errors = 0;
        uint64_t downloads_completed = 0;
        uint64_t downloads_failed = 0;
        uint64_t bytes_downloaded = 0;
    };
    Stats get_stats() const;

private:
    void request_poller_loop();
    void poll_pending_requests();
    void download_worker_loop();
    void download_one(Product product);
    void progress_monitor_loop();
    void join_threads();

    // Sleep up to `interval`, waking early on shutdown.
    // Returns false if the downloader is no longer running.
    bool wait_interval(std::chrono::milliseconds interval);

    ArchiveClient& client_;
    BulkConfig config_;
    std::shared_ptr<CompletionQueue> done_queue_;
    std::atomic<MetricsExporter*> metrics_{nullptr};

    // Products with a known download URL
    WorkQueue<Product> ready_;

    // Outstanding archive requests, request id -> product.
    // accepted_ holds every supplier id add() has taken on (queued, requested
    // or being requested), so a product is handled at most once per session.
    mutable std::mutex pending_mutex_;
    std::unordered_map<std::string, Product> pending_;
    std::unordered_set<std::string> accepted_;

    std::atomic<uint64_t> in_flight_{0};
    std::atomic<uint64_t> outstanding_{0};

    // Threads
    std::thread poller_thread_;
    std::vector<std::thread> worker_threads_;
    std::thread monitor_thread_;

    // Lifecycle
    std::atomic<bool> started_{false};
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;

    // Stats
    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace sedasbulk
