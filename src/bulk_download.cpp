#include "sedasbulk/bulk_download.hpp"
#include "sedasbulk/metrics.hpp"

#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <utility>

namespace sedasbulk {

namespace {

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

// Counts a download as in flight for the guard's lifetime, including when
// the transfer throws.
class InFlightGuard {
public:
    explicit InFlightGuard(std::atomic<uint64_t>& counter) : counter_(counter) { ++counter_; }
    ~InFlightGuard() { --counter_; }

    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

private:
    std::atomic<uint64_t>& counter_;
};

}  // namespace

BulkDownload::BulkDownload(ArchiveClient& client, const BulkConfig& config,
                           std::shared_ptr<CompletionQueue> done_queue)
    : client_(client), config_(config), done_queue_(std::move(done_queue)) {
    start();
}

BulkDownload::~BulkDownload() {
    shutdown();
    join_threads();
}

void BulkDownload::join_threads() {
    if (poller_thread_.joinable()) poller_thread_.join();
    for (auto& t : worker_threads_) {
        if (t.joinable()) t.join();
    }
    worker_threads_.clear();
    if (monitor_thread_.joinable()) monitor_thread_.join();
}

void BulkDownload::start() {
    if (started_.exchange(true)) {
        throw AlreadyStartedError();
    }

    auto err = config_.validate();
    if (!err.empty()) {
        started_ = false;
        throw std::runtime_error("Invalid bulk download config: " + err);
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.output_dir, ec);
    if (ec) {
        started_ = false;
        throw std::runtime_error("Failed to create output_dir: " + ec.message());
    }

    running_ = true;

    try {
        poller_thread_ = std::thread(&BulkDownload::request_poller_loop, this);

        worker_threads_.reserve(config_.parallel);
        for (size_t i = 0; i < config_.parallel; ++i) {
            worker_threads_.emplace_back(&BulkDownload::download_worker_loop, this);
        }

        if (config_.stats_interval_secs > 0) {
            monitor_thread_ = std::thread(&BulkDownload::progress_monitor_loop, this);
        }
    } catch (const std::exception& e) {
        log_error("Failed to launch bulk download threads: %s", e.what());
        shutdown();
        join_threads();
        started_ = false;
        throw std::runtime_error(std::string("Failed to launch bulk download threads: ") + e.what());
    }

    log_info("Bulk download started: %zu download workers, poll interval %lld ms, output %s",
             config_.parallel, static_cast<long long>(config_.poll_interval.count()),
             config_.output_dir.c_str());
}

void BulkDownload::shutdown() {
    if (!running_.exchange(false)) return;

    log_info("Bulk download shutting down");

    // Wake the poller and monitor out of their interval sleep
    {
        std::lock_guard lock(wake_mutex_);
    }
    wake_cv_.notify_all();
}

bool BulkDownload::wait_interval(std::chrono::milliseconds interval) {
    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
    return running_.load();
}

// --- Ingest ---

void BulkDownload::add(const std::vector<Product>& products) {
    for (const auto& product : products) {
        // Claim the supplier id before anything else so a product is queued,
        // requested and downloaded at most once, also across concurrent add()s.
        {
            std::lock_guard lock(pending_mutex_);
            if (!accepted_.insert(product.supplier_id).second) {
                std::lock_guard stats_lock(stats_mutex_);
                stats_.duplicates_skipped++;
                if (config_.verbose) {
                    log_info("Already accepted %s, skipping", product.supplier_id.c_str());
                }
                continue;
            }
        }

        if (product.has_download_url()) {
            ++outstanding_;
            {
                std::lock_guard lock(stats_mutex_);
                stats_.products_added++;
            }
            ready_.push(product);
            continue;
        }

        ++outstanding_;
        std::string request_id;
        try {
            request_id = client_.request(product);
            if (request_id.empty()) {
                throw ArchiveError("archive returned an empty request id for " + product.supplier_id);
            }
        } catch (...) {
            {
                std::lock_guard lock(pending_mutex_);
                accepted_.erase(product.supplier_id);
            }
            --outstanding_;
            {
                std::lock_guard lock(stats_mutex_);
                stats_.requests_failed++;
            }
            if (auto* m = metrics_.load()) m->requests_failed().Increment();
            throw;
        }

        bool inserted = false;
        {
            std::lock_guard lock(pending_mutex_);
            inserted = pending_.emplace(request_id, product).second;
        }
        if (!inserted) {
            // Another product already owns this request id; nothing will ever
            // promote this one, so account for it as a failed request.
            log_error("Archive reused request id %s for %s, dropping product",
                      request_id.c_str(), product.supplier_id.c_str());
            --outstanding_;
            std::lock_guard lock(stats_mutex_);
            stats_.requests_failed++;
            continue;
        }

        {
            std::lock_guard lock(stats_mutex_);
            stats_.products_added++;
            stats_.requests_submitted++;
        }
        if (auto* m = metrics_.load()) m->requests_submitted().Increment();
        log_info("Requested %s from archive (request %s)",
                 product.supplier_id.c_str(), request_id.c_str());
    }
}

bool BulkDownload::is_done() const {
    return outstanding_.load() == 0;
}

std::filesystem::path BulkDownload::destination_for(const Product& product) const {
    return config_.output_dir / (product.supplier_id + ".zip");
}

// --- Request poller ---

void BulkDownload::request_poller_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        // Give requests a chance to complete without hammering the archive
        if (!wait_interval(config_.poll_interval)) break;
        poll_pending_requests();
    }
    if (config_.verbose) log_info("Request poller stopping");
}

void BulkDownload::poll_pending_requests() {
    // Snapshot ids so status checks run without holding the lock
    std::vector<std::pair<std::string, std::string>> snapshot;
    {
        std::lock_guard lock(pending_mutex_);
        snapshot.reserve(pending_.size());
        for (const auto& [request_id, product] : pending_) {
            snapshot.emplace_back(request_id, product.supplier_id);
        }
    }

    for (const auto& [request_id, supplier_id] : snapshot) {
        if (config_.verbose) {
            log_info("Checking state of request %s for %s", request_id.c_str(), supplier_id.c_str());
        }

        std::optional<std::string> download_url;
        try {
            download_url = client_.is_request_ready(request_id);
        } catch (const std::exception& e) {
            // Left pending; checked again next sweep
            log_error("Status check failed for request %s (%s): %s",
                      request_id.c_str(), supplier_id.c_str(), e.what());
            {
                std::lock_guard lock(stats_mutex_);
                stats_.poll_errors++;
            }
            if (auto* m = metrics_.load()) m->poll_errors_total().Increment();
            continue;
        }
        if (!download_url || download_url->empty()) continue;

        // Move from pending to ready in one step
        {
            std::lock_guard lock(pending_mutex_);
            auto it = pending_.find(request_id);
            if (it == pending_.end()) continue;
            Product product = std::move(it->second);
            product.download_url = *download_url;
            ready_.push(std::move(product));
            pending_.erase(it);
        }

        {
            std::lock_guard lock(stats_mutex_);
            stats_.requests_completed++;
        }
        if (auto* m = metrics_.load()) m->requests_completed().Increment();
        log_info("Request %s COMPLETE for %s", request_id.c_str(), supplier_id.c_str());
    }
}

// --- Download workers ---

void BulkDownload::download_worker_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        auto product = ready_.pop_for(config_.worker_idle_wait);
        if (!product) continue;

        if (!running_.load()) {
            // Shutdown arrived while waiting; leave the item queued
            ready_.push(std::move(*product));
            break;
        }
        download_one(std::move(*product));
    }
    if (config_.verbose) log_info("Download worker stopping");
}

void BulkDownload::download_one(Product product) {
    auto destination = destination_for(product);
    bool ok = false;
    {
        InFlightGuard in_flight(in_flight_);
        log_info("Downloading %s to %s", product.supplier_id.c_str(), destination.c_str());
        try {
            if (auto* m = metrics_.load()) {
                ScopedTimer timer(m->download_duration());
                client_.download(product, destination);
            } else {
                client_.download(product, destination);
            }
            ok = true;
        } catch (const std::exception& e) {
            // The product is dropped; it is not re-queued
            log_error("Download failed for %s: %s", product.supplier_id.c_str(), e.what());
        }
    }

    uint64_t bytes = 0;
    if (ok) {
        std::error_code ec;
        auto size = std::filesystem::file_size(destination, ec);
        if (!ec) bytes = size;
    }

    {
        std::lock_guard lock(stats_mutex_);
        if (ok) {
            stats_.downloads_completed++;
            stats_.bytes_downloaded += bytes;
        } else {
            stats_.downloads_failed++;
        }
    }
    if (auto* m = metrics_.load()) {
        if (ok) {
            m->downloads_success().Increment();
            m->download_bytes_total().Increment(static_cast<double>(bytes));
        } else {
            m->downloads_failure().Increment();
        }
    }

    // Publish before releasing the outstanding count so a caller that sees
    // is_done() can drain every record.
    if (ok && done_queue_) {
        done_queue_->push(CompletionRecord{std::move(product), destination});
    }
    --outstanding_;
}

// --- Stats ---

BulkDownload::Progress BulkDownload::progress() const {
    Progress p;
    p.ready = ready_.size();
    p.in_flight = in_flight_.load();
    {
        std::lock_guard lock(pending_mutex_);
        p.pending_requests = pending_.size();
    }
    p.outstanding = outstanding_.load();
    return p;
}

BulkDownload::Stats BulkDownload::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

void BulkDownload::progress_monitor_loop() {
    auto interval = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::seconds(config_.stats_interval_secs));
    while (running_.load(std::memory_order_relaxed)) {
        auto p = progress();
        auto s = get_stats();
        log_info("[progress] %llu downloads pending, %llu downloads in progress, %llu requests pending"
                 " | downloads: %llu ok, %llu fail | poll errors: %llu",
                 static_cast<unsigned long long>(p.ready),
                 static_cast<unsigned long long>(p.in_flight),
                 static_cast<unsigned long long>(p.pending_requests),
                 static_cast<unsigned long long>(s.downloads_completed),
                 static_cast<unsigned long long>(s.downloads_failed),
                 static_cast<unsigned long long>(s.poll_errors));

        if (!wait_interval(interval)) break;
    }
    if (config_.verbose) log_info("Progress monitor stopping");
}

}  // namespace sedasbulk
