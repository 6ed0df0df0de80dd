#pragma once

#include "sedasbulk/product.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace sedasbulk {

/// Failure talking to the remote archive.
class ArchiveError : public std::runtime_error {
public:
    explicit ArchiveError(const std::string& what, long status_code = 0)
        : std::runtime_error(what), status_code_(status_code) {}

    /// HTTP status, or 0 for transport errors and local preconditions.
    long status_code() const { return status_code_; }

private:
    long status_code_;
};

// Remote archive operations needed by the bulk downloader.
// Implementations own authentication and any per-call retry.
class ArchiveClient {
public:
    virtual ~ArchiveClient() = default;

    // Submit a long-term archive request. Returns the request id.
    virtual std::string request(const Product& product) = 0;

    // Non-blocking status check. Returns the download URL once ready.
    virtual std::optional<std::string> is_request_ready(const std::string& request_id) = 0;

    // Transfer the product to a local file. Throws ArchiveError if the
    // product has no download URL or the transfer fails.
    virtual void download(const Product& product, const std::filesystem::path& destination) = 0;
};

}  // namespace sedasbulk
