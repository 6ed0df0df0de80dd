#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace sedasbulk {

/// A retrievable archive product, as returned by a SeDAS search.
///
/// Only the supplier id and download URL matter to the engine. The rest of
/// the search result is carried in `attributes` so completion records hand
/// the caller back exactly what it passed in.
struct Product {
    std::string supplier_id;
    std::optional<std::string> download_url;
    nlohmann::json attributes = nlohmann::json::object();

    bool has_download_url() const {
        return download_url.has_value() && !download_url->empty();
    }

    /// Build from a search result object.
    /// Throws std::invalid_argument if supplierId is missing or not a string.
    static Product from_json(const nlohmann::json& j);

    nlohmann::json to_json() const;
};

/// Accepts a search response ({"products": [...]}) or a bare array.
std::vector<Product> parse_products(const nlohmann::json& j);

/// Emitted once per successfully downloaded product.
struct CompletionRecord {
    Product product;
    std::filesystem::path path;

    nlohmann::json to_json() const;
};

}  // namespace sedasbulk
