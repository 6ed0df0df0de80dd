#include "sedasbulk/product.hpp"

#include <stdexcept>

namespace sedasbulk {

Product Product::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("product must be a JSON object");
    }
    auto it = j.find("supplierId");
    if (it == j.end() || !it->is_string()) {
        throw std::invalid_argument("product has no supplierId");
    }

    Product p;
    p.supplier_id = it->get<std::string>();
    if (p.supplier_id.empty()) {
        throw std::invalid_argument("product has an empty supplierId");
    }

    auto url = j.find("downloadUrl");
    if (url != j.end() && url->is_string() && !url->get<std::string>().empty()) {
        p.download_url = url->get<std::string>();
    }
    p.attributes = j;
    return p;
}

nlohmann::json Product::to_json() const {
    nlohmann::json j = attributes.is_object() ? attributes : nlohmann::json::object();
    j["supplierId"] = supplier_id;
    if (download_url) {
        j["downloadUrl"] = *download_url;
    }
    return j;
}

std::vector<Product> parse_products(const nlohmann::json& j) {
    const nlohmann::json* list = &j;
    if (j.is_object()) {
        auto it = j.find("products");
        if (it == j.end()) {
            throw std::invalid_argument("search response has no 'products' array");
        }
        list = &*it;
    }
    if (!list->is_array()) {
        throw std::invalid_argument("products must be a JSON array");
    }

    std::vector<Product> products;
    products.reserve(list->size());
    for (const auto& entry : *list) {
        products.push_back(Product::from_json(entry));
    }
    return products;
}

nlohmann::json CompletionRecord::to_json() const {
    return {{"search", product.to_json()}, {"path", path.string()}};
}

}  // namespace sedasbulk
