#pragma once

#include <cstdint>
#include <ctime>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace order_voice {

enum class OrderStatus {
    Pending,
    Processing,
    Shipped,
    Delivered,
    Cancelled
};

const char* to_string(OrderStatus status);
std::optional<OrderStatus> parse_order_status(const std::string& value);

struct OrderRecord {
    int64_t id = 0;
    int64_t customer_id = 0;
    std::tm order_date{};
    double total_amount = 0.0;
    OrderStatus status = OrderStatus::Pending;
};

struct OrderItemRecord {
    int64_t order_id = 0;
    int64_t product_id = 0;
    int quantity = 0;
    double unit_price = 0.0;
};

struct ProductRecord {
    int64_t id = 0;
    std::string name;
    std::optional<std::string> description;
    double price = 0.0;
    int stock_quantity = 0;
    std::string sku;
};

// One resolved order line: the product with the quantity and price it was sold at.
struct OrderLine {
    ProductRecord product;
    int quantity = 0;
    double unit_price = 0.0;

    double subtotal() const { return unit_price * quantity; }
};

enum class StoreStatus {
    Loaded,
    Missing,
    Invalid
};

class StoreLoadError : public std::runtime_error {
public:
    StoreLoadError(StoreStatus status, const std::string& message)
        : std::runtime_error(message),
          status_(status) {}

    StoreStatus status() const { return status_; }

private:
    StoreStatus status_;
};

// Outcome of loading the snapshot, reported by the health endpoint.
struct StoreHealth {
    StoreStatus status = StoreStatus::Missing;
    std::string message;

    bool healthy() const { return status == StoreStatus::Loaded; }
    // "static-json", "missing" or "invalid".
    std::string database() const;
};

// Read-only view of orders, order items and products loaded once from a JSON snapshot.
class OrderStore {
public:
    OrderStore() = default;

    static OrderStore load(const std::filesystem::path& path);
    static OrderStore from_json(const nlohmann::json& payload);

    std::optional<OrderRecord> get_order(int64_t order_id) const;
    // Lines whose product is unknown are skipped.
    std::vector<OrderLine> get_items(int64_t order_id) const;
    std::string format_order_details(const OrderRecord& order) const;

    std::size_t order_count() const { return orders_.size(); }
    std::size_t product_count() const { return products_.size(); }

private:
    std::map<int64_t, ProductRecord> products_;
    std::map<int64_t, OrderRecord> orders_;
    std::map<int64_t, std::vector<OrderItemRecord>> items_by_order_;
};

StoreHealth check_store(const std::filesystem::path& path, OrderStore* store = nullptr);

}
