#include "order_voice/store/order_store.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

#include "order_voice/logging.hpp"

namespace order_voice {

namespace {

std::tm parse_order_date(const std::string& raw) {
    std::tm tm_value{};
    std::istringstream stream(raw);
    stream >> std::get_time(&tm_value, "%Y-%m-%d");
    if (stream.fail()) {
        throw StoreLoadError(StoreStatus::Invalid, "invalid order_date: " + raw);
    }
    char separator = 0;
    if (stream.get(separator) && (separator == 'T' || separator == ' ')) {
        stream >> std::get_time(&tm_value, "%H:%M");
        if (stream.fail()) {
            throw StoreLoadError(StoreStatus::Invalid, "invalid order_date: " + raw);
        }
        if (stream.peek() == ':') {
            stream.get();
            int seconds = 0;
            if (!(stream >> seconds)) {
                throw StoreLoadError(StoreStatus::Invalid, "invalid order_date: " + raw);
            }
            tm_value.tm_sec = seconds;
        }
    }
    return tm_value;
}

std::string format_money(double amount) {
    std::ostringstream out;
    out << '$' << std::fixed << std::setprecision(2) << amount;
    return out.str();
}

ProductRecord parse_product(const nlohmann::json& item) {
    ProductRecord product;
    product.id = item.at("id").get<int64_t>();
    product.name = item.at("name").get<std::string>();
    if (item.contains("description") && item["description"].is_string()) {
        product.description = item["description"].get<std::string>();
    }
    product.price = item.at("price").get<double>();
    product.stock_quantity = item.value("stock_quantity", 0);
    product.sku = item.at("sku").get<std::string>();
    return product;
}

OrderRecord parse_order(const nlohmann::json& item) {
    OrderRecord order;
    order.id = item.at("id").get<int64_t>();
    order.customer_id = item.at("customer_id").get<int64_t>();
    order.order_date = parse_order_date(item.at("order_date").get<std::string>());
    order.total_amount = item.at("total_amount").get<double>();
    const auto status_raw = item.at("status").get<std::string>();
    const auto status = parse_order_status(status_raw);
    if (!status) {
        throw StoreLoadError(StoreStatus::Invalid, "unknown order status: " + status_raw);
    }
    order.status = *status;
    return order;
}

OrderItemRecord parse_order_item(const nlohmann::json& item) {
    OrderItemRecord record;
    record.order_id = item.at("order_id").get<int64_t>();
    record.product_id = item.at("product_id").get<int64_t>();
    record.quantity = item.at("quantity").get<int>();
    record.unit_price = item.at("unit_price").get<double>();
    return record;
}

const nlohmann::json& section(const nlohmann::json& payload, const char* key) {
    static const nlohmann::json empty = nlohmann::json::array();
    if (!payload.contains(key)) {
        return empty;
    }
    const auto& value = payload.at(key);
    if (!value.is_array()) {
        throw StoreLoadError(StoreStatus::Invalid, std::string(key) + " must be an array");
    }
    return value;
}

}

const char* to_string(OrderStatus status) {
    switch (status) {
        case OrderStatus::Pending:
            return "pending";
        case OrderStatus::Processing:
            return "processing";
        case OrderStatus::Shipped:
            return "shipped";
        case OrderStatus::Delivered:
            return "delivered";
        case OrderStatus::Cancelled:
            return "cancelled";
    }
    return "unknown";
}

std::optional<OrderStatus> parse_order_status(const std::string& value) {
    if (value == "pending") return OrderStatus::Pending;
    if (value == "processing") return OrderStatus::Processing;
    if (value == "shipped") return OrderStatus::Shipped;
    if (value == "delivered") return OrderStatus::Delivered;
    if (value == "cancelled") return OrderStatus::Cancelled;
    return std::nullopt;
}

std::string StoreHealth::database() const {
    switch (status) {
        case StoreStatus::Loaded:
            return "static-json";
        case StoreStatus::Missing:
            return "missing";
        case StoreStatus::Invalid:
            return "invalid";
    }
    return "invalid";
}

OrderStore OrderStore::load(const std::filesystem::path& path) {
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw StoreLoadError(StoreStatus::Missing, "order snapshot not found: " + path.string());
    }
    nlohmann::json payload;
    try {
        payload = nlohmann::json::parse(stream);
    } catch (const nlohmann::json::exception& ex) {
        throw StoreLoadError(StoreStatus::Invalid,
                             "order snapshot is malformed: " + std::string(ex.what()));
    }
    return from_json(payload);
}

OrderStore OrderStore::from_json(const nlohmann::json& payload) {
    if (!payload.is_object()) {
        throw StoreLoadError(StoreStatus::Invalid, "order snapshot must be a JSON object");
    }
    OrderStore store;
    try {
        for (const auto& item : section(payload, "products")) {
            auto product = parse_product(item);
            store.products_[product.id] = std::move(product);
        }
        for (const auto& item : section(payload, "orders")) {
            auto order = parse_order(item);
            store.orders_[order.id] = order;
        }
        for (const auto& item : section(payload, "order_items")) {
            auto record = parse_order_item(item);
            store.items_by_order_[record.order_id].push_back(record);
        }
    } catch (const nlohmann::json::exception& ex) {
        throw StoreLoadError(StoreStatus::Invalid,
                             "order snapshot record is malformed: " + std::string(ex.what()));
    }
    return store;
}

std::optional<OrderRecord> OrderStore::get_order(int64_t order_id) const {
    const auto it = orders_.find(order_id);
    if (it == orders_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<OrderLine> OrderStore::get_items(int64_t order_id) const {
    std::vector<OrderLine> lines;
    const auto it = items_by_order_.find(order_id);
    if (it == items_by_order_.end()) {
        return lines;
    }
    for (const auto& item : it->second) {
        const auto product = products_.find(item.product_id);
        if (product == products_.end()) {
            logging::debug("Order line skipped (unknown product)",
                           {kv("order_id", order_id), kv("product_id", item.product_id)});
            continue;
        }
        lines.push_back({product->second, item.quantity, item.unit_price});
    }
    return lines;
}

std::string OrderStore::format_order_details(const OrderRecord& order) const {
    std::ostringstream out;
    out << "Order #" << order.id << " Details:\n";
    out << "- Order Date: " << std::put_time(&order.order_date, "%Y-%m-%d %H:%M") << "\n";
    out << "- Status: " << to_string(order.status) << "\n";
    out << "- Total Amount: " << format_money(order.total_amount) << "\n";
    out << "\n";
    out << "Items:";

    const auto lines = get_items(order.id);
    if (lines.empty()) {
        out << "\n  No items recorded for this order.";
    }
    for (const auto& line : lines) {
        out << "\n  - " << line.product.name;
        out << "\n    Quantity: " << line.quantity;
        out << "\n    Price: " << format_money(line.unit_price) << " each";
        out << "\n    Subtotal: " << format_money(line.subtotal());
    }
    return out.str();
}

StoreHealth check_store(const std::filesystem::path& path, OrderStore* store) {
    StoreHealth health;
    try {
        auto loaded = OrderStore::load(path);
        health.status = StoreStatus::Loaded;
        health.message = "Static dataset loaded successfully";
        if (store) {
            *store = std::move(loaded);
        }
    } catch (const StoreLoadError& ex) {
        health.status = ex.status();
        health.message = ex.status() == StoreStatus::Missing ? "Static dataset not found"
                                                             : "Static dataset is malformed";
        logging::error("Order snapshot unavailable",
                       {kv("path", path.string()),
                        kv("database", health.database()),
                        kv("error", ex.what())});
    }
    return health;
}

}
