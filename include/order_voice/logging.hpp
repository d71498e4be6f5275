#pragma once

#include <initializer_list>
#include <sstream>
#include <string>
#include <type_traits>

#include "order_voice/config.hpp"
#include "spdlog/common.h"

namespace order_voice {
namespace logging {

struct Field {
    std::string key;
    std::string value;
};

using Fields = std::initializer_list<Field>;

template <typename T>
Field kv(const std::string& key, const T& value) {
    std::ostringstream oss;
    if constexpr (std::is_floating_point_v<T>) {
        oss.setf(std::ios::fixed);
        oss.precision(3);
    }
    oss << std::boolalpha << value;
    return {key, oss.str()};
}

inline Field kv(const std::string& key, const std::string& value) {
    return {key, value};
}

// "message [a=1, b="two words"]"; the brackets are omitted without fields.
std::string render(const std::string& message, Fields fields);

void init(const Config& config);
void shutdown();

void write(spdlog::level::level_enum level, const std::string& message, Fields fields);

inline void debug(const std::string& message, Fields fields = {}) {
    write(spdlog::level::debug, message, fields);
}

inline void info(const std::string& message, Fields fields = {}) {
    write(spdlog::level::info, message, fields);
}

inline void warn(const std::string& message, Fields fields = {}) {
    write(spdlog::level::warn, message, fields);
}

inline void error(const std::string& message, Fields fields = {}) {
    write(spdlog::level::err, message, fields);
}

}

using logging::debug;
using logging::error;
using logging::info;
using logging::kv;
using logging::warn;

}
