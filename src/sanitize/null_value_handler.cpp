#include "pathsafe/null_value_handler.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>

namespace pathsafe {

namespace {

struct HandlerEntry {
    NullValueStrategy strategy;
    std::optional<std::string> (*handler)(const ValidationError&);
};

const HandlerEntry kHandlers[] = {
    {NullValueStrategy::ReturnEmpty, &return_null_string},
    {NullValueStrategy::Raise, &raise_error},
    {NullValueStrategy::Timestamp, &return_timestamp},
};

} // namespace

std::optional<NullValueStrategy> parse_null_value_strategy(const std::string& s) {
    std::string key = s;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (const auto& entry : kHandlers) {
        if (key == null_value_strategy_to_string(entry.strategy)) {
            return entry.strategy;
        }
    }
    return std::nullopt;
}

std::optional<std::string> return_null_string(const ValidationError& /* e */) {
    return std::string();
}

std::optional<std::string> raise_error(const ValidationError& /* e */) {
    return std::nullopt;
}

std::optional<std::string> return_timestamp(const ValidationError& /* e */) {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now).count();

    std::ostringstream out;
    out << (micros / 1000000) << '.' << std::setw(6) << std::setfill('0') << (micros % 1000000);
    return out.str();
}

NullValueHandler get_null_value_handler(NullValueStrategy strategy) {
    for (const auto& entry : kHandlers) {
        if (entry.strategy == strategy) {
            return entry.handler;
        }
    }
    return &return_null_string;
}

} // namespace pathsafe
