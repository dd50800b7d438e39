#pragma once
#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

namespace fitz::cfgvalidate {
using Value = std::variant<bool, int64_t, double, std::string, std::vector<std::string>>;

// Dotted segments of [a-z0-9_]+, no empty segments.
bool isValidKey(const std::string& key);

nlohmann::json toJson(const Value& v);
}
