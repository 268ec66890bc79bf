#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <utility>
#include <vector>

namespace clob {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::string url_encode(const std::string& value);

QueryParams filter_empty(const QueryParams& params);

std::string build_query_string(const QueryParams& params);

std::string to_upper_copy(std::string value);

std::string trim_copy(std::string value);

// Fixed-point rendering for prices and sizes sent to the venue.
std::string format_decimal(double value, int precision);

std::string base64_encode(const std::string& raw);

// Accepts both the standard and the url-safe alphabet. Throws std::invalid_argument.
std::string base64_decode(std::string encoded);

std::string to_base64url(std::string encoded);

// Venue payloads carry numbers as strings or numbers depending on the endpoint.
double parse_double_optional(const nlohmann::json& value, double fallback = 0.0);

double get_double_optional(const nlohmann::json& obj, const char* key, double fallback = 0.0);

std::string get_string_optional(const nlohmann::json& obj, const char* key);

bool get_bool_optional(const nlohmann::json& obj, const char* key, bool fallback = false);

} // namespace clob
