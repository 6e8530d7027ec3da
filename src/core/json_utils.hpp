#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <json/json.h>

// Tolerant accessors over jsoncpp values. The panel API omits or retypes
// fields between versions, so every lookup here degrades to a fallback
// instead of asserting.
namespace json_field {

// Member `key` of `v`, or a null value if `v` is not an object.
const Json::Value& get(const Json::Value& v, const char* key);

std::string str(const Json::Value& v, const char* key, const std::string& fallback = "");
int64_t i64(const Json::Value& v, const char* key, int64_t fallback = 0);
double num(const Json::Value& v, const char* key, double fallback = 0.0);
bool boolean(const Json::Value& v, const char* key, bool fallback = false);

// Integer member if present and numeric, std::nullopt otherwise.
std::optional<int64_t> opt_i64(const Json::Value& v, const char* key);

} // namespace json_field

// Parse a JSON document. Returns false and fills `error` on failure.
bool parse_json(const std::string& text, Json::Value& out, std::string& error);

// Compact single-line serialization.
std::string to_json(const Json::Value& v);
