#include "json_utils.hpp"
#include <cmath>
#include <memory>

namespace json_field {

const Json::Value& get(const Json::Value& v, const char* key) {
    if (!v.isObject()) return Json::Value::nullSingleton();
    const Json::Value* found = v.find(key, key + std::char_traits<char>::length(key));
    return found ? *found : Json::Value::nullSingleton();
}

std::string str(const Json::Value& v, const char* key, const std::string& fallback) {
    const auto& f = get(v, key);
    if (f.isString()) return f.asString();
    if (f.isNumeric() || f.isBool()) return f.asString();
    return fallback;
}

int64_t i64(const Json::Value& v, const char* key, int64_t fallback) {
    auto r = opt_i64(v, key);
    return r ? *r : fallback;
}

double num(const Json::Value& v, const char* key, double fallback) {
    const auto& f = get(v, key);
    return f.isNumeric() ? f.asDouble() : fallback;
}

bool boolean(const Json::Value& v, const char* key, bool fallback) {
    const auto& f = get(v, key);
    if (f.isBool()) return f.asBool();
    if (f.isNumeric()) return f.asDouble() != 0.0;
    return fallback;
}

std::optional<int64_t> opt_i64(const Json::Value& v, const char* key) {
    const auto& f = get(v, key);
    if (f.isInt64()) return f.asInt64();
    if (!f.isNumeric()) return std::nullopt;

    // 2^63 is exact in a double; anything at or beyond it does not fit
    double d = f.asDouble();
    if (!std::isfinite(d) || d < -9223372036854775808.0 || d >= 9223372036854775808.0) {
        return std::nullopt;
    }
    return static_cast<int64_t>(d);
}

} // namespace json_field

bool parse_json(const std::string& text, Json::Value& out, std::string& error) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    const char* begin = text.data();
    if (!reader->parse(begin, begin + text.size(), &out, &errs)) {
        error = errs.empty() ? "invalid JSON" : errs;
        while (!error.empty() && (error.back() == '\n' || error.back() == ' ')) {
            error.pop_back();
        }
        return false;
    }
    return true;
}

std::string to_json(const Json::Value& v) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, v);
}
