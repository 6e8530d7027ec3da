#include "utils.hpp"
#include "credentials.hpp"
#include <cstdlib>
#include <regex>

std::string get_local_operator() {
    auto result = CredentialManager::instance().get("operator");
    if (result.is_ok() && !result.value.empty()) {
        return result.value;
    }
    const char* user = std::getenv("USER");
    return user ? std::string(user) : "unknown";
}

bool is_all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

std::string utf8_prefix(const std::string& s, size_t max_chars) {
    size_t chars = 0;
    for (size_t i = 0; i < s.size(); ++i) {
        // Continuation bytes belong to the character already counted
        if ((static_cast<unsigned char>(s[i]) & 0xC0) == 0x80) continue;
        if (chars == max_chars) return s.substr(0, i);
        ++chars;
    }
    return s;
}

static const char HEX_CHARS[] = "0123456789ABCDEF";

std::string url_encode(const std::string& s) {
    std::string out;
    out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += HEX_CHARS[c >> 4];
            out += HEX_CHARS[c & 0x0F];
        }
    }
    return out;
}

std::string extract_operator_id(const std::string& raw) {
    std::string id = raw;
    trim(id);

    static const std::regex cq_at(R"(\[CQ:at,qq=(\d+)\])");
    static const std::regex custom_at(R"(\[At:(\d+)\])");
    static const std::regex paren_id(R"(\((\d+)\))");

    std::smatch m;
    if (std::regex_search(id, m, cq_at)) return m[1].str();
    if (std::regex_search(id, m, custom_at)) return m[1].str();
    if (std::regex_search(id, m, paren_id)) return m[1].str();

    return id;
}
