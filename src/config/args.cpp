#include "obfsconn/config/args.hpp"
#include <algorithm>

namespace obfsconn::config {

namespace {

class ConfigCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "obfsconn.config"; }
    std::string message(int ev) const override {
        return config_error_message(static_cast<ConfigError>(ev));
    }
};

bool is_unreserved(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' || c == '~';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

std::string config_error_message(ConfigError err) {
    switch (err) {
        case ConfigError::InvalidNodeUrl: return "invalid node url";
        case ConfigError::InvalidQuery: return "invalid query string";
        case ConfigError::MissingAddress: return "missing target address";
        case ConfigError::UnknownTransport: return "unknown transport";
        default: return "unknown config error";
    }
}

const std::error_category& config_category() {
    static const ConfigCategory category;
    return category;
}

std::error_code make_error_code(ConfigError err) {
    return {static_cast<int>(err), config_category()};
}

void Args::add(const std::string& key, std::string value) {
    values_[key].push_back(std::move(value));
}

void Args::set(const std::string& key, std::string value) {
    values_[key] = {std::move(value)};
}

std::optional<std::string> Args::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) return std::nullopt;
    return it->second.front();
}

std::string Args::get_or(const std::string& key, std::string fallback) const {
    auto value = get(key);
    if (!value || value->empty()) return fallback;
    return *value;
}

bool Args::contains(const std::string& key) const {
    return values_.contains(key);
}

std::string query_escape(std::string_view s) {
    static const char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (is_unreserved(static_cast<char>(c))) {
            out += static_cast<char>(c);
        } else if (c == ' ') {
            out += '+';
        } else {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0f];
        }
    }
    return out;
}

std::optional<std::string> query_unescape(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '+') {
            out += ' ';
        } else if (c == '%') {
            if (i + 2 >= s.size()) return std::nullopt;
            int hi = hex_value(s[i + 1]);
            int lo = hex_value(s[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out += static_cast<char>((hi << 4) | lo);
            i += 2;
        } else {
            out += c;
        }
    }
    return out;
}

std::string Args::encode() const {
    std::string out;
    for (const auto& [key, values] : values_) {
        auto k = query_escape(key);
        for (const auto& v : values) {
            if (!out.empty()) out += '&';
            out += k;
            out += '=';
            out += query_escape(v);
        }
    }
    return out;
}

common::Result<Args> Args::parse_query(std::string_view query) {
    Args args;
    while (!query.empty()) {
        auto amp = query.find('&');
        auto pair = query.substr(0, amp);
        query = (amp == std::string_view::npos) ? std::string_view{} : query.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        auto key = query_unescape(pair.substr(0, eq));
        auto value = (eq == std::string_view::npos)
            ? std::optional<std::string>("")
            : query_unescape(pair.substr(eq + 1));
        if (!key || !value) {
            return common::fail(ConfigError::InvalidQuery, std::string(pair));
        }
        args.add(*key, std::move(*value));
    }
    return args;
}

}  // namespace obfsconn::config
