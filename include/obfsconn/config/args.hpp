#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include "obfsconn/common/error.hpp"

namespace obfsconn::config {

enum class ConfigError {
    InvalidNodeUrl = 1,
    InvalidQuery,
    MissingAddress,
    UnknownTransport,
};

[[nodiscard]] std::string config_error_message(ConfigError err);

const std::error_category& config_category();
std::error_code make_error_code(ConfigError err);

// Multi-valued key/value options (node query, transport arguments).
class Args {
public:
    using Map = std::map<std::string, std::vector<std::string>>;

    Args() = default;
    Args(std::initializer_list<std::pair<const std::string, std::vector<std::string>>> init)
        : values_(init) {}

    void add(const std::string& key, std::string value);
    void set(const std::string& key, std::string value);

    // First value for key
    [[nodiscard]] std::optional<std::string> get(const std::string& key) const;
    [[nodiscard]] std::string get_or(const std::string& key, std::string fallback) const;
    [[nodiscard]] bool contains(const std::string& key) const;

    [[nodiscard]] bool empty() const { return values_.empty(); }
    [[nodiscard]] const Map& values() const { return values_; }

    // URL query form, keys sorted: "a=1&b=x+y&b=%2F"
    [[nodiscard]] std::string encode() const;

    // Inverse of encode()
    [[nodiscard]] static common::Result<Args> parse_query(std::string_view query);

    bool operator==(const Args&) const = default;

private:
    Map values_;
};

[[nodiscard]] std::string query_escape(std::string_view s);
[[nodiscard]] std::optional<std::string> query_unescape(std::string_view s);

}  // namespace obfsconn::config

template<>
struct std::is_error_code_enum<obfsconn::config::ConfigError> : std::true_type {};
