#include "obfsconn/config/node.hpp"

namespace obfsconn::config {

std::string state_dir(const Args& options) {
    return options.get_or("state-dir", std::string(DEFAULT_STATE_DIR));
}

std::string Node::state_dir() const {
    return config::state_dir(values);
}

common::Result<Node> Node::parse(std::string_view url) {
    auto sep = url.find("://");
    if (sep == std::string_view::npos || sep == 0) {
        return common::fail(ConfigError::InvalidNodeUrl, std::string(url));
    }

    Node node;
    auto scheme = url.substr(0, sep);
    auto plus = scheme.find('+');
    if (plus == std::string_view::npos) {
        node.protocol = std::string(scheme);
        node.transport = std::string(scheme);
    } else {
        node.protocol = std::string(scheme.substr(0, plus));
        node.transport = std::string(scheme.substr(plus + 1));
    }

    auto rest = url.substr(sep + 3);
    std::string_view query;
    auto q = rest.find('?');
    if (q != std::string_view::npos) {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }
    auto slash = rest.find('/');
    if (slash != std::string_view::npos) {
        rest = rest.substr(0, slash);
    }
    // user:pass@ is not used by obfuscating transports
    auto at = rest.rfind('@');
    if (at != std::string_view::npos) {
        rest = rest.substr(at + 1);
    }
    if (rest.empty() || rest.find(':') == std::string_view::npos) {
        return common::fail(ConfigError::InvalidNodeUrl, std::string(url));
    }
    node.addr = std::string(rest);

    auto values = Args::parse_query(query);
    if (!values) {
        return std::unexpected(values.error());
    }
    node.values = std::move(*values);

    return node;
}

}  // namespace obfsconn::config
