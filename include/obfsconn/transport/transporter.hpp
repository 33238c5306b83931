#pragma once

#include <memory>
#include <string>
#include "obfsconn/net/conn.hpp"

namespace obfsconn::transport {

struct HandshakeOptions {
    std::string addr;        // target node address, the registry key
    std::string host;        // HTTP disguise: Host header override
    std::string user_agent;  // HTTP disguise: User-Agent override
};

// Turns an established raw connection into an obfuscated one.
class Transporter {
public:
    virtual ~Transporter() = default;

    [[nodiscard]] virtual common::Result<std::shared_ptr<net::Conn>>
    handshake(std::shared_ptr<net::Conn> conn, const HandshakeOptions& options) = 0;
};

}  // namespace obfsconn::transport
