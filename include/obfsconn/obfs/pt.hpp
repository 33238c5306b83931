#pragma once

#include <any>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include "obfsconn/common/error.hpp"
#include "obfsconn/config/args.hpp"
#include "obfsconn/net/conn.hpp"

// Boundary to a pluggable-transport implementation (obfs4 and friends).
// The framing protocol itself lives behind these interfaces.
namespace obfsconn::obfs {

using DialFn = std::function<common::Result<std::shared_ptr<net::Conn>>(
    std::string_view network, std::string_view address)>;

class ClientFactory {
public:
    virtual ~ClientFactory() = default;

    // Parse transport options into opaque client arguments
    [[nodiscard]] virtual common::Result<std::any> parse_args(const config::Args& options) = 0;

    // Open a connection through dial_fn and wrap it in the transport protocol
    [[nodiscard]] virtual common::Result<std::shared_ptr<net::Conn>>
    dial(std::string_view network, std::string_view address,
         const DialFn& dial_fn, const std::any& args) = 0;
};

class ServerFactory {
public:
    virtual ~ServerFactory() = default;

    // Arguments a client needs to reach this server (cert, iat-mode, ...)
    [[nodiscard]] virtual const config::Args& args() const = 0;

    // Run the server side of the protocol on an accepted connection
    [[nodiscard]] virtual common::Result<std::shared_ptr<net::Conn>>
    wrap_conn(std::shared_ptr<net::Conn> conn) = 0;
};

class Transport {
public:
    virtual ~Transport() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    [[nodiscard]] virtual common::Result<std::shared_ptr<ClientFactory>>
    client_factory(const std::string& state_dir) = 0;

    [[nodiscard]] virtual common::Result<std::shared_ptr<ServerFactory>>
    server_factory(const std::string& state_dir, const config::Args& options) = 0;
};

}  // namespace obfsconn::obfs
