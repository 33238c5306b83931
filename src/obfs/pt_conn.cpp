#include "obfsconn/obfs/pt_conn.hpp"

namespace obfsconn::obfs {

common::Result<std::shared_ptr<net::Conn>>
client_conn(const Registry& registry, const std::string& address,
            std::shared_ptr<net::Conn> conn) {
    auto ctx = registry.client_context(address);
    if (!ctx) return std::unexpected(ctx.error());

    // The transport wants to dial by itself; hand it the socket we already have.
    DialFn pseudo_dial = [conn](std::string_view, std::string_view)
        -> common::Result<std::shared_ptr<net::Conn>> {
        return conn;
    };
    return ctx->factory->dial("tcp", "", pseudo_dial, ctx->args);
}

common::Result<std::shared_ptr<net::Conn>>
server_conn(const Registry& registry, const std::string& address,
            std::shared_ptr<net::Conn> conn) {
    auto ctx = registry.server_context(address);
    if (!ctx) return std::unexpected(ctx.error());

    return ctx->factory->wrap_conn(std::move(conn));
}

}  // namespace obfsconn::obfs
