#pragma once

#include <memory>
#include <string>
#include "obfsconn/net/conn.hpp"
#include "obfsconn/obfs/registry.hpp"

namespace obfsconn::obfs {

// Run the client side of the transport registered for address over an
// already connected conn.
[[nodiscard]] common::Result<std::shared_ptr<net::Conn>>
client_conn(const Registry& registry, const std::string& address,
            std::shared_ptr<net::Conn> conn);

// Strip the transport registered for address from an accepted conn.
[[nodiscard]] common::Result<std::shared_ptr<net::Conn>>
server_conn(const Registry& registry, const std::string& address,
            std::shared_ptr<net::Conn> conn);

}  // namespace obfsconn::obfs
