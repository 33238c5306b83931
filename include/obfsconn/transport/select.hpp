#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>
#include <string_view>
#include "obfsconn/config/node.hpp"
#include "obfsconn/net/conn.hpp"
#include "obfsconn/obfs/registry.hpp"
#include "obfsconn/transport/transporter.hpp"

namespace obfsconn::transport {

constexpr std::string_view HTTP_DISGUISE = "ohttp";

// Pick the transporter for node.transport: "ohttp" for the HTTP disguise,
// the registry transport's name for the pluggable transport.
// registry may be null when only "ohttp" is in use.
[[nodiscard]] common::Result<std::unique_ptr<Transporter>>
make_transporter(const config::Node& node, const obfs::Registry* registry);

// Listening counterpart of make_transporter, bound to node.addr
[[nodiscard]] common::Result<std::unique_ptr<net::Listener>>
listen(boost::asio::io_context& io, const config::Node& node, const obfs::Registry* registry);

}  // namespace obfsconn::transport
