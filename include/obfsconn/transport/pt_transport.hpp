#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>
#include <string>
#include <string_view>
#include "obfsconn/net/conn.hpp"
#include "obfsconn/obfs/registry.hpp"
#include "obfsconn/transport/transporter.hpp"

namespace obfsconn::transport {

// Client side of a pluggable transport. options.addr selects the
// registry context to dial with.
class PtTransporter : public Transporter {
public:
    explicit PtTransporter(const obfs::Registry& registry) : registry_(registry) {}

    common::Result<std::shared_ptr<net::Conn>>
    handshake(std::shared_ptr<net::Conn> conn, const HandshakeOptions& options) override;

private:
    const obfs::Registry& registry_;
};

// Server side of a pluggable transport, bound to one registry address.
// A connection whose handshake fails is closed and its error returned;
// the listener stays usable.
class PtListener : public net::Listener {
public:
    [[nodiscard]] static common::Result<std::unique_ptr<PtListener>>
    listen(boost::asio::io_context& io, const obfs::Registry& registry, std::string_view address);

    PtListener(const obfs::Registry& registry, std::string address,
               std::unique_ptr<net::Listener> inner);

    common::Result<std::shared_ptr<net::Conn>> accept() override;
    void close() override { inner_->close(); }
    std::string address() const override { return addr_; }

private:
    const obfs::Registry& registry_;
    std::string addr_;
    std::unique_ptr<net::Listener> inner_;
};

}  // namespace obfsconn::transport
