#pragma once

#include <boost/asio/io_context.hpp>
#include <memory>
#include <string_view>
#include "obfsconn/net/conn.hpp"
#include "obfsconn/transport/transporter.hpp"

namespace obfsconn::transport {

// Client side of the HTTP disguise. The exchange itself is deferred to
// the first read or write on the returned connection.
class HttpDisguiseTransporter : public Transporter {
public:
    common::Result<std::shared_ptr<net::Conn>>
    handshake(std::shared_ptr<net::Conn> conn, const HandshakeOptions& options) override;
};

// Server side of the HTTP disguise: every accepted connection is wrapped,
// the exchange runs on its first read or write.
class HttpDisguiseListener : public net::Listener {
public:
    [[nodiscard]] static common::Result<std::unique_ptr<HttpDisguiseListener>>
    listen(boost::asio::io_context& io, std::string_view address);

    explicit HttpDisguiseListener(std::unique_ptr<net::Listener> inner);

    common::Result<std::shared_ptr<net::Conn>> accept() override;
    void close() override { inner_->close(); }
    std::string address() const override { return inner_->address(); }

private:
    std::unique_ptr<net::Listener> inner_;
};

}  // namespace obfsconn::transport
