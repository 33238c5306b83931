#include "obfsconn/transport/http_disguise.hpp"
#include "obfsconn/net/tcp.hpp"
#include "obfsconn/obfs/disguise.hpp"

namespace obfsconn::transport {

common::Result<std::shared_ptr<net::Conn>>
HttpDisguiseTransporter::handshake(std::shared_ptr<net::Conn> conn, const HandshakeOptions& options) {
    std::optional<obfs::DecoyRequest> request;
    if (!options.host.empty() || !options.user_agent.empty()) {
        request = obfs::make_decoy_request(
            options.host.empty() ? obfs::DECOY_HOST : std::string_view(options.host),
            options.user_agent.empty() ? obfs::DEFAULT_USER_AGENT : std::string_view(options.user_agent));
    }
    return std::make_shared<obfs::DisguiseConn>(std::move(conn), obfs::Role::Client, std::move(request));
}

common::Result<std::unique_ptr<HttpDisguiseListener>>
HttpDisguiseListener::listen(boost::asio::io_context& io, std::string_view address) {
    auto ln = net::TcpListener::listen(io, address, true);
    if (!ln) return std::unexpected(ln.error());
    return std::make_unique<HttpDisguiseListener>(std::move(*ln));
}

HttpDisguiseListener::HttpDisguiseListener(std::unique_ptr<net::Listener> inner)
    : inner_(std::move(inner)) {}

common::Result<std::shared_ptr<net::Conn>> HttpDisguiseListener::accept() {
    auto conn = inner_->accept();
    if (!conn) return std::unexpected(conn.error());
    return std::make_shared<obfs::DisguiseConn>(std::move(*conn), obfs::Role::Server);
}

}  // namespace obfsconn::transport
