#include "obfsconn/transport/pt_transport.hpp"
#include "obfsconn/common/logging.hpp"
#include "obfsconn/net/tcp.hpp"
#include "obfsconn/obfs/pt_conn.hpp"

namespace obfsconn::transport {

common::Result<std::shared_ptr<net::Conn>>
PtTransporter::handshake(std::shared_ptr<net::Conn> conn, const HandshakeOptions& options) {
    if (options.addr.empty()) {
        return common::fail(config::ConfigError::MissingAddress, registry_.transport().name());
    }
    return obfs::client_conn(registry_, options.addr, std::move(conn));
}

common::Result<std::unique_ptr<PtListener>>
PtListener::listen(boost::asio::io_context& io, const obfs::Registry& registry,
                   std::string_view address) {
    auto ln = net::TcpListener::listen(io, address);
    if (!ln) return std::unexpected(ln.error());
    return std::make_unique<PtListener>(registry, std::string(address), std::move(*ln));
}

PtListener::PtListener(const obfs::Registry& registry, std::string address,
                       std::unique_ptr<net::Listener> inner)
    : registry_(registry), addr_(std::move(address)), inner_(std::move(inner)) {}

common::Result<std::shared_ptr<net::Conn>> PtListener::accept() {
    auto conn = inner_->accept();
    if (!conn) return std::unexpected(conn.error());

    auto raw = *conn;
    auto wrapped = obfs::server_conn(registry_, addr_, raw);
    if (!wrapped) {
        OBFSCONN_LOG_WARN("[{}] {} -> {}: {}", registry_.transport().name(),
                          raw->remote_address(), addr_, wrapped.error().message());
        raw->close();
        return std::unexpected(wrapped.error());
    }
    return wrapped;
}

}  // namespace obfsconn::transport
