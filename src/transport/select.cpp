#include "obfsconn/transport/select.hpp"
#include "obfsconn/transport/http_disguise.hpp"
#include "obfsconn/transport/pt_transport.hpp"

namespace obfsconn::transport {

namespace {

bool is_pt(const config::Node& node, const obfs::Registry* registry) {
    return registry != nullptr && node.transport == registry->transport().name();
}

}  // namespace

common::Result<std::unique_ptr<Transporter>>
make_transporter(const config::Node& node, const obfs::Registry* registry) {
    if (node.transport == HTTP_DISGUISE) {
        return std::make_unique<HttpDisguiseTransporter>();
    }
    if (is_pt(node, registry)) {
        return std::make_unique<PtTransporter>(*registry);
    }
    return common::fail(config::ConfigError::UnknownTransport, node.transport);
}

common::Result<std::unique_ptr<net::Listener>>
listen(boost::asio::io_context& io, const config::Node& node, const obfs::Registry* registry) {
    if (node.transport == HTTP_DISGUISE) {
        auto ln = HttpDisguiseListener::listen(io, node.addr);
        if (!ln) return std::unexpected(ln.error());
        return std::move(*ln);
    }
    if (is_pt(node, registry)) {
        auto ln = PtListener::listen(io, *registry, node.addr);
        if (!ln) return std::unexpected(ln.error());
        return std::move(*ln);
    }
    return common::fail(config::ConfigError::UnknownTransport, node.transport);
}

}  // namespace obfsconn::transport
