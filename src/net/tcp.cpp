#include "obfsconn/net/tcp.hpp"
#include "obfsconn/common/logging.hpp"
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/v6_only.hpp>
#include <boost/asio/write.hpp>
#include <sys/socket.h>
#include <vector>

namespace obfsconn::net {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

std::unexpected<common::Error> transport_error(const boost::system::error_code& ec,
                                               std::string detail = {}) {
    return std::unexpected(common::Error(static_cast<std::error_code>(ec), std::move(detail)));
}

std::string endpoint_string(const tcp::endpoint& ep) {
    auto addr = ep.address();
    auto port = std::to_string(ep.port());
    if (addr.is_v6()) return "[" + addr.to_string() + "]:" + port;
    return addr.to_string() + ":" + port;
}

std::string endpoint_string(const tcp::socket& socket, bool remote) {
    boost::system::error_code ec;
    auto ep = remote ? socket.remote_endpoint(ec) : socket.local_endpoint(ec);
    if (ec) return {};
    return endpoint_string(ep);
}

// open + bind + listen; the wildcard IPv6 socket also takes IPv4 peers
void bind_acceptor(tcp::acceptor& acceptor, const tcp::endpoint& endpoint, bool dual_stack,
                   boost::system::error_code& ec) {
    acceptor.open(endpoint.protocol(), ec);
    if (!ec && dual_stack) acceptor.set_option(asio::ip::v6_only(false), ec);
    if (!ec) acceptor.set_option(tcp::acceptor::reuse_address(true), ec);
    if (!ec) acceptor.bind(endpoint, ec);
    if (!ec) acceptor.listen(asio::socket_base::max_listen_connections, ec);
    if (ec) {
        boost::system::error_code ignored;
        acceptor.close(ignored);
    }
}

}  // namespace

common::Result<std::pair<std::string, std::string>>
split_host_port(std::string_view address) {
    auto colon = address.rfind(':');
    if (colon == std::string_view::npos || colon + 1 == address.size()) {
        return std::unexpected(common::Error(
            std::make_error_code(std::errc::invalid_argument), std::string(address)));
    }
    auto host = address.substr(0, colon);
    auto port = address.substr(colon + 1);
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        host = host.substr(1, host.size() - 2);
    }
    return std::make_pair(std::string(host), std::string(port));
}

// --- TcpConn ---

TcpConn::TcpConn(tcp::socket socket)
    : socket_(std::move(socket)),
      local_(endpoint_string(socket_, false)),
      remote_(endpoint_string(socket_, true)) {}

TcpConn::~TcpConn() {
    close();
}

common::Result<size_t> TcpConn::read(std::span<uint8_t> buf) {
    boost::system::error_code ec;
    size_t n = socket_.read_some(asio::buffer(buf.data(), buf.size()), ec);
    if (ec == asio::error::eof) return 0;
    if (ec) return transport_error(ec, remote_);
    return n;
}

common::Result<size_t> TcpConn::write(std::span<const uint8_t> data) {
    boost::system::error_code ec;
    size_t n = asio::write(socket_, asio::buffer(data.data(), data.size()), ec);
    if (ec) return transport_error(ec, remote_);
    return n;
}

// shutdown() wakes a read or write blocked in another thread
void TcpConn::close() {
    if (closed_.exchange(true)) return;
    ::shutdown(socket_.native_handle(), SHUT_RDWR);
    boost::system::error_code ec;
    socket_.close(ec);
}

common::Result<void> TcpConn::set_keep_alive(bool enabled) {
    boost::system::error_code ec;
    socket_.set_option(asio::socket_base::keep_alive(enabled), ec);
    if (ec) return transport_error(ec, remote_);
    return {};
}

// --- TcpListener ---

common::Result<std::unique_ptr<TcpListener>>
TcpListener::listen(asio::io_context& io, std::string_view address, bool keep_alive) {
    auto hp = split_host_port(address);
    if (!hp) return std::unexpected(hp.error());
    auto& [host, port] = *hp;

    boost::system::error_code ec;
    tcp::resolver resolver(io);
    std::vector<tcp::endpoint> candidates;
    if (host.empty()) {
        // Any address: dual-stack where IPv6 is available, IPv4 otherwise
        for (auto family : {tcp::v6(), tcp::v4()}) {
            auto results = resolver.resolve(family, host, port, tcp::resolver::passive, ec);
            if (ec) continue;
            for (const auto& entry : results) candidates.push_back(entry.endpoint());
        }
    } else {
        auto results = resolver.resolve(host, port, tcp::resolver::passive, ec);
        if (ec) return transport_error(ec, std::string(address));
        for (const auto& entry : results) candidates.push_back(entry.endpoint());
    }
    if (candidates.empty()) {
        if (!ec) ec = asio::error::host_not_found;
        return transport_error(ec, std::string(address));
    }

    tcp::acceptor acceptor(io);
    for (const auto& endpoint : candidates) {
        bind_acceptor(acceptor, endpoint, host.empty() && endpoint.address().is_v6(), ec);
        if (!ec) break;
    }
    if (ec) return transport_error(ec, std::string(address));

    return std::make_unique<TcpListener>(std::move(acceptor), keep_alive);
}

TcpListener::TcpListener(tcp::acceptor acceptor, bool keep_alive)
    : acceptor_(std::move(acceptor)), keep_alive_(keep_alive) {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    if (!ec) {
        address_ = endpoint_string(ep);
        port_ = ep.port();
    }
}

TcpListener::~TcpListener() {
    close();
}

common::Result<std::shared_ptr<Conn>> TcpListener::accept() {
    if (closed_) return transport_error(asio::error::operation_aborted, address_);

    boost::system::error_code ec;
    tcp::socket socket(acceptor_.get_executor());
    acceptor_.accept(socket, ec);
    if (closed_) return transport_error(asio::error::operation_aborted, address_);
    if (ec) return transport_error(ec, address_);

    auto conn = std::make_shared<TcpConn>(std::move(socket));
    if (keep_alive_) {
        auto ka = conn->set_keep_alive(true);
        if (!ka) {
            OBFSCONN_LOG_WARN("[tcp] {}: keep-alive: {}", conn->remote_address(),
                              ka.error().message());
        }
    }
    return conn;
}

// Closing alone does not wake a thread blocked in accept(); shutdown() does
void TcpListener::close() {
    if (closed_.exchange(true)) return;
    ::shutdown(acceptor_.native_handle(), SHUT_RDWR);
    boost::system::error_code ec;
    acceptor_.close(ec);
}

common::Result<std::shared_ptr<Conn>>
tcp_dial(asio::io_context& io, std::string_view address) {
    auto hp = split_host_port(address);
    if (!hp) return std::unexpected(hp.error());

    boost::system::error_code ec;
    tcp::resolver resolver(io);
    auto results = resolver.resolve(hp->first, hp->second, ec);
    if (ec) return transport_error(ec, std::string(address));

    tcp::socket socket(io);
    asio::connect(socket, results, ec);
    if (ec) return transport_error(ec, std::string(address));

    return std::make_shared<TcpConn>(std::move(socket));
}

}  // namespace obfsconn::net
