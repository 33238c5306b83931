#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <atomic>
#include <memory>
#include <string>
#include <string_view>
#include "obfsconn/net/conn.hpp"

namespace obfsconn::net {

// Split "host:port" / "[v6]:port". Empty host means any address.
[[nodiscard]] common::Result<std::pair<std::string, std::string>>
split_host_port(std::string_view address);

// Blocking TCP connection
class TcpConn : public Conn {
public:
    explicit TcpConn(boost::asio::ip::tcp::socket socket);
    ~TcpConn() override;

    TcpConn(const TcpConn&) = delete;
    TcpConn& operator=(const TcpConn&) = delete;

    common::Result<size_t> read(std::span<uint8_t> buf) override;
    common::Result<size_t> write(std::span<const uint8_t> data) override;
    void close() override;

    std::string local_address() const override { return local_; }
    std::string remote_address() const override { return remote_; }

    [[nodiscard]] common::Result<void> set_keep_alive(bool enabled);

private:
    boost::asio::ip::tcp::socket socket_;
    std::atomic<bool> closed_{false};
    std::string local_;
    std::string remote_;
};

// Blocking TCP listener. close() may be called from another thread to
// stop a pending accept().
class TcpListener : public Listener {
public:
    // keep_alive is applied to every accepted connection
    [[nodiscard]] static common::Result<std::unique_ptr<TcpListener>>
    listen(boost::asio::io_context& io, std::string_view address, bool keep_alive = false);

    TcpListener(boost::asio::ip::tcp::acceptor acceptor, bool keep_alive);
    ~TcpListener() override;

    common::Result<std::shared_ptr<Conn>> accept() override;
    void close() override;
    std::string address() const override { return address_; }

    [[nodiscard]] uint16_t port() const { return port_; }

private:
    boost::asio::ip::tcp::acceptor acceptor_;
    std::atomic<bool> closed_{false};
    bool keep_alive_;
    std::string address_;
    uint16_t port_ = 0;
};

[[nodiscard]] common::Result<std::shared_ptr<Conn>>
tcp_dial(boost::asio::io_context& io, std::string_view address);

}  // namespace obfsconn::net
