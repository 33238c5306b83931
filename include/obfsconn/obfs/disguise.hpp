#pragma once

#include <atomic>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include "obfsconn/net/conn.hpp"
#include "obfsconn/obfs/role.hpp"

namespace obfsconn::obfs {

enum class DisguiseError {
    MalformedMessage = 1,  // request/response could not be parsed
    ConnectionClosed,      // peer closed before a full header arrived
    UnexpectedStatus,      // server answered with a status other than 200
};

[[nodiscard]] std::string disguise_error_message(DisguiseError err);

const std::error_category& disguise_category();
std::error_code make_error_code(DisguiseError err);

constexpr std::string_view DEFAULT_USER_AGENT =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/60.0.3112.90 Safari/537.36";
constexpr std::string_view DECOY_HOST = "www.baidu.com";

// Canned server reply, sent whatever the request was
constexpr std::string_view DISGUISE_RESPONSE =
    "HTTP/1.1 200 OK\r\nContent-Type: text/html; charset=utf-8\r\n\r\n";

using DecoyRequest = boost::beast::http::request<boost::beast::http::string_body>;

// POST / to host with the given User-Agent and an empty body
[[nodiscard]] DecoyRequest make_decoy_request(std::string_view host = DECOY_HOST,
                                              std::string_view user_agent = DEFAULT_USER_AGENT);

// Connection wrapper that disguises the opening of a stream as an HTTP
// exchange. The exchange runs once, on the first read or write (or an
// explicit handshake() call); afterwards bytes pass through unchanged.
//
// Concurrent first reads/writes block until the single handshake resolves.
// A failed handshake is permanent: every later call returns the same error.
class DisguiseConn : public net::Conn {
public:
    enum class State {
        Uninitialized,
        Handshaking,
        Handshaked,
        Failed,
    };

    DisguiseConn(std::shared_ptr<net::Conn> conn, Role role,
                 std::optional<DecoyRequest> request = std::nullopt);

    DisguiseConn(const DisguiseConn&) = delete;
    DisguiseConn& operator=(const DisguiseConn&) = delete;

    [[nodiscard]] common::Result<void> handshake();

    common::Result<size_t> read(std::span<uint8_t> buf) override;
    common::Result<size_t> write(std::span<const uint8_t> data) override;
    void close() override;

    std::string local_address() const override { return conn_->local_address(); }
    std::string remote_address() const override { return conn_->remote_address(); }

    [[nodiscard]] State state() const { return state_.load(); }
    [[nodiscard]] Role role() const { return role_; }

    // Client: the request sent. Server: the request received.
    // Only meaningful once handshaked.
    [[nodiscard]] const std::optional<DecoyRequest>& request() const { return request_; }

private:
    common::Result<void> server_handshake();
    common::Result<void> client_handshake();

    std::shared_ptr<net::Conn> conn_;
    Role role_;
    std::optional<DecoyRequest> request_;

    std::mutex handshake_mutex_;
    std::atomic<State> state_{State::Uninitialized};
    std::optional<common::Error> failure_;

    // Bytes that arrived behind the HTTP header
    std::mutex buffer_mutex_;
    boost::beast::flat_buffer buffer_;
};

}  // namespace obfsconn::obfs

template<>
struct std::is_error_code_enum<obfsconn::obfs::DisguiseError> : std::true_type {};
