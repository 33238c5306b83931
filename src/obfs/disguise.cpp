#include "obfsconn/obfs/disguise.hpp"
#include "obfsconn/common/logging.hpp"
#include "obfsconn/net/stream.hpp"
#include <boost/asio/buffer.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <sstream>

namespace obfsconn::obfs {

namespace http = boost::beast::http;

namespace {

class DisguiseCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "obfsconn.disguise"; }
    std::string message(int ev) const override {
        return disguise_error_message(static_cast<DisguiseError>(ev));
    }
};

template<class Header>
std::string dump(const Header& header) {
    std::ostringstream os;
    os << header;
    return os.str();
}

// A Conn failure seen by the adapter wins over whatever Beast made of it
common::Error stream_error(const net::StreamAdapter& stream, const boost::system::error_code& ec) {
    if (stream.last_error()) return *stream.last_error();
    if (ec == http::error::end_of_stream) {
        return common::Error(make_error_code(DisguiseError::ConnectionClosed), ec.message());
    }
    return common::Error(make_error_code(DisguiseError::MalformedMessage), ec.message());
}

}  // namespace

std::string disguise_error_message(DisguiseError err) {
    switch (err) {
        case DisguiseError::MalformedMessage: return "malformed HTTP message";
        case DisguiseError::ConnectionClosed: return "connection closed during handshake";
        case DisguiseError::UnexpectedStatus: return "unexpected HTTP status";
        default: return "unknown disguise error";
    }
}

const std::error_category& disguise_category() {
    static const DisguiseCategory category;
    return category;
}

std::error_code make_error_code(DisguiseError err) {
    return {static_cast<int>(err), disguise_category()};
}

DecoyRequest make_decoy_request(std::string_view host, std::string_view user_agent) {
    DecoyRequest req{http::verb::post, "/", 11};
    req.set(http::field::host, std::string(host));
    req.set(http::field::user_agent, std::string(user_agent));
    req.prepare_payload();
    return req;
}

DisguiseConn::DisguiseConn(std::shared_ptr<net::Conn> conn, Role role,
                           std::optional<DecoyRequest> request)
    : conn_(std::move(conn)), role_(role), request_(std::move(request)) {}

common::Result<void> DisguiseConn::handshake() {
    if (state_.load(std::memory_order_acquire) == State::Handshaked) return {};

    std::lock_guard lock(handshake_mutex_);
    switch (state_.load()) {
        case State::Handshaked: return {};
        case State::Failed: return std::unexpected(*failure_);
        default: break;
    }

    state_.store(State::Handshaking);
    auto result = (role_ == Role::Server) ? server_handshake() : client_handshake();
    if (!result) {
        failure_ = result.error();
        state_.store(State::Failed, std::memory_order_release);
        return result;
    }
    state_.store(State::Handshaked, std::memory_order_release);
    return {};
}

common::Result<void> DisguiseConn::server_handshake() {
    net::StreamAdapter stream(*conn_);
    boost::system::error_code ec;

    http::request_parser<http::string_body> parser;
    http::read_header(stream, buffer_, parser, ec);
    if (ec) return std::unexpected(stream_error(stream, ec));
    request_ = parser.release();

    OBFSCONN_LOG_DEBUG("[ohttp] {} -> {}\n{}", remote_address(), local_address(), dump(request_->base()));

    auto written = conn_->write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(DISGUISE_RESPONSE.data()), DISGUISE_RESPONSE.size()));
    if (!written) return std::unexpected(written.error());

    OBFSCONN_LOG_DEBUG("[ohttp] {} <- {}\n{}", remote_address(), local_address(), DISGUISE_RESPONSE);
    return {};
}

common::Result<void> DisguiseConn::client_handshake() {
    if (!request_) {
        request_ = make_decoy_request();
    }

    net::StreamAdapter stream(*conn_);
    boost::system::error_code ec;

    http::write(stream, *request_, ec);
    if (ec) return std::unexpected(stream_error(stream, ec));

    OBFSCONN_LOG_DEBUG("[ohttp] {} -> {}\n{}", local_address(), remote_address(), dump(request_->base()));

    http::response_parser<http::string_body> parser;
    http::read_header(stream, buffer_, parser, ec);
    if (ec) return std::unexpected(stream_error(stream, ec));

    const auto& res = parser.get();
    OBFSCONN_LOG_DEBUG("[ohttp] {} <- {}\n{}", local_address(), remote_address(), dump(res.base()));

    if (res.result() != http::status::ok) {
        return common::fail(DisguiseError::UnexpectedStatus,
                            std::to_string(res.result_int()) + " " +
                            std::string(res.reason().data(), res.reason().size()));
    }
    return {};
}

common::Result<size_t> DisguiseConn::read(std::span<uint8_t> buf) {
    if (auto hs = handshake(); !hs) return std::unexpected(hs.error());

    {
        std::lock_guard lock(buffer_mutex_);
        if (buffer_.size() > 0) {
            size_t n = boost::asio::buffer_copy(boost::asio::buffer(buf.data(), buf.size()),
                                                buffer_.data());
            buffer_.consume(n);
            return n;
        }
    }
    return conn_->read(buf);
}

common::Result<size_t> DisguiseConn::write(std::span<const uint8_t> data) {
    if (auto hs = handshake(); !hs) return std::unexpected(hs.error());
    return conn_->write(data);
}

void DisguiseConn::close() {
    conn_->close();
}

}  // namespace obfsconn::obfs
