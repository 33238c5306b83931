#pragma once

#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>
#include "obfs4/common/ntor.hpp"
#include "obfs4/common/replay_filter.hpp"
#include "obfs4/transport/conn.hpp"
#include "obfs4/transport/handshake.hpp"
#include "obfs4/transport/state.hpp"
#include "obfsconn/obfs/pt.hpp"

// obfs4 pluggable transport on top of the obfs4-cpp library
namespace obfsconn::obfs {

constexpr std::string_view OBFS4 = "obfs4";
constexpr std::string_view OBFS4_STATE_FILE = "obfs4_state.json";

enum class Obfs4Error {
    MissingArgument = 1,
    InvalidCert,
    InvalidIatMode,
    InvalidState,
    HandshakeFailed,
    ConnectionClosed,
    DecodeFailed,
};

[[nodiscard]] std::string obfs4_error_message(Obfs4Error err);

const std::error_category& obfs4_category();
std::error_code make_error_code(Obfs4Error err);

// "0", "1" or "2"
[[nodiscard]] common::Result<obfs4::transport::IATMode> parse_iat_mode(std::string_view text);

// Reads <state_dir>/obfs4_state.json, writing a fresh identity there when
// the file does not exist yet.
[[nodiscard]] common::Result<obfs4::transport::ServerState>
load_or_create_state(const std::string& state_dir);

// Parsed client arguments, carried in ClientContext::args
struct Obfs4ClientArgs {
    obfs4::common::NodeID node_id{};
    obfs4::crypto::PublicKey public_key{};
    obfs4::transport::IATMode iat_mode = obfs4::transport::IATMode::None;
};

// Established obfs4 session over a raw connection
class Obfs4Conn : public net::Conn {
public:
    // pending: wire bytes that arrived behind the handshake
    Obfs4Conn(std::shared_ptr<net::Conn> conn, const obfs4::transport::HandshakeKeys& keys,
              obfs4::transport::IATMode iat_mode, std::vector<uint8_t> pending);

    Obfs4Conn(const Obfs4Conn&) = delete;
    Obfs4Conn& operator=(const Obfs4Conn&) = delete;

    common::Result<size_t> read(std::span<uint8_t> buf) override;
    common::Result<size_t> write(std::span<const uint8_t> data) override;
    void close() override { conn_->close(); }

    std::string local_address() const override { return conn_->local_address(); }
    std::string remote_address() const override { return conn_->remote_address(); }

private:
    common::Result<void> decode(std::span<const uint8_t> wire);

    std::shared_ptr<net::Conn> conn_;

    // Lock order: read_mutex_ or write_mutex_, then codec_mutex_
    std::mutex read_mutex_;
    std::mutex write_mutex_;
    std::mutex codec_mutex_;
    obfs4::transport::Obfs4Conn codec_;

    std::vector<uint8_t> pending_;
    std::vector<uint8_t> plaintext_;
};

class Obfs4ClientFactory : public ClientFactory {
public:
    // Needs "cert" and "iat-mode"
    common::Result<std::any> parse_args(const config::Args& options) override;

    common::Result<std::shared_ptr<net::Conn>>
    dial(std::string_view network, std::string_view address,
         const DialFn& dial_fn, const std::any& args) override;
};

class Obfs4ServerFactory : public ServerFactory {
public:
    explicit Obfs4ServerFactory(obfs4::transport::ServerState state);

    // "cert" and "iat-mode" for clients
    const config::Args& args() const override { return args_; }

    common::Result<std::shared_ptr<net::Conn>>
    wrap_conn(std::shared_ptr<net::Conn> conn) override;

    [[nodiscard]] const obfs4::transport::ServerState& state() const { return state_; }

private:
    obfs4::transport::ServerState state_;
    config::Args args_;

    std::mutex replay_mutex_;
    obfs4::common::ReplayFilter replay_filter_;
};

class Obfs4Transport : public Transport {
public:
    std::string name() const override { return std::string(OBFS4); }

    common::Result<std::shared_ptr<ClientFactory>>
    client_factory(const std::string& state_dir) override;

    // options may override the stored "iat-mode"
    common::Result<std::shared_ptr<ServerFactory>>
    server_factory(const std::string& state_dir, const config::Args& options) override;
};

}  // namespace obfsconn::obfs

template<>
struct std::is_error_code_enum<obfsconn::obfs::Obfs4Error> : std::true_type {};
