#include "obfsconn/obfs/obfs4.hpp"
#include <algorithm>
#include <array>
#include "obfs4/common/csrand.hpp"
#include "obfs4/crypto/elligator2.hpp"
#include "obfsconn/common/logging.hpp"

namespace obfsconn::obfs {

namespace o4 = ::obfs4::transport;

namespace {

constexpr size_t READ_CHUNK = 4096;

class Obfs4Category : public std::error_category {
public:
    const char* name() const noexcept override { return "obfsconn.obfs4"; }
    std::string message(int ev) const override {
        return obfs4_error_message(static_cast<Obfs4Error>(ev));
    }
};

std::string state_path(const std::string& state_dir) {
    return state_dir + "/" + std::string(OBFS4_STATE_FILE);
}

// Reads one chunk of handshake bytes, appending to received.
common::Result<std::span<const uint8_t>>
read_handshake_chunk(net::Conn& conn, std::array<uint8_t, READ_CHUNK>& buf,
                     std::vector<uint8_t>& received) {
    auto n = conn.read(buf);
    if (!n) return std::unexpected(n.error());
    if (*n == 0) return common::fail(Obfs4Error::ConnectionClosed, conn.remote_address());
    received.insert(received.end(), buf.begin(), buf.begin() + *n);
    return std::span<const uint8_t>(buf.data(), *n);
}

}  // namespace

std::string obfs4_error_message(Obfs4Error err) {
    switch (err) {
        case Obfs4Error::MissingArgument: return "missing obfs4 argument";
        case Obfs4Error::InvalidCert: return "invalid obfs4 cert";
        case Obfs4Error::InvalidIatMode: return "invalid iat-mode";
        case Obfs4Error::InvalidState: return "invalid obfs4 state";
        case Obfs4Error::HandshakeFailed: return "obfs4 handshake failed";
        case Obfs4Error::ConnectionClosed: return "connection closed during obfs4 handshake";
        case Obfs4Error::DecodeFailed: return "obfs4 frame decode failed";
        default: return "unknown obfs4 error";
    }
}

const std::error_category& obfs4_category() {
    static const Obfs4Category category;
    return category;
}

std::error_code make_error_code(Obfs4Error err) {
    return {static_cast<int>(err), obfs4_category()};
}

common::Result<o4::IATMode> parse_iat_mode(std::string_view text) {
    if (text == "0") return o4::IATMode::None;
    if (text == "1") return o4::IATMode::Enabled;
    if (text == "2") return o4::IATMode::Paranoid;
    return common::fail(Obfs4Error::InvalidIatMode, std::string(text));
}

common::Result<o4::ServerState> load_or_create_state(const std::string& state_dir) {
    auto path = state_path(state_dir);

    auto loaded = o4::load_state(path);
    if (loaded) return *loaded;
    if (loaded.error() != o4::StateError::IOError) {
        return common::fail(Obfs4Error::InvalidState,
                            path + ": " + o4::state_error_message(loaded.error()));
    }

    o4::ServerState state;
    state.node_id = ::obfs4::common::random_array<20>();
    state.identity = ::obfs4::crypto::elligator2::generate_representable_keypair();
    state.drbg_seed = ::obfs4::common::random_array<24>();

    auto saved = o4::save_state(path, state);
    if (!saved) {
        return common::fail(Obfs4Error::InvalidState,
                            path + ": " + o4::state_error_message(saved.error()));
    }
    OBFSCONN_LOG_INFO("[obfs4] new server identity written to {}", path);
    return state;
}

// --- Obfs4Conn ---

Obfs4Conn::Obfs4Conn(std::shared_ptr<net::Conn> conn, const o4::HandshakeKeys& keys,
                     o4::IATMode iat_mode, std::vector<uint8_t> pending)
    : conn_(std::move(conn)), pending_(std::move(pending)) {
    codec_.init(keys.encoder_key_material, keys.decoder_key_material, iat_mode);
}

common::Result<void> Obfs4Conn::decode(std::span<const uint8_t> wire) {
    std::lock_guard lock(codec_mutex_);
    auto result = codec_.read(wire);
    if (!result) return common::fail(Obfs4Error::DecodeFailed, conn_->remote_address());
    plaintext_.insert(plaintext_.end(), result->plaintext.begin(), result->plaintext.end());
    return {};
}

common::Result<size_t> Obfs4Conn::read(std::span<uint8_t> buf) {
    std::lock_guard lock(read_mutex_);

    if (!pending_.empty()) {
        auto wire = std::move(pending_);
        pending_.clear();
        auto decoded = decode(wire);
        if (!decoded) return std::unexpected(decoded.error());
    }

    std::array<uint8_t, READ_CHUNK> wire;
    while (plaintext_.empty()) {
        auto n = conn_->read(wire);
        if (!n) return std::unexpected(n.error());
        if (*n == 0) return 0;

        auto decoded = decode(std::span<const uint8_t>(wire.data(), *n));
        if (!decoded) return std::unexpected(decoded.error());
    }

    size_t n = std::min(buf.size(), plaintext_.size());
    std::copy_n(plaintext_.begin(), n, buf.begin());
    plaintext_.erase(plaintext_.begin(), plaintext_.begin() + n);
    return n;
}

common::Result<size_t> Obfs4Conn::write(std::span<const uint8_t> data) {
    std::lock_guard lock(write_mutex_);

    std::vector<uint8_t> wire;
    {
        std::lock_guard codec_lock(codec_mutex_);
        wire = codec_.write(data);
    }

    auto written = conn_->write(wire);
    if (!written) return std::unexpected(written.error());
    return data.size();
}

// --- Client ---

common::Result<std::any> Obfs4ClientFactory::parse_args(const config::Args& options) {
    auto cert = options.get("cert");
    if (!cert || cert->empty()) return common::fail(Obfs4Error::MissingArgument, "cert");

    auto decoded = o4::decode_cert(*cert);
    if (!decoded) return common::fail(Obfs4Error::InvalidCert, *cert);

    auto iat = options.get("iat-mode");
    if (!iat) return common::fail(Obfs4Error::MissingArgument, "iat-mode");

    auto mode = parse_iat_mode(*iat);
    if (!mode) return std::unexpected(mode.error());

    Obfs4ClientArgs args;
    args.node_id = decoded->first;
    args.public_key = decoded->second;
    args.iat_mode = *mode;
    return std::any(args);
}

common::Result<std::shared_ptr<net::Conn>>
Obfs4ClientFactory::dial(std::string_view network, std::string_view address,
                         const DialFn& dial_fn, const std::any& args) {
    const auto* params = std::any_cast<Obfs4ClientArgs>(&args);
    if (!params) return common::fail(Obfs4Error::MissingArgument, "client arguments");

    auto conn = dial_fn(network, address);
    if (!conn) return conn;
    auto raw = *conn;

    auto failed = [&](common::Error err) -> common::Result<std::shared_ptr<net::Conn>> {
        OBFSCONN_LOG_DEBUG("[obfs4] {} -> {} : {}", raw->local_address(),
                           raw->remote_address(), err.message());
        raw->close();
        return std::unexpected(std::move(err));
    };

    o4::ClientHandshake handshake(params->public_key, params->node_id);
    auto hello = handshake.generate();
    auto sent = raw->write(hello);
    if (!sent) return failed(sent.error());

    std::vector<uint8_t> received;
    std::array<uint8_t, READ_CHUNK> buf;
    size_t consumed = 0;
    while (true) {
        auto chunk = read_handshake_chunk(*raw, buf, received);
        if (!chunk) return failed(chunk.error());

        auto parsed = handshake.parse_server_response(received);
        if (parsed) {
            consumed = parsed->first;
            break;
        }
        if (parsed.error() != o4::HandshakeError::NeedMore ||
            received.size() >= o4::MAX_HANDSHAKE_LENGTH) {
            return failed(common::Error(make_error_code(Obfs4Error::HandshakeFailed),
                                        o4::handshake_error_message(parsed.error())));
        }
    }

    std::vector<uint8_t> pending(received.begin() + consumed, received.end());
    return std::make_shared<Obfs4Conn>(std::move(raw), handshake.keys(), params->iat_mode,
                                       std::move(pending));
}

// --- Server ---

Obfs4ServerFactory::Obfs4ServerFactory(o4::ServerState state)
    : state_(std::move(state)) {
    args_.set("cert", o4::encode_cert(state_.node_id, state_.identity.public_key));
    args_.set("iat-mode", std::to_string(static_cast<int>(state_.iat_mode)));
}

common::Result<std::shared_ptr<net::Conn>>
Obfs4ServerFactory::wrap_conn(std::shared_ptr<net::Conn> conn) {
    o4::ServerHandshake handshake(state_.identity, state_.node_id, replay_filter_);

    std::vector<uint8_t> received;
    std::array<uint8_t, READ_CHUNK> buf;
    size_t mac_end = 0;
    while (true) {
        auto chunk = read_handshake_chunk(*conn, buf, received);
        if (!chunk) return std::unexpected(chunk.error());

        std::expected<size_t, o4::HandshakeError> consumed;
        {
            std::lock_guard lock(replay_mutex_);
            consumed = handshake.consume(*chunk);
        }
        if (consumed) {
            mac_end = *consumed;
            break;
        }
        if (consumed.error() != o4::HandshakeError::NeedMore ||
            received.size() >= o4::MAX_HANDSHAKE_LENGTH) {
            return common::fail(Obfs4Error::HandshakeFailed,
                                o4::handshake_error_message(consumed.error()));
        }
    }

    auto hello = handshake.generate();
    if (!hello) {
        return common::fail(Obfs4Error::HandshakeFailed,
                            o4::handshake_error_message(hello.error()));
    }
    auto sent = conn->write(*hello);
    if (!sent) return std::unexpected(sent.error());

    std::vector<uint8_t> pending(received.begin() + mac_end, received.end());
    return std::make_shared<Obfs4Conn>(std::move(conn), handshake.keys(), state_.iat_mode,
                                       std::move(pending));
}

// --- Transport ---

common::Result<std::shared_ptr<ClientFactory>>
Obfs4Transport::client_factory(const std::string& /*state_dir*/) {
    return std::make_shared<Obfs4ClientFactory>();
}

common::Result<std::shared_ptr<ServerFactory>>
Obfs4Transport::server_factory(const std::string& state_dir, const config::Args& options) {
    auto state = load_or_create_state(state_dir);
    if (!state) return std::unexpected(state.error());

    if (auto iat = options.get("iat-mode")) {
        auto mode = parse_iat_mode(*iat);
        if (!mode) return std::unexpected(mode.error());
        state->iat_mode = *mode;
    }
    return std::make_shared<Obfs4ServerFactory>(std::move(*state));
}

}  // namespace obfsconn::obfs
