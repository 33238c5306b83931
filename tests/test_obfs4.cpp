#include <catch2/catch_test_macros.hpp>
#include "obfsconn/obfs/obfs4.hpp"
#include "obfsconn/obfs/pt_conn.hpp"
#include "obfsconn/obfs/registry.hpp"
#include "obfsconn/net/pipe.hpp"
#include "fake_transport.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

using namespace obfsconn;
using namespace obfsconn::obfs;
using namespace obfsconn::testing;

namespace {

// Fresh state directory, removed on scope exit
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                ("obfsconn-test-" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 "-" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

config::Node server_node(const TempDir& dir) {
    auto node = config::Node::parse("obfs4://127.0.0.1:9000").value();
    node.values.set("state-dir", dir.path());
    return node;
}

struct Session {
    common::Result<std::shared_ptr<net::Conn>> client;
    common::Result<std::shared_ptr<net::Conn>> server;
};

// Handshakes a client and a server context over an in-memory pipe
Session open_session(Registry& client_registry, Registry& server_registry,
                     const std::string& address, const std::shared_ptr<net::PipeConn>& a,
                     const std::shared_ptr<net::PipeConn>& b) {
    Session session;
    std::thread client_thread([&] { session.client = client_conn(client_registry, address, a); });
    session.server = server_conn(server_registry, address, b);
    client_thread.join();
    return session;
}

}  // namespace

TEST_CASE("obfs4 transport name", "[obfs4]") {
    Obfs4Transport transport;
    REQUIRE(transport.name() == "obfs4");
}

TEST_CASE("IAT mode parsing", "[obfs4]") {
    REQUIRE(parse_iat_mode("0").value() == obfs4::transport::IATMode::None);
    REQUIRE(parse_iat_mode("1").value() == obfs4::transport::IATMode::Enabled);
    REQUIRE(parse_iat_mode("2").value() == obfs4::transport::IATMode::Paranoid);

    auto bad = parse_iat_mode("3");
    REQUIRE(!bad.has_value());
    REQUIRE(bad.error().code() == Obfs4Error::InvalidIatMode);
    REQUIRE(bad.error().code().category() == obfs4_category());
    REQUIRE(!parse_iat_mode("").has_value());
}

TEST_CASE("Server state is created once and reused", "[obfs4]") {
    TempDir dir;
    Obfs4Transport transport;

    auto first = transport.server_factory(dir.path(), config::Args{});
    REQUIRE(first.has_value());
    REQUIRE(std::filesystem::exists(std::filesystem::path(dir.path()) / OBFS4_STATE_FILE));

    auto cert = (*first)->args().get("cert");
    REQUIRE(cert.has_value());
    REQUIRE(obfs4::transport::decode_cert(*cert).has_value());
    REQUIRE((*first)->args().get("iat-mode") == "0");

    auto second = transport.server_factory(dir.path(), config::Args{});
    REQUIRE(second.has_value());
    REQUIRE((*second)->args().get("cert") == cert);

    // iat-mode from the options wins over the stored one
    config::Args options{{"iat-mode", {"1"}}};
    auto third = transport.server_factory(dir.path(), options);
    REQUIRE(third.has_value());
    REQUIRE((*third)->args().get("cert") == cert);
    REQUIRE((*third)->args().get("iat-mode") == "1");
}

TEST_CASE("Corrupt server state is an error", "[obfs4]") {
    TempDir dir;
    {
        std::ofstream out(std::filesystem::path(dir.path()) / OBFS4_STATE_FILE);
        out << "not json";
    }

    Obfs4Transport transport;
    auto factory = transport.server_factory(dir.path(), config::Args{});
    REQUIRE(!factory.has_value());
    REQUIRE(factory.error().code() == Obfs4Error::InvalidState);

    config::Args bad_iat{{"iat-mode", {"9"}}};
    TempDir other;
    auto rejected = transport.server_factory(other.path(), bad_iat);
    REQUIRE(!rejected.has_value());
    REQUIRE(rejected.error().code() == Obfs4Error::InvalidIatMode);
}

TEST_CASE("Client arguments need cert and iat-mode", "[obfs4]") {
    TempDir dir;
    Obfs4Transport transport;
    auto server = transport.server_factory(dir.path(), config::Args{});
    REQUIRE(server.has_value());
    auto cert = *(*server)->args().get("cert");

    Obfs4ClientFactory factory;

    auto no_cert = factory.parse_args(config::Args{{"iat-mode", {"0"}}});
    REQUIRE(!no_cert.has_value());
    REQUIRE(no_cert.error().code() == Obfs4Error::MissingArgument);
    REQUIRE(no_cert.error().detail() == "cert");

    auto bad_cert = factory.parse_args(config::Args{{"cert", {"AAAA"}}, {"iat-mode", {"0"}}});
    REQUIRE(!bad_cert.has_value());
    REQUIRE(bad_cert.error().code() == Obfs4Error::InvalidCert);

    auto no_iat = factory.parse_args(config::Args{{"cert", {cert}}});
    REQUIRE(!no_iat.has_value());
    REQUIRE(no_iat.error().code() == Obfs4Error::MissingArgument);
    REQUIRE(no_iat.error().detail() == "iat-mode");

    auto bad_iat = factory.parse_args(config::Args{{"cert", {cert}}, {"iat-mode", {"7"}}});
    REQUIRE(!bad_iat.has_value());
    REQUIRE(bad_iat.error().code() == Obfs4Error::InvalidIatMode);

    auto ok = factory.parse_args((*server)->args());
    REQUIRE(ok.has_value());
    auto obfs4_server = std::dynamic_pointer_cast<Obfs4ServerFactory>(*server);
    REQUIRE(obfs4_server != nullptr);
    const auto& args = std::any_cast<const Obfs4ClientArgs&>(*ok);
    REQUIRE(args.node_id == obfs4_server->state().node_id);
    REQUIRE(args.public_key == obfs4_server->state().identity.public_key);
    REQUIRE(args.iat_mode == obfs4::transport::IATMode::None);
}

TEST_CASE("obfs4 client and server talk over a pipe", "[obfs4]") {
    TempDir dir;
    auto transport = std::make_shared<Obfs4Transport>();
    Registry server_registry(transport);
    Registry client_registry(transport);

    auto node = server_node(dir);
    REQUIRE(server_registry.init(node, Role::Server).has_value());
    auto ctx = server_registry.server_context(node.addr);
    REQUIRE(ctx.has_value());
    REQUIRE(client_registry.init(node.addr, ctx->args, Role::Client).has_value());

    auto [a, b] = net::make_pipe();
    auto session = open_session(client_registry, server_registry, node.addr, a, b);
    REQUIRE(session.client.has_value());
    REQUIRE(session.server.has_value());
    auto client = *session.client;
    auto server = *session.server;

    REQUIRE(client->write(bytes("ping")).has_value());
    REQUIRE(read_exact(*server, 4) == "ping");
    REQUIRE(server->write(bytes("pong")).has_value());
    REQUIRE(read_exact(*client, 4) == "pong");

    // Spans many frames
    std::string large(20000, '\0');
    for (size_t i = 0; i < large.size(); ++i) large[i] = static_cast<char>(i * 31 + 7);
    REQUIRE(client->write(bytes(large)).has_value());
    REQUIRE(read_exact(*server, large.size()) == large);
}

TEST_CASE("Server rejects a client that is not speaking obfs4", "[obfs4]") {
    TempDir dir;
    Obfs4Transport transport;
    auto server = transport.server_factory(dir.path(), config::Args{});
    REQUIRE(server.has_value());

    auto [a, b] = net::make_pipe();
    REQUIRE(a->write(bytes(std::string(9000, 'A'))).has_value());

    auto conn = (*server)->wrap_conn(b);
    REQUIRE(!conn.has_value());
    REQUIRE(conn.error().code() == Obfs4Error::HandshakeFailed);
}

TEST_CASE("Peer hanging up mid-handshake", "[obfs4]") {
    TempDir dir;
    Obfs4Transport transport;
    auto server = transport.server_factory(dir.path(), config::Args{});
    REQUIRE(server.has_value());

    auto [a, b] = net::make_pipe();
    REQUIRE(a->write(bytes("short hello")).has_value());
    a->close();

    auto conn = (*server)->wrap_conn(b);
    REQUIRE(!conn.has_value());
    REQUIRE(conn.error().code() == Obfs4Error::ConnectionClosed);

    // Client side: the server never answers
    Obfs4ClientFactory factory;
    auto args = factory.parse_args((*server)->args());
    REQUIRE(args.has_value());

    auto [c, d] = net::make_pipe();
    d->close();
    auto dialed = factory.dial("tcp", "pipe:d",
        [c = c](std::string_view, std::string_view) -> common::Result<std::shared_ptr<net::Conn>> {
            return c;
        },
        *args);
    REQUIRE(!dialed.has_value());
    REQUIRE(c->closed());
}

TEST_CASE("Tampered frames fail the read", "[obfs4]") {
    TempDir dir;
    auto transport = std::make_shared<Obfs4Transport>();
    Registry server_registry(transport);
    Registry client_registry(transport);

    auto node = server_node(dir);
    REQUIRE(server_registry.init(node, Role::Server).has_value());
    REQUIRE(client_registry.init(node.addr, server_registry.server_context(node.addr)->args,
                                 Role::Client).has_value());

    auto [a, b] = net::make_pipe();
    auto session = open_session(client_registry, server_registry, node.addr, a, b);
    REQUIRE(session.client.has_value());
    REQUIRE(session.server.has_value());

    // Bypass the client codec and write garbage straight onto the wire
    REQUIRE(a->write(bytes(std::string(2000, 'A'))).has_value());

    std::array<uint8_t, 64> buf{};
    auto n = (*session.server)->read(buf);
    REQUIRE(!n.has_value());
    REQUIRE(n.error().code() == Obfs4Error::DecodeFailed);
}
