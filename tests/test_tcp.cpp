#include <catch2/catch_test_macros.hpp>
#include "obfsconn/net/tcp.hpp"
#include <array>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using namespace obfsconn;
using namespace obfsconn::net;

namespace {

constexpr auto WAKE_TIMEOUT = std::chrono::seconds(2);

// Waits for a blocked call to finish. A thread that never returns is left
// detached; it only holds shared state.
bool finished(std::thread& t, std::future<void>& done) {
    if (done.wait_for(WAKE_TIMEOUT) != std::future_status::ready) {
        t.detach();
        return false;
    }
    t.join();
    return true;
}

}  // namespace

TEST_CASE("Address splitting", "[tcp]") {
    auto v4 = split_host_port("127.0.0.1:443");
    REQUIRE(v4.has_value());
    REQUIRE(v4->first == "127.0.0.1");
    REQUIRE(v4->second == "443");

    auto v6 = split_host_port("[::1]:8080");
    REQUIRE(v6.has_value());
    REQUIRE(v6->first == "::1");
    REQUIRE(v6->second == "8080");

    auto any = split_host_port(":443");
    REQUIRE(any.has_value());
    REQUIRE(any->first.empty());

    REQUIRE(!split_host_port("example.com").has_value());
    REQUIRE(!split_host_port("example.com:").has_value());
}

TEST_CASE("Closing a listener wakes a blocked accept", "[tcp]") {
    boost::asio::io_context io;
    auto ln = TcpListener::listen(io, "127.0.0.1:0");
    REQUIRE(ln.has_value());
    std::shared_ptr<TcpListener> listener = std::move(*ln);

    auto result = std::make_shared<common::Result<std::shared_ptr<Conn>>>();
    std::promise<void> promise;
    auto done = promise.get_future();
    std::thread waiter([listener, result, promise = std::move(promise)]() mutable {
        *result = listener->accept();
        promise.set_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    listener->close();

    REQUIRE(finished(waiter, done));
    REQUIRE(!result->has_value());

    // Closed for good
    REQUIRE(!listener->accept().has_value());
}

TEST_CASE("Closing a connection wakes a blocked read", "[tcp]") {
    boost::asio::io_context io;
    auto ln = TcpListener::listen(io, "127.0.0.1:0");
    REQUIRE(ln.has_value());

    auto client = tcp_dial(io, (*ln)->address());
    REQUIRE(client.has_value());
    auto accepted = (*ln)->accept();
    REQUIRE(accepted.has_value());

    std::shared_ptr<Conn> conn = *accepted;
    auto result = std::make_shared<common::Result<size_t>>();
    std::promise<void> promise;
    auto done = promise.get_future();
    std::thread reader([conn, result, promise = std::move(promise)]() mutable {
        std::array<uint8_t, 16> buf{};
        *result = conn->read(buf);
        promise.set_value();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    conn->close();

    REQUIRE(finished(reader, done));
    // Either end of stream or an error, never data
    REQUIRE((!result->has_value() || **result == 0));
    (*client)->close();
}

TEST_CASE("Wildcard listener takes IPv4 peers", "[tcp]") {
    boost::asio::io_context io;
    auto ln = TcpListener::listen(io, ":0");
    REQUIRE(ln.has_value());
    REQUIRE((*ln)->port() != 0);

    auto client = tcp_dial(io, "127.0.0.1:" + std::to_string((*ln)->port()));
    REQUIRE(client.has_value());

    auto accepted = (*ln)->accept();
    REQUIRE(accepted.has_value());

    const std::string ping = "ping";
    REQUIRE((*client)->write(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(ping.data()), ping.size())).has_value());

    std::array<uint8_t, 4> buf{};
    auto n = (*accepted)->read(buf);
    REQUIRE(n.has_value());
    REQUIRE(*n > 0);
    REQUIRE(buf[0] == 'p');
}
