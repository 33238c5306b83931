#include <catch2/catch_test_macros.hpp>
#include "obfsconn/net/pipe.hpp"
#include <array>
#include <string>
#include <thread>

using namespace obfsconn::net;

namespace {

std::span<const uint8_t> bytes(const std::string& s) {
    return {reinterpret_cast<const uint8_t*>(s.data()), s.size()};
}

}  // namespace

TEST_CASE("Pipe carries bytes both ways", "[pipe]") {
    auto [a, b] = make_pipe();

    REQUIRE(a->write(bytes("hello")).value() == 5);
    REQUIRE(b->write(bytes("hi")).value() == 2);

    std::array<uint8_t, 16> buf{};
    auto n = b->read(buf);
    REQUIRE(n.has_value());
    REQUIRE(std::string(buf.begin(), buf.begin() + *n) == "hello");

    n = a->read(buf);
    REQUIRE(n.has_value());
    REQUIRE(std::string(buf.begin(), buf.begin() + *n) == "hi");
}

TEST_CASE("Pipe read blocks until data arrives", "[pipe]") {
    auto [a, b] = make_pipe();

    std::thread writer([a = a] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        (void)a->write(bytes("late"));
    });

    std::array<uint8_t, 4> buf{};
    auto n = b->read(buf);
    writer.join();

    REQUIRE(n.has_value());
    REQUIRE(*n == 4);
}

TEST_CASE("Pipe close drains then reports EOF", "[pipe]") {
    auto [a, b] = make_pipe();

    REQUIRE(a->write(bytes("bye")).has_value());
    a->close();
    REQUIRE(a->closed());

    std::array<uint8_t, 8> buf{};
    REQUIRE(b->read(buf).value() == 3);
    REQUIRE(b->read(buf).value() == 0);

    REQUIRE(!b->write(bytes("x")).has_value());
    REQUIRE(!a->read(buf).has_value());
}
