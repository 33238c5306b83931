#pragma once

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include "obfsconn/common/error.hpp"

namespace obfsconn::net {

// Bidirectional byte stream.
class Conn {
public:
    virtual ~Conn() = default;

    // Reads at least one byte. Returns 0 once the peer has shut down.
    [[nodiscard]] virtual common::Result<size_t> read(std::span<uint8_t> buf) = 0;

    // Writes all of data or fails.
    [[nodiscard]] virtual common::Result<size_t> write(std::span<const uint8_t> data) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual std::string local_address() const = 0;
    [[nodiscard]] virtual std::string remote_address() const = 0;
};

class Listener {
public:
    virtual ~Listener() = default;

    // Blocks until a connection is ready.
    [[nodiscard]] virtual common::Result<std::shared_ptr<Conn>> accept() = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual std::string address() const = 0;
};

}  // namespace obfsconn::net
