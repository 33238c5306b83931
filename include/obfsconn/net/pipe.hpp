#pragma once

#include <atomic>
#include <memory>
#include <utility>
#include "obfsconn/net/conn.hpp"

namespace obfsconn::net {

// One end of an in-memory, buffered, full-duplex pipe.
// Closing either end makes the peer read EOF once the buffered data is drained.
class PipeConn : public Conn {
public:
    struct Channel;

    PipeConn(std::shared_ptr<Channel> in, std::shared_ptr<Channel> out,
             std::string local, std::string remote);
    ~PipeConn() override;

    common::Result<size_t> read(std::span<uint8_t> buf) override;
    common::Result<size_t> write(std::span<const uint8_t> data) override;
    void close() override;

    std::string local_address() const override { return local_; }
    std::string remote_address() const override { return remote_; }

    [[nodiscard]] bool closed() const { return closed_.load(); }

private:
    std::shared_ptr<Channel> in_;
    std::shared_ptr<Channel> out_;
    std::string local_;
    std::string remote_;
    std::atomic<bool> closed_{false};
};

std::pair<std::shared_ptr<PipeConn>, std::shared_ptr<PipeConn>> make_pipe();

}  // namespace obfsconn::net
