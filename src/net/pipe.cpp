#include "obfsconn/net/pipe.hpp"
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace obfsconn::net {

struct PipeConn::Channel {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<uint8_t> data;
    bool closed = false;

    void shut() {
        {
            std::lock_guard lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }
};

PipeConn::PipeConn(std::shared_ptr<Channel> in, std::shared_ptr<Channel> out,
                   std::string local, std::string remote)
    : in_(std::move(in)), out_(std::move(out)),
      local_(std::move(local)), remote_(std::move(remote)) {}

PipeConn::~PipeConn() {
    close();
}

common::Result<size_t> PipeConn::read(std::span<uint8_t> buf) {
    if (buf.empty()) return 0;

    std::unique_lock lock(in_->mutex);
    in_->cv.wait(lock, [this] { return !in_->data.empty() || in_->closed; });
    if (closed_) {
        return std::unexpected(common::Error(
            std::make_error_code(std::errc::bad_file_descriptor), "read on closed pipe"));
    }
    if (in_->data.empty()) return 0;

    size_t n = std::min(buf.size(), in_->data.size());
    std::copy_n(in_->data.begin(), n, buf.begin());
    in_->data.erase(in_->data.begin(), in_->data.begin() + static_cast<std::ptrdiff_t>(n));
    return n;
}

common::Result<size_t> PipeConn::write(std::span<const uint8_t> data) {
    {
        std::lock_guard lock(out_->mutex);
        if (closed_ || out_->closed) {
            return std::unexpected(common::Error(
                std::make_error_code(std::errc::broken_pipe), "write on closed pipe"));
        }
        out_->data.insert(out_->data.end(), data.begin(), data.end());
    }
    out_->cv.notify_all();
    return data.size();
}

void PipeConn::close() {
    if (closed_.exchange(true)) return;
    in_->shut();
    out_->shut();
}

std::pair<std::shared_ptr<PipeConn>, std::shared_ptr<PipeConn>> make_pipe() {
    auto a_to_b = std::make_shared<PipeConn::Channel>();
    auto b_to_a = std::make_shared<PipeConn::Channel>();
    auto a = std::make_shared<PipeConn>(b_to_a, a_to_b, "pipe:a", "pipe:b");
    auto b = std::make_shared<PipeConn>(a_to_b, b_to_a, "pipe:b", "pipe:a");
    return {a, b};
}

}  // namespace obfsconn::net
