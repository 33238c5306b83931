#pragma once

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>
#include <boost/throw_exception.hpp>
#include <optional>
#include "obfsconn/net/conn.hpp"

namespace obfsconn::net {

// SyncReadStream/SyncWriteStream view of a Conn, so Beast's synchronous
// HTTP parser and serializer can run over any connection.
// A Conn failure is kept in last_error() and reported to Beast as a
// generic asio error; callers should prefer last_error() when set.
class StreamAdapter {
public:
    explicit StreamAdapter(Conn& conn) : conn_(conn) {}

    template<class MutableBufferSequence>
    size_t read_some(const MutableBufferSequence& buffers) {
        boost::system::error_code ec;
        auto n = read_some(buffers, ec);
        if (ec) BOOST_THROW_EXCEPTION(boost::system::system_error(ec));
        return n;
    }

    template<class MutableBufferSequence>
    size_t read_some(const MutableBufferSequence& buffers, boost::system::error_code& ec) {
        ec = {};
        for (auto it = boost::asio::buffer_sequence_begin(buffers);
             it != boost::asio::buffer_sequence_end(buffers); ++it) {
            boost::asio::mutable_buffer b = *it;
            if (b.size() == 0) continue;

            auto n = conn_.read(std::span<uint8_t>(static_cast<uint8_t*>(b.data()), b.size()));
            if (!n) {
                last_error_ = n.error();
                ec = boost::asio::error::connection_aborted;
                return 0;
            }
            if (*n == 0) ec = boost::asio::error::eof;
            return *n;
        }
        return 0;
    }

    template<class ConstBufferSequence>
    size_t write_some(const ConstBufferSequence& buffers) {
        boost::system::error_code ec;
        auto n = write_some(buffers, ec);
        if (ec) BOOST_THROW_EXCEPTION(boost::system::system_error(ec));
        return n;
    }

    template<class ConstBufferSequence>
    size_t write_some(const ConstBufferSequence& buffers, boost::system::error_code& ec) {
        ec = {};
        for (auto it = boost::asio::buffer_sequence_begin(buffers);
             it != boost::asio::buffer_sequence_end(buffers); ++it) {
            boost::asio::const_buffer b = *it;
            if (b.size() == 0) continue;

            auto n = conn_.write(std::span<const uint8_t>(static_cast<const uint8_t*>(b.data()), b.size()));
            if (!n) {
                last_error_ = n.error();
                ec = boost::asio::error::connection_aborted;
                return 0;
            }
            return *n;
        }
        return 0;
    }

    [[nodiscard]] const std::optional<common::Error>& last_error() const { return last_error_; }

private:
    Conn& conn_;
    std::optional<common::Error> last_error_;
};

}  // namespace obfsconn::net
