#pragma once

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

namespace torgrab::util {

// Runs one asynchronous operation to completion on a private io_context.
// Deadlines come from the stream (beast::tcp_stream::expires_after), so a stalled
// peer surfaces as boost::beast::error::timeout instead of blocking forever.
template <typename Initiate>
void runBlocking(boost::asio::io_context& io, Initiate&& initiate) {
    boost::system::error_code result = boost::asio::error::would_block;
    initiate([&result](const boost::system::error_code& ec, auto&&...) { result = ec; });
    io.restart();
    io.run();
    if (result) {
        throw boost::system::system_error(result);
    }
}

} // namespace torgrab::util
