#include "torgrab/runtime/TorControlClient.hpp"
#include "torgrab/util/BlockingOp.hpp"
#include "torgrab/util/Logging.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>

#include <cctype>
#include <string_view>

namespace torgrab::runtime {
namespace {

struct Reply {
    int code{};
    std::string line;
};

// Reads one reply ("250-..." continuation lines end at "250 ...").
Reply readReply(boost::asio::io_context& io, boost::beast::tcp_stream& stream, std::string& buffer) {
    for (;;) {
        util::runBlocking(io, [&](auto handler) {
            boost::asio::async_read_until(stream, boost::asio::dynamic_buffer(buffer), "\r\n", std::move(handler));
        });
        auto end = buffer.find("\r\n");
        std::string line = buffer.substr(0, end);
        buffer.erase(0, end + 2);

        if (line.size() < 4 || !std::isdigit(static_cast<unsigned char>(line[0])) ||
            !std::isdigit(static_cast<unsigned char>(line[1])) || !std::isdigit(static_cast<unsigned char>(line[2]))) {
            throw ControlError(ControlError::Type::protocol, 0, "Malformed control reply: " + line);
        }
        if (line[3] == ' ') {
            return Reply{std::stoi(line.substr(0, 3)), line};
        }
    }
}

ControlError translate(const boost::system::system_error& ex, std::string_view stage) {
    if (ex.code() == boost::beast::error::timeout) {
        return ControlError(ControlError::Type::timeout, 0,
                            std::string{"Control channel timed out during "} + std::string(stage));
    }
    return ControlError(ControlError::Type::connect_failed, 0,
                        std::string{"Control channel "} + std::string(stage) + " failed: " + ex.what());
}

} // namespace

std::string quoteControlString(const std::string& value) {
    std::string quoted{"\""};
    for (char c : value) {
        if (c == '"' || c == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

TorControlClient::TorControlClient(std::string password)
    : password_(std::move(password)) {}

void TorControlClient::rotateIdentity(const model::Endpoint& control, std::chrono::milliseconds timeout) {
    execute(control, {"SIGNAL NEWNYM"}, timeout);
    util::log(util::LogLevel::debug, "NEWNYM acknowledged by " + control.toString());
}

std::vector<std::string> TorControlClient::execute(const model::Endpoint& control,
                                                   const std::vector<std::string>& commands,
                                                   std::chrono::milliseconds timeout) {
    boost::asio::io_context io;
    boost::beast::tcp_stream stream(io);
    std::string buffer;
    std::vector<std::string> replies;

    std::string_view stage = "connect";
    try {
        boost::asio::ip::tcp::resolver resolver(io);
        auto results = resolver.resolve(control.host, std::to_string(control.port));
        stream.expires_after(timeout);
        util::runBlocking(io, [&](auto handler) { stream.async_connect(results, std::move(handler)); });

        stage = "authentication";
        std::string auth = "AUTHENTICATE " + quoteControlString(password_) + "\r\n";
        util::runBlocking(io, [&](auto handler) {
            boost::asio::async_write(stream, boost::asio::buffer(auth), std::move(handler));
        });
        auto authReply = readReply(io, stream, buffer);
        if (authReply.code != 250) {
            throw ControlError(ControlError::Type::auth_rejected, authReply.code,
                               "Control port " + control.toString() + " rejected authentication: " + authReply.line);
        }

        stage = "command";
        for (const auto& command : commands) {
            std::string wire = command + "\r\n";
            util::runBlocking(io, [&](auto handler) {
                boost::asio::async_write(stream, boost::asio::buffer(wire), std::move(handler));
            });
            auto reply = readReply(io, stream, buffer);
            if (reply.code != 250) {
                throw ControlError(ControlError::Type::command_rejected, reply.code,
                                   "Control port " + control.toString() + " rejected '" + command + "': " + reply.line);
            }
            replies.push_back(reply.line);
        }

        stage = "quit";
        std::string quit = "QUIT\r\n";
        util::runBlocking(io, [&](auto handler) {
            boost::asio::async_write(stream, boost::asio::buffer(quit), std::move(handler));
        });
    } catch (const boost::system::system_error& ex) {
        throw translate(ex, stage);
    }

    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        util::log(util::LogLevel::debug, "Control socket shutdown for " + control.toString() + ": " + ec.message());
    }
    return replies;
}

} // namespace torgrab::runtime
