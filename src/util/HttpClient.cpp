#include "torgrab/util/HttpClient.hpp"
#include "torgrab/util/BlockingOp.hpp"
#include "torgrab/util/Logging.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <openssl/ssl.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <iterator>
#include <stdexcept>
#include <string_view>

namespace torgrab::util {
namespace {
constexpr unsigned kHttpVersion = 11;

struct ParsedUrl {
    std::string scheme;
    std::string host;
    std::string port;
    std::string target;
};

ParsedUrl parseUrl(const std::string& url) {
    ParsedUrl parsed;
    auto schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw std::invalid_argument("URL missing scheme: " + url);
    }
    parsed.scheme = url.substr(0, schemeEnd);
    std::transform(parsed.scheme.begin(), parsed.scheme.end(), parsed.scheme.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (parsed.scheme != "http" && parsed.scheme != "https") {
        throw std::invalid_argument("Unsupported URL scheme: " + parsed.scheme);
    }
    auto hostStart = schemeEnd + 3;
    auto pathPos = url.find_first_of("/?", hostStart);
    std::string hostPort = pathPos == std::string::npos ? url.substr(hostStart) : url.substr(hostStart, pathPos - hostStart);
    auto colonPos = hostPort.find(':');
    if (colonPos == std::string::npos) {
        parsed.host = hostPort;
        parsed.port = (parsed.scheme == "https") ? "443" : "80";
    } else {
        parsed.host = hostPort.substr(0, colonPos);
        parsed.port = hostPort.substr(colonPos + 1);
    }
    if (parsed.host.empty()) {
        throw std::invalid_argument("URL missing host: " + url);
    }
    parsed.target = pathPos == std::string::npos ? "/" : url.substr(pathPos);
    if (parsed.target.empty()) {
        parsed.target = "/";
    } else if (parsed.target.front() == '?') {
        parsed.target.insert(parsed.target.begin(), '/');
    }
    return parsed;
}

bool isRedirect(boost::beast::http::status status) {
    switch (status) {
    case boost::beast::http::status::moved_permanently:
    case boost::beast::http::status::found:
    case boost::beast::http::status::see_other:
    case boost::beast::http::status::temporary_redirect:
    case boost::beast::http::status::permanent_redirect:
        return true;
    default:
        return false;
    }
}

std::string combineLocation(const ParsedUrl& base, const std::string& location) {
    if (location.empty()) {
        return base.scheme + "://" + base.host + base.target;
    }
    if (location.rfind("http://", 0) == 0 || location.rfind("https://", 0) == 0) {
        return location;
    }
    std::string prefix = base.scheme + "://" + base.host;
    if (!base.port.empty() && base.port != "80" && base.port != "443") {
        prefix += ":" + base.port;
    }
    if (location.front() == '/') {
        return prefix + location;
    }
    auto slashPos = base.target.find_last_of('/');
    std::string basePath = slashPos == std::string::npos ? "/" : base.target.substr(0, slashPos + 1);
    return prefix + basePath + location;
}

boost::beast::http::verb toVerb(const std::string& method) {
    std::string upper;
    upper.reserve(method.size());
    std::transform(method.begin(), method.end(), std::back_inserter(upper), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "GET") return boost::beast::http::verb::get;
    if (upper == "POST") return boost::beast::http::verb::post;
    if (upper == "PUT") return boost::beast::http::verb::put;
    if (upper == "DELETE") return boost::beast::http::verb::delete_;
    if (upper == "PATCH") return boost::beast::http::verb::patch;
    if (upper == "HEAD") return boost::beast::http::verb::head;
    if (upper == "OPTIONS") return boost::beast::http::verb::options;
    throw std::invalid_argument("Unsupported HTTP method: " + method);
}

std::uint16_t toPort(const std::string& port) {
    unsigned long value = 0;
    try {
        value = std::stoul(port);
    } catch (const std::exception&) {
        throw std::invalid_argument("Invalid port: " + port);
    }
    if (value == 0 || value > 65535) {
        throw std::invalid_argument("Invalid port: " + port);
    }
    return static_cast<std::uint16_t>(value);
}

const char* socksReplyText(unsigned char code) {
    switch (code) {
    case 0x01: return "general SOCKS server failure";
    case 0x02: return "connection not allowed by ruleset";
    case 0x03: return "network unreachable";
    case 0x04: return "host unreachable";
    case 0x05: return "connection refused";
    case 0x06: return "TTL expired";
    case 0x07: return "command not supported";
    case 0x08: return "address type not supported";
    default:   return "unknown SOCKS error";
    }
}

template <std::size_t N>
void readExactly(boost::asio::io_context& io, boost::beast::tcp_stream& stream, std::array<unsigned char, N>& out,
                 std::size_t count = N) {
    runBlocking(io, [&](auto handler) {
        boost::asio::async_read(stream, boost::asio::buffer(out.data(), count), std::move(handler));
    });
}

// RFC 1928 CONNECT with a domain-name address, no authentication.
void socksConnect(boost::asio::io_context& io,
                  boost::beast::tcp_stream& stream,
                  const std::string& host,
                  std::uint16_t port) {
    if (host.size() > 255) {
        throw std::invalid_argument("Host name too long for SOCKS5: " + host);
    }

    const std::array<unsigned char, 3> greeting{0x05, 0x01, 0x00};
    runBlocking(io, [&](auto handler) {
        boost::asio::async_write(stream, boost::asio::buffer(greeting), std::move(handler));
    });

    std::array<unsigned char, 2> choice{};
    readExactly(io, stream, choice);
    if (choice[0] != 0x05 || choice[1] != 0x00) {
        throw ProxyError(ProxyError::Type::handshake_rejected, choice[1],
                         "SOCKS5 proxy refused the no-auth method");
    }

    std::vector<unsigned char> request{0x05, 0x01, 0x00, 0x03, static_cast<unsigned char>(host.size())};
    request.insert(request.end(), host.begin(), host.end());
    request.push_back(static_cast<unsigned char>(port >> 8));
    request.push_back(static_cast<unsigned char>(port & 0xFF));
    runBlocking(io, [&](auto handler) {
        boost::asio::async_write(stream, boost::asio::buffer(request), std::move(handler));
    });

    std::array<unsigned char, 4> reply{};
    readExactly(io, stream, reply);
    if (reply[0] != 0x05) {
        throw ProxyError(ProxyError::Type::connect_failed, reply[0], "SOCKS5 proxy sent a malformed reply");
    }
    if (reply[1] != 0x00) {
        throw ProxyError(ProxyError::Type::connect_failed, reply[1],
                         std::string{"SOCKS5 connect failed: "} + socksReplyText(reply[1]));
    }

    std::array<unsigned char, 256> bound{};
    switch (reply[3]) {
    case 0x01:
        readExactly(io, stream, bound, 4 + 2);
        break;
    case 0x04:
        readExactly(io, stream, bound, 16 + 2);
        break;
    case 0x03: {
        std::array<unsigned char, 1> length{};
        readExactly(io, stream, length);
        readExactly(io, stream, bound, static_cast<std::size_t>(length[0]) + 2);
        break;
    }
    default:
        throw ProxyError(ProxyError::Type::connect_failed, reply[3], "SOCKS5 reply has unknown address type");
    }
}

template <typename Stream>
HttpClient::HttpResponse exchange(boost::asio::io_context& io, Stream& stream, HttpClient::HttpRequest& request) {
    runBlocking(io, [&](auto handler) {
        boost::beast::http::async_write(stream, request, std::move(handler));
    });
    boost::beast::flat_buffer buffer;
    HttpClient::HttpResponse response;
    runBlocking(io, [&](auto handler) {
        boost::beast::http::async_read(stream, buffer, response, std::move(handler));
    });
    return response;
}

} // namespace

HttpClient::HttpClient()
    : sslContext_(boost::asio::ssl::context::tls_client) {
    sslContext_.set_default_verify_paths();
    sslContext_.set_verify_mode(boost::asio::ssl::verify_none);
}

HttpClient::HttpResponse HttpClient::fetch(HttpRequest request,
                                           const std::string& scheme,
                                           std::chrono::milliseconds timeout,
                                           const model::Endpoint* socksProxy) {
    request.version(kHttpVersion);
    if (request.count(boost::beast::http::field::host) == 0) {
        throw std::runtime_error("request missing Host header");
    }

    ParsedUrl parsed;
    parsed.scheme = scheme;
    parsed.host = std::string(request[boost::beast::http::field::host]);
    parsed.port = (scheme == "https") ? "443" : "80";
    auto colon = parsed.host.find(':');
    if (colon != std::string::npos) {
        parsed.port = parsed.host.substr(colon + 1);
        parsed.host = parsed.host.substr(0, colon);
    }

    boost::asio::io_context io;
    boost::asio::ip::tcp::resolver resolver(io);
    auto results = socksProxy
                       ? resolver.resolve(socksProxy->host, std::to_string(socksProxy->port))
                       : resolver.resolve(parsed.host, parsed.port);

    if (parsed.scheme == "https") {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(io, sslContext_);
        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(timeout);
        runBlocking(io, [&](auto handler) { lowest.async_connect(results, std::move(handler)); });
        if (socksProxy) {
            socksConnect(io, lowest, parsed.host, toPort(parsed.port));
        }

        if (!SSL_set_tlsext_host_name(stream.native_handle(), parsed.host.c_str())) {
            throw std::runtime_error("Failed to set SNI host name");
        }
        runBlocking(io, [&](auto handler) {
            stream.async_handshake(boost::asio::ssl::stream_base::client, std::move(handler));
        });

        auto response = exchange(io, stream, request);

        try {
            runBlocking(io, [&](auto handler) { stream.async_shutdown(std::move(handler)); });
        } catch (const boost::system::system_error& ex) {
            if (ex.code() != boost::asio::error::eof && ex.code() != boost::asio::ssl::error::stream_truncated) {
                log(LogLevel::debug, std::string{"TLS shutdown with "} + parsed.host + " ended uncleanly: " + ex.what());
            }
        }
        return response;
    }

    boost::beast::tcp_stream stream(io);
    stream.expires_after(timeout);
    runBlocking(io, [&](auto handler) { stream.async_connect(results, std::move(handler)); });
    if (socksProxy) {
        socksConnect(io, stream, parsed.host, toPort(parsed.port));
    }

    auto response = exchange(io, stream, request);

    boost::system::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
        log(LogLevel::debug, "Socket shutdown with " + parsed.host + ": " + ec.message());
    }
    return response;
}

HttpClient::HttpResponse HttpClient::fetch(const std::string& method,
                                           const std::string& url,
                                           const std::vector<Header>& headers,
                                           const std::string& body,
                                           std::chrono::milliseconds timeout,
                                           bool followRedirects,
                                           unsigned int maxRedirects,
                                           std::string* effectiveUrl,
                                           const model::Endpoint* socksProxy) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string currentUrl = url;
    std::string currentMethod = method;
    std::string currentBody = body;
    HttpResponse response;

    for (unsigned int redirect = 0; redirect <= maxRedirects; ++redirect) {
        ParsedUrl parsed = parseUrl(currentUrl);
        HttpRequest request{toVerb(currentMethod), parsed.target, kHttpVersion};
        if ((parsed.scheme == "http" && parsed.port == "80") || (parsed.scheme == "https" && parsed.port == "443")) {
            request.set(boost::beast::http::field::host, parsed.host);
        } else {
            request.set(boost::beast::http::field::host, parsed.host + ":" + parsed.port);
        }

        for (const auto& header : headers) {
            request.set(header.name, header.value);
        }

        if (!currentBody.empty() && request.method() != boost::beast::http::verb::get && request.method() != boost::beast::http::verb::head) {
            request.body() = currentBody;
            request.prepare_payload();
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            throw boost::system::system_error(boost::beast::error::timeout);
        }
        response = fetch(std::move(request), parsed.scheme, remaining, socksProxy);

        if (effectiveUrl) {
            *effectiveUrl = currentUrl;
        }

        if (!followRedirects || !isRedirect(response.result())) {
            return response;
        }

        auto locationIt = response.base().find(boost::beast::http::field::location);
        if (locationIt == response.base().end()) {
            return response;
        }

        std::string location = std::string(locationIt->value());
        currentUrl = combineLocation(parsed, location);

        if (response.result() == boost::beast::http::status::see_other && currentMethod != "GET" && currentMethod != "HEAD") {
            currentMethod = "GET";
            currentBody.clear();
        }
    }

    throw std::runtime_error("Maximum redirect count exceeded");
}

} // namespace torgrab::util
