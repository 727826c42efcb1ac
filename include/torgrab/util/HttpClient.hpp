#pragma once

#include "torgrab/model/Endpoint.hpp"

#include <boost/asio/ssl/context.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

namespace torgrab::util {

class ProxyError : public std::runtime_error {
public:
    enum class Type {
        handshake_rejected,
        connect_failed,
    };

    ProxyError(Type type, int status, const std::string& message)
        : std::runtime_error(message)
        , type_(type)
        , status_(status) {}

    [[nodiscard]] Type type() const noexcept { return type_; }

    // SOCKS5 reply code (or selected method for handshake failures).
    [[nodiscard]] int status() const noexcept { return status_; }

private:
    Type type_;
    int status_;
};

// Blocking HTTP/1.1 client. Every call runs on its own io_context, so one instance
// can be shared by any number of worker threads. When a SOCKS endpoint is given the
// target host name is resolved by the proxy (socks5h semantics), which is what keeps
// DNS lookups inside the Tor circuit.
class HttpClient {
public:
    using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
    using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

    struct Header {
        std::string name;
        std::string value;
    };

    HttpClient();

    HttpResponse fetch(HttpRequest request,
                       const std::string& scheme,
                       std::chrono::milliseconds timeout,
                       const model::Endpoint* socksProxy = nullptr);

    HttpResponse fetch(const std::string& method,
                       const std::string& url,
                       const std::vector<Header>& headers,
                       const std::string& body,
                       std::chrono::milliseconds timeout,
                       bool followRedirects = false,
                       unsigned int maxRedirects = 5,
                       std::string* effectiveUrl = nullptr,
                       const model::Endpoint* socksProxy = nullptr);

private:
    boost::asio::ssl::context sslContext_;
};

} // namespace torgrab::util
