// ═══════════════════════════════════════════════════════════════════
//  src/http.cpp — Boost.Beast transport for http::Server
// ═══════════════════════════════════════════════════════════════════

#include "batchql/http.h"
#include "batchql/console.h"

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <atomic>
#include <cctype>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace batchql::http {

namespace beast  = boost::beast;
namespace net    = boost::asio;
namespace bhttp  = beast::http;
using tcp        = net::ip::tcp;

using BeastRequest = bhttp::request<bhttp::string_body>;

// GraphQL documents and variables; anything larger is answered with 413.
constexpr std::uint64_t kBodyLimit = 1024 * 1024;

namespace {

int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// %XX escapes and '+' as space; malformed escapes are kept literally.
std::string decodeComponent(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (std::size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '+') {
            out += ' ';
        } else if (in[i] == '%' && i + 2 < in.size() &&
                   hexDigit(in[i + 1]) >= 0 && hexDigit(in[i + 2]) >= 0) {
            out += static_cast<char>(hexDigit(in[i + 1]) * 16 + hexDigit(in[i + 2]));
            i += 2;
        } else {
            out += in[i];
        }
    }
    return out;
}

Headers parseQuery(std::string_view qs) {
    Headers params;
    while (!qs.empty()) {
        auto amp = qs.find('&');
        auto pair = qs.substr(0, amp);
        qs = amp == std::string_view::npos ? std::string_view{} : qs.substr(amp + 1);
        if (pair.empty()) continue;

        auto eq = pair.find('=');
        if (eq == std::string_view::npos) {
            params[decodeComponent(pair)] = "";
        } else {
            params[decodeComponent(pair.substr(0, eq))] = decodeComponent(pair.substr(eq + 1));
        }
    }
    return params;
}

Request toRequest(const BeastRequest& msg, const tcp::socket& socket) {
    Request req;
    req.method  = std::string(msg.method_string());
    req.url     = std::string(msg.target());
    req.rawBody = msg.body();

    auto q = req.url.find('?');
    req.path = req.url.substr(0, q);
    if (q != std::string::npos) req.query = parseQuery(std::string_view(req.url).substr(q + 1));

    beast::error_code ec;
    auto peer = socket.remote_endpoint(ec);
    req.ip = ec ? "unknown" : peer.address().to_string();

    for (const auto& field : msg) {
        std::string name(field.name_string());
        for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        req.headers[name] = std::string(field.value());
    }
    return req;
}

} // namespace

// ═══════════════════════════════════════════
//  Server::Impl
// ═══════════════════════════════════════════
struct Server::Impl {
    // "METHOD path" -> handler
    std::unordered_map<std::string, RouteHandler> routes;
    std::unique_ptr<net::io_context> ioc;
    std::atomic<int> port{0};

    bool hasPath(const std::string& path) const {
        for (auto& [key, handler] : routes) {
            if (key.substr(key.find(' ') + 1) == path) return true;
        }
        return false;
    }

    void handleRequest(Request& req, Response& res) {
        auto it = routes.find(req.method + " " + req.path);
        if (it == routes.end()) {
            int status = hasPath(req.path) ? 405 : 404;
            res.status(status).json(nlohmann::json{
                {"error", status == 405 ? "Method Not Allowed" : "Not Found"},
                {"message", "Cannot " + req.method + " " + req.path}
            });
            return;
        }

        try {
            it->second(req, res);
        } catch (const std::exception& e) {
            console::error(req.method, req.path, "failed:", e.what());
            if (!res.headersSent()) {
                res.status(500).json(nlohmann::json{
                    {"error", "Internal Server Error"},
                    {"message", e.what()}
                });
            }
        }
    }
};

// ═══════════════════════════════════════════
//  Connection
//  Serves requests on one socket in sequence while keep-alive holds.
// ═══════════════════════════════════════════
class Connection : public std::enable_shared_from_this<Connection> {
public:
    Connection(tcp::socket socket, Server::Impl& server)
        : socket_(std::move(socket)), server_(server) {}

    void start() { read(); }

private:
    tcp::socket socket_;
    beast::flat_buffer buffer_;
    std::optional<bhttp::request_parser<bhttp::string_body>> parser_;
    Server::Impl& server_;

    void read() {
        parser_.emplace();
        parser_->body_limit(kBodyLimit);

        auto self = shared_from_this();
        bhttp::async_read(socket_, buffer_, *parser_,
            [self](beast::error_code ec, std::size_t) {
                if (ec == bhttp::error::body_limit) {
                    self->write(413, {{"Content-Type", "application/json; charset=utf-8"}},
                                nlohmann::json{{"error", "Payload Too Large"}}.dump(), 11, false);
                } else if (!ec) {
                    self->dispatch(self->parser_->release());
                }
            });
    }

    void dispatch(BeastRequest msg) {
        auto self = shared_from_this();
        unsigned version = msg.version();
        bool keepAlive = msg.keep_alive();

        Request req = toRequest(msg, socket_);
        Response res([self, version, keepAlive](int status, const Headers& headers,
                                                const std::string& body) {
            self->write(status, headers, body, version, keepAlive);
        });

        server_.handleRequest(req, res);

        if (!res.headersSent()) {
            res.status(500).json(nlohmann::json{
                {"error", "Internal Server Error"},
                {"message", "No response sent by handler"}
            });
        }
    }

    void write(int status, const Headers& headers, const std::string& body,
               unsigned version, bool keepAlive) {
        auto msg = std::make_shared<bhttp::response<bhttp::string_body>>(
            static_cast<bhttp::status>(status), version);
        for (auto& [key, value] : headers) {
            if (!value.empty()) msg->set(key, value);
        }
        msg->body() = body;
        msg->keep_alive(keepAlive);
        msg->prepare_payload();

        auto self = shared_from_this();
        bhttp::async_write(socket_, *msg,
            [self, msg, keepAlive](beast::error_code ec, std::size_t) {
                if (!ec && keepAlive) {
                    self->read();
                    return;
                }
                beast::error_code ignored;
                self->socket_.shutdown(tcp::socket::shutdown_send, ignored);
            });
    }
};

// ═══════════════════════════════════════════
//  Acceptor
// ═══════════════════════════════════════════
class Acceptor : public std::enable_shared_from_this<Acceptor> {
public:
    Acceptor(net::io_context& ioc, const tcp::endpoint& endpoint, Server::Impl& server)
        : ioc_(ioc), acceptor_(ioc), server_(server) {
        beast::error_code ec;
        acceptor_.open(endpoint.protocol(), ec);
        if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (!ec) acceptor_.bind(endpoint, ec);
        if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            throw std::runtime_error("Cannot listen on " + endpoint.address().to_string() + ":" +
                                     std::to_string(endpoint.port()) + ": " + ec.message());
        }
    }

    int port() const { return acceptor_.local_endpoint().port(); }

    void accept() {
        auto self = shared_from_this();
        acceptor_.async_accept(ioc_, [self](beast::error_code ec, tcp::socket socket) {
            if (ec == net::error::operation_aborted) return;
            if (ec) {
                console::warn("accept failed:", ec.message());
            } else {
                std::make_shared<Connection>(std::move(socket), self->server_)->start();
            }
            self->accept();
        });
    }

private:
    net::io_context& ioc_;
    tcp::acceptor    acceptor_;
    Server::Impl&    server_;
};

// ═══════════════════════════════════════════
//  Server
// ═══════════════════════════════════════════

Server::Server() : impl_(std::make_unique<Impl>()) {}
Server::~Server() = default;
Server::Server(Server&&) noexcept = default;
Server& Server::operator=(Server&&) noexcept = default;

Server& Server::route(const std::string& method, const std::string& path, RouteHandler handler) {
    impl_->routes[method + " " + path] = std::move(handler);
    return *this;
}

void Server::handleRequest(Request& req, Response& res) {
    impl_->handleRequest(req, res);
}

void Server::listen(int port, std::function<void()> callback) {
    listen("0.0.0.0", port, std::move(callback));
}

void Server::listen(const std::string& host, int port, std::function<void()> callback) {
    impl_->ioc = std::make_unique<net::io_context>(1);

    auto endpoint = tcp::endpoint(net::ip::make_address(host), static_cast<unsigned short>(port));
    auto acceptor = std::make_shared<Acceptor>(*impl_->ioc, endpoint, *impl_);
    impl_->port = acceptor->port();
    acceptor->accept();

    if (callback) callback();
    impl_->ioc->run();
}

int Server::port() const {
    return impl_->port;
}

void Server::close() {
    if (impl_->ioc) impl_->ioc->stop();
}

} // namespace batchql::http
