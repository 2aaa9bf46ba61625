#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/http.h — Minimal HTTP host for the GraphQL endpoint
// ═══════════════════════════════════════════════════════════════════
//
//  Usage:
//    http::Server app;
//    graphql::mount(app, gql);
//    app.listen(4000, [] { console::info("Listening on :4000"); });
//
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <algorithm>
#include <cctype>
#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace batchql::http {

class Request;
class Response;

using RouteHandler = std::function<void(Request&, Response&)>;
using Headers      = std::unordered_map<std::string, std::string>;

// ═══════════════════════════════════════════════════════════════════
//  class Request
// ═══════════════════════════════════════════════════════════════════
class Request {
public:
    std::string method;
    std::string url;            // full URL including query string
    std::string path;           // URL path without query string
    std::string rawBody;
    std::string ip;

    Headers headers;            // lowercase keys
    Headers query;              // query string parameters

    std::string header(const std::string& name) const {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
        auto it = headers.find(lower);
        return it != headers.end() ? it->second : "";
    }

    bool is(const std::string& type) const {
        return header("content-type").find(type) != std::string::npos;
    }
};

// ═══════════════════════════════════════════════════════════════════
//  class Response
//  The transport supplies a SendCallback; without one the response
//  just records what was sent (in-process injection, tests).
// ═══════════════════════════════════════════════════════════════════
class Response {
public:
    using SendCallback = std::function<void(int statusCode,
                                            const Headers& headers,
                                            const std::string& body)>;

    explicit Response(SendCallback cb) : sendCallback_(std::move(cb)) {}
    Response() = default;

    Response& status(int code) {
        statusCode_ = code;
        return *this;
    }

    Response& set(const std::string& key, const std::string& value) {
        headers_[key] = value;
        return *this;
    }

    void send(const std::string& body) {
        if (sent_) return;
        sent_ = true;
        if (headers_.find("Content-Type") == headers_.end()) {
            headers_["Content-Type"] = "text/plain; charset=utf-8";
        }
        body_ = body;
        if (sendCallback_) {
            sendCallback_(statusCode_, headers_, body_);
        }
    }

    template <typename T>
    void json(const T& data) {
        nlohmann::json j;
        if constexpr (std::is_same_v<std::decay_t<T>, nlohmann::json>) {
            j = data;
        } else if constexpr (std::is_same_v<std::decay_t<T>, JsonValue>) {
            j = data.raw();
        } else {
            j = nlohmann::json(data);
        }
        set("Content-Type", "application/json; charset=utf-8");
        send(j.dump());
    }

    bool headersSent() const { return sent_; }

    const std::string& getBody() const { return body_; }
    int getStatusCode() const { return statusCode_; }
    const Headers& getHeaders() const { return headers_; }

private:
    int statusCode_ = 200;
    Headers headers_;
    bool sent_ = false;
    SendCallback sendCallback_;
    std::string body_;
};

// ═══════════════════════════════════════════════════════════════════
//  class Server
//  Exact-path routing over Boost.Beast; the Beast types stay in
//  http.cpp behind the pimpl.
// ═══════════════════════════════════════════════════════════════════
class Server {
public:
    Server();
    ~Server();
    Server(Server&&) noexcept;
    Server& operator=(Server&&) noexcept;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    Server& get(const std::string& path, RouteHandler handler) {
        return route("GET", path, std::move(handler));
    }

    Server& post(const std::string& path, RouteHandler handler) {
        return route("POST", path, std::move(handler));
    }

    Server& route(const std::string& method, const std::string& path, RouteHandler handler);

    // ── Blocks running the event loop until close() ──
    void listen(int port, std::function<void()> callback = nullptr);
    void listen(const std::string& host, int port, std::function<void()> callback = nullptr);

    // ── Port bound by listen(); differs from the requested one for port 0 ──
    int port() const;

    void close();

    // ── Dispatch one request (used by the transport and by tests) ──
    void handleRequest(Request& req, Response& res);

private:
    friend class Connection;
    friend class Acceptor;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace batchql::http
