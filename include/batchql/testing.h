#pragma once
// ═══════════════════════════════════════════════════════════════════
//  batchql/testing.h — In-process request injection for tests
// ═══════════════════════════════════════════════════════════════════
//
//    testing::TestClient client(app);
//    auto res = client.post("/graphql")
//                   .send(nlohmann::json{{"query", "{ dogs { name } }"}})
//                   .exec();
//    EXPECT_EQ(res.status, 200);
//
// ═══════════════════════════════════════════════════════════════════

#include "http.h"
#include "json_utils.h"
#include <stdexcept>
#include <string>

namespace batchql::testing {

inline http::Request createRequest(const std::string& method = "GET",
                                   const std::string& path = "/",
                                   const std::string& body = "") {
    http::Request req;
    req.method = method;
    req.path = path;
    req.url = path;
    req.rawBody = body;
    req.ip = "127.0.0.1";
    return req;
}

struct TestResult {
    int status = 0;
    std::string body;
    http::Headers headers;

    nlohmann::json json() const { return nlohmann::json::parse(body); }
};

class TestClient {
public:
    explicit TestClient(http::Server& app) : app_(app) {}

    class RequestBuilder {
    public:
        RequestBuilder(http::Server& app, const std::string& method, const std::string& path)
            : app_(app), method_(method), path_(path) {}

        RequestBuilder& set(const std::string& key, const std::string& value) {
            headers_[key] = value;
            return *this;
        }

        RequestBuilder& send(const std::string& body) {
            body_ = body;
            return *this;
        }

        RequestBuilder& send(const nlohmann::json& j) {
            body_ = j.dump();
            headers_["content-type"] = "application/json";
            return *this;
        }

        RequestBuilder& query(const std::string& key, const std::string& value) {
            query_[key] = value;
            return *this;
        }

        TestResult expect(int expectedStatus) {
            auto result = exec();
            if (result.status != expectedStatus) {
                throw std::runtime_error(
                    "Expected status " + std::to_string(expectedStatus) +
                    " but got " + std::to_string(result.status) + ": " + result.body);
            }
            return result;
        }

        TestResult exec() {
            auto req = createRequest(method_, path_, body_);
            req.headers = headers_;
            req.query = query_;

            http::Response res;
            app_.handleRequest(req, res);

            TestResult result;
            result.status = res.getStatusCode();
            result.body = res.getBody();
            result.headers = res.getHeaders();
            return result;
        }

    private:
        http::Server& app_;
        std::string method_;
        std::string path_;
        std::string body_;
        http::Headers headers_;
        http::Headers query_;
    };

    RequestBuilder get(const std::string& path) { return {app_, "GET", path}; }
    RequestBuilder post(const std::string& path) { return {app_, "POST", path}; }

private:
    http::Server& app_;
};

} // namespace batchql::testing
