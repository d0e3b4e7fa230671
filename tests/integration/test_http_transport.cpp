#include <gtest/gtest.h>
#include "ambassador/transport/http_transport.hpp"
#include "ambassador/error.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <thread>

using namespace ambassador;

class HttpTransportTest : public ::testing::Test {
protected:
    httplib::Server server_;
    std::thread server_thread_;
    int port_ = 0;

    void SetUp() override {
        server_.Get("/v1/tools", [](const httplib::Request& req, httplib::Response& res) {
            nlohmann::json body = {
                {"tools", nlohmann::json::array()},
                {"token", req.get_header_value("X-Session-Token")},
                {"content_type", req.get_header_value("Content-Type")}
            };
            res.set_content(body.dump(), "application/json");
        });
        server_.Post("/v1/echo", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(req.body, "application/json");
        });
        server_.Post("/v1/sessions/heartbeat", [](const httplib::Request&, httplib::Response& res) {
            res.status = 200;
        });
        server_.Get("/v1/not-json", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("<html>hello</html>", "text/html");
        });
        server_.Get("/v1/expired", [](const httplib::Request&, httplib::Response& res) {
            res.status = 401;
            res.set_content(R"({"error":"session_expired","message":"Session has expired"})", "application/json");
        });
        server_.Get("/v1/nested-error", [](const httplib::Request&, httplib::Response& res) {
            res.status = 403;
            res.set_content(R"({"error":{"code":"forbidden","message":"Not allowed"}})", "application/json");
        });
        server_.Get("/v1/flat-error", [](const httplib::Request&, httplib::Response& res) {
            res.status = 400;
            res.set_content(R"({"code":"bad_request","message":"Missing tool"})", "application/json");
        });
        server_.Get("/v1/text-error", [](const httplib::Request&, httplib::Response& res) {
            res.status = 502;
            res.set_content("Bad Gateway", "text/plain");
        });
        server_.Get("/v1/huge", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(std::string(64 * 1024, 'a'), "application/json");
        });
        server_.Get("/v1/huge-chunked", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("application/json",
                [](size_t offset, httplib::DataSink& sink) {
                    if (offset >= 64 * 1024) {
                        sink.done();
                        return true;
                    }
                    std::string chunk(4096, 'b');
                    return sink.write(chunk.data(), chunk.size());
                });
        });
        server_.Get("/v1/slow", [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            res.set_content("{}", "application/json");
        });
        server_.Get("/api/v1/tools", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(R"({"prefixed":true})", "application/json");
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        server_thread_ = std::thread([this] { server_.listen_after_bind(); });
        for (int i = 0; i < 100 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    void TearDown() override {
        server_.stop();
        if (server_thread_.joinable()) server_thread_.join();
    }

    HttpTransportOptions options() {
        HttpTransportOptions opts;
        opts.base_url = "http://127.0.0.1:" + std::to_string(port_);
        opts.request_timeout = std::chrono::milliseconds(5000);
        return opts;
    }
};

TEST_F(HttpTransportTest, GetParsesJsonAndSendsHeaders) {
    HttpClientTransport http(options());
    auto body = http.send({"GET", "/v1/tools", std::nullopt, std::string("tok-123"), std::nullopt});
    EXPECT_TRUE(body["tools"].is_array());
    EXPECT_EQ(body["token"], "tok-123");
    EXPECT_EQ(body["content_type"], "application/json");
}

TEST_F(HttpTransportTest, UnauthenticatedRequestHasNoTokenHeader) {
    HttpClientTransport http(options());
    auto body = http.send({"GET", "/v1/tools", std::nullopt, std::nullopt, std::nullopt});
    EXPECT_EQ(body["token"], "");
}

TEST_F(HttpTransportTest, PostSendsJsonBody) {
    HttpClientTransport http(options());
    nlohmann::json payload = {{"tool", "search"}, {"arguments", {{"q", "x"}}}};
    auto body = http.send({"POST", "/v1/echo", payload, std::nullopt, std::nullopt});
    EXPECT_EQ(body, payload);
}

TEST_F(HttpTransportTest, EmptySuccessBodyIsNull) {
    HttpClientTransport http(options());
    auto body = http.send({"POST", "/v1/sessions/heartbeat", nlohmann::json::object(),
                           std::string("t"), std::nullopt});
    EXPECT_TRUE(body.is_null());
}

TEST_F(HttpTransportTest, InvalidJsonIsDistinctError) {
    HttpClientTransport http(options());
    EXPECT_THROW((void)http.send({"GET", "/v1/not-json", std::nullopt, std::nullopt, std::nullopt}),
                 InvalidResponseError);
}

TEST_F(HttpTransportTest, UnauthorizedCarriesBackendCode) {
    HttpClientTransport http(options());
    try {
        (void)http.send({"GET", "/v1/expired", std::nullopt, std::nullopt, std::nullopt});
        FAIL() << "expected HttpStatusError";
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status, 401);
        EXPECT_EQ(e.backend_code, "session_expired");
        EXPECT_EQ(classify_unauthorized(e), AuthFailure::SessionExpired);
        EXPECT_NE(std::string(e.what()).find("Session has expired"), std::string::npos);
    }
}

TEST_F(HttpTransportTest, ErrorBodyShapes) {
    HttpClientTransport http(options());
    try {
        (void)http.send({"GET", "/v1/nested-error", std::nullopt, std::nullopt, std::nullopt});
        FAIL();
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status, 403);
        EXPECT_EQ(e.backend_code, "forbidden");
        EXPECT_NE(std::string(e.what()).find("Not allowed"), std::string::npos);
    }
    try {
        (void)http.send({"GET", "/v1/flat-error", std::nullopt, std::nullopt, std::nullopt});
        FAIL();
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status, 400);
        EXPECT_EQ(e.backend_code, "bad_request");
    }
    try {
        (void)http.send({"GET", "/v1/text-error", std::nullopt, std::nullopt, std::nullopt});
        FAIL();
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status, 502);
        EXPECT_EQ(e.backend_code, "");
        EXPECT_NE(std::string(e.what()).find("Bad Gateway"), std::string::npos);
    }
}

TEST_F(HttpTransportTest, NotFoundIsStatusError) {
    HttpClientTransport http(options());
    try {
        (void)http.send({"GET", "/v1/missing", std::nullopt, std::nullopt, std::nullopt});
        FAIL();
    } catch (const HttpStatusError& e) {
        EXPECT_EQ(e.status, 404);
    }
}

TEST_F(HttpTransportTest, ResponseCeilingWithContentLength) {
    auto opts = options();
    opts.max_response_bytes = 1024;
    HttpClientTransport http(opts);
    EXPECT_THROW((void)http.send({"GET", "/v1/huge", std::nullopt, std::nullopt, std::nullopt}),
                 ResponseTooLargeError);
}

TEST_F(HttpTransportTest, ResponseCeilingWhileStreaming) {
    auto opts = options();
    opts.max_response_bytes = 10000;
    HttpClientTransport http(opts);
    EXPECT_THROW((void)http.send({"GET", "/v1/huge-chunked", std::nullopt, std::nullopt, std::nullopt}),
                 ResponseTooLargeError);
}

TEST_F(HttpTransportTest, BasePathPrefixesRequests) {
    auto opts = options();
    opts.base_path = "/api";
    HttpClientTransport http(opts);
    auto body = http.send({"GET", "/v1/tools", std::nullopt, std::nullopt, std::nullopt});
    EXPECT_EQ(body["prefixed"], true);
}

TEST_F(HttpTransportTest, ConnectionRefusedIsTransportError) {
    HttpTransportOptions opts;
    opts.base_url = "http://127.0.0.1:1";
    opts.connect_timeout = std::chrono::milliseconds(1000);
    HttpClientTransport http(opts);
    try {
        (void)http.send({"GET", "/v1/tools", std::nullopt, std::nullopt, std::nullopt});
        FAIL() << "expected TransportError";
    } catch (const HttpStatusError&) {
        FAIL() << "network failure must not look like a status error";
    } catch (const TransportError&) {
        SUCCEED();
    }
}

TEST_F(HttpTransportTest, RequestTimeout) {
    HttpClientTransport http(options());
    auto begin = std::chrono::steady_clock::now();
    EXPECT_THROW((void)http.send({"GET", "/v1/slow", std::nullopt, std::nullopt,
                                  std::chrono::milliseconds(200)}),
                 TransportError);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1200));
}

TEST_F(HttpTransportTest, CancelAllAbortsInflight) {
    HttpClientTransport http(options());
    std::atomic<bool> failed{false};
    auto begin = std::chrono::steady_clock::now();
    std::thread caller([&] {
        try {
            (void)http.send({"GET", "/v1/slow", std::nullopt, std::nullopt, std::nullopt});
        } catch (const TransportError&) {
            failed = true;
        }
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    http.cancel_all();
    caller.join();

    EXPECT_TRUE(failed);
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(1200));
}
