// Integration tests: HttpConnector against a real loopback server.
//
// The connector runs on an io_context driven from the test thread; the
// cpp-httplib server runs on its own thread. Every wait is bounded so a
// bug cannot hang CI. Malformed peers are covered by test_pending_request.

#include <gtest/gtest.h>
#include <httplib.h>
#include <zlib.h>

#include <atomic>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "http_connector/connector.hpp"
#include "http_connector/error.hpp"
#include "http_connector/host.hpp"

namespace net = boost::asio;

using namespace http_connector;
using namespace std::chrono_literals;

namespace {

    using tcp = net::ip::tcp;

    // ---------------------
    // Test HTTP Server
    // ---------------------
    struct HttpTestServer {
        using Handler =
            std::function<void(const httplib::Request&, httplib::Response&)>;

        explicit HttpTestServer(Handler h, bool honor_keep_alive = false)
            : handler_(std::move(h)), honor_keep_alive_(honor_keep_alive) {
            svr_.set_keep_alive_max_count(honor_keep_alive ? 10 : 1);
            svr_.set_keep_alive_timeout(5);

            auto func = [this](const httplib::Request& req,
                               httplib::Response& res) {
                request_count++;
                {
                    std::lock_guard lk(last_req_mu_);
                    last_method = req.method;
                    last_target = req.target;
                    last_body = req.body;
                    last_content_length =
                        req.get_header_value("Content-Length");
                    last_user_agent = req.get_header_value("User-Agent");
                    last_opaque_id = req.get_header_value("X-Opaque-Id");
                }

                int cur = inflight.fetch_add(1) + 1;
                int prev = max_inflight.load();
                while (cur > prev &&
                       !max_inflight.compare_exchange_weak(prev, cur)) {
                }

                handler_(req, res);

                if (!honor_keep_alive_) {
                    res.set_header("Connection", "close");
                }

                inflight.fetch_sub(1);
            };

            svr_.Get(".*", func);
            svr_.Post(".*", func);
            svr_.Put(".*", func);
            svr_.Delete(".*", func);

            port_ = svr_.bind_to_any_port("127.0.0.1");
            thread_ = std::thread([this] { svr_.listen_after_bind(); });
        }

        ~HttpTestServer() {
            svr_.stop();
            if (thread_.joinable()) thread_.join();
        }

        std::uint16_t port() const noexcept {
            return static_cast<std::uint16_t>(port_);
        }

        std::atomic<int> request_count{0};
        std::atomic<int> max_inflight{0};
        std::atomic<int> inflight{0};

        std::mutex last_req_mu_;
        std::string last_method;
        std::string last_target;
        std::string last_body;
        std::string last_content_length;
        std::string last_user_agent;
        std::string last_opaque_id;

       private:
        httplib::Server svr_;
        Handler handler_;
        bool honor_keep_alive_;
        std::thread thread_;
        int port_;
    };

    // ---------------------
    // Helpers
    // ---------------------
    struct Outcome {
        std::optional<Error> error;
        std::optional<std::string> body;
        int status = -1;
        ResponseHeaders headers;
    };

    CompletionHandler collect(std::vector<Outcome>& out) {
        return [&out](std::optional<Error> error,
                      std::optional<std::string> body, int status,
                      ResponseHeaders headers) {
            out.push_back(Outcome{std::move(error), std::move(body), status,
                                  std::move(headers)});
        };
    }

    // Drive the loop until pred holds or the timeout elapses.
    bool run_until(net::io_context& ioc, const std::function<bool()>& pred,
                   std::chrono::milliseconds timeout = 5000ms) {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!pred()) {
            if (std::chrono::steady_clock::now() >= deadline) return false;
            if (ioc.stopped()) ioc.restart();
            if (ioc.run_one_for(10ms) == 0) {
                std::this_thread::sleep_for(1ms);
            }
        }
        return true;
    }

    // Keep the loop going for a while, for "nothing else happens" checks.
    void run_for(net::io_context& ioc, std::chrono::milliseconds d) {
        const auto deadline = std::chrono::steady_clock::now() + d;
        while (std::chrono::steady_clock::now() < deadline) {
            if (ioc.stopped()) ioc.restart();
            if (ioc.run_one_for(10ms) == 0) {
                std::this_thread::sleep_for(1ms);
            }
        }
    }

    std::string compress(const std::string& input, int window_bits) {
        z_stream zs{};
        if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, window_bits,
                         8, Z_DEFAULT_STRATEGY) != Z_OK) {
            throw std::runtime_error("deflateInit2 failed");
        }
        std::string out(deflateBound(&zs, static_cast<uLong>(input.size())),
                        '\0');
        zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
        zs.avail_in = static_cast<uInt>(input.size());
        zs.next_out = reinterpret_cast<Bytef*>(out.data());
        zs.avail_out = static_cast<uInt>(out.size());
        const int ret = deflate(&zs, Z_FINISH);
        deflateEnd(&zs);
        if (ret != Z_STREAM_END) throw std::runtime_error("deflate failed");
        out.resize(zs.total_out);
        return out;
    }

    Host loopback(std::uint16_t port) {
        Host h;
        h.protocol = "http";
        h.host = "127.0.0.1";
        h.port = port;
        return h;
    }

    std::uint16_t unused_port() {
        net::io_context ioc;
        tcp::acceptor a(ioc, {net::ip::make_address("127.0.0.1"), 0});
        return a.local_endpoint().port();
    }

}  // namespace

// ---------------------
// Tests
// ---------------------

TEST(IntegrationTest, GzipBodyIsDecoded) {
    HttpTestServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content(compress("{\"ok\":true}", 15 + 16), "application/json");
        res.set_header("Content-Encoding", "gzip");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));

    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].error.has_value());
    ASSERT_TRUE(out[0].body.has_value());
    EXPECT_EQ(*out[0].body, "{\"ok\":true}");
    EXPECT_EQ(out[0].status, 200);
    EXPECT_EQ(out[0].headers.at("content-encoding"), "gzip");
    EXPECT_EQ(server.last_method, "GET");
    EXPECT_EQ(server.last_target, "/");
}

TEST(IntegrationTest, DeflateBodyIsDecoded) {
    const std::string text(10000, 'x');
    HttpTestServer server([&](const httplib::Request&, httplib::Response& res) {
        res.set_content(compress(text, 15), "text/plain");
        res.set_header("Content-Encoding", "Deflate");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));

    ASSERT_FALSE(out[0].error.has_value());
    EXPECT_EQ(*out[0].body, text);
}

TEST(IntegrationTest, PlainBodyAndNonSuccessStatus) {
    HttpTestServer server([](const httplib::Request&, httplib::Response& res) {
        res.status = 404;
        res.set_content("{\"found\":false,\"name\":\"h\xC3\xA9\"}",
                        "application/json");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    RequestParams p;
    p.path = "/missing";
    connector.request(p, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));

    EXPECT_FALSE(out[0].error.has_value());
    EXPECT_EQ(out[0].status, 404);
    EXPECT_EQ(*out[0].body, "{\"found\":false,\"name\":\"h\xC3\xA9\"}");
    EXPECT_EQ(out[0].headers.at("content-type"), "application/json");
}

TEST(IntegrationTest, PostSendsBodyWithContentLength) {
    HttpTestServer server([](const httplib::Request& req,
                             httplib::Response& res) {
        res.set_content(req.body, "application/json");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    host.path = "/base";
    host.headers = {{"X-Opaque-Id", "host"}};
    host.query = {{"pretty", "true"}};
    ConnectorConfiguration cfg;
    cfg.user_agent = "http_connector_gtest";
    HttpConnector connector(ioc.get_executor(), host, cfg);

    std::vector<Outcome> out;
    RequestParams p;
    p.method = HttpMethod::Post;
    p.path = "/_doc";
    p.query = {{"refresh", "wait for"}};
    p.headers = {{"x-opaque-id", "request"},
                 {"Content-Type", "application/json"}};
    p.body = std::string("{\"title\":\"caf\xC3\xA9\"}");
    connector.request(p, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));

    ASSERT_FALSE(out[0].error.has_value());
    EXPECT_EQ(*out[0].body, *p.body);

    std::lock_guard lk(server.last_req_mu_);
    EXPECT_EQ(server.last_method, "POST");
    EXPECT_EQ(server.last_target, "/base/_doc?pretty=true&refresh=wait%20for");
    EXPECT_EQ(server.last_body, *p.body);
    EXPECT_EQ(server.last_content_length, std::to_string(p.body->size()));
    EXPECT_EQ(server.last_user_agent, "http_connector_gtest");
    EXPECT_EQ(server.last_opaque_id, "request");
}

TEST(IntegrationTest, GetWithoutBodySendsZeroContentLength) {
    HttpTestServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content("ok", "text/plain");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));

    ASSERT_FALSE(out[0].error.has_value());
    std::lock_guard lk(server.last_req_mu_);
    EXPECT_EQ(server.last_content_length, "0");
}

TEST(IntegrationTest, HeadResponseHasEmptyBody) {
    HttpTestServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content("this body is not sent for HEAD", "text/plain");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    RequestParams p;
    p.method = HttpMethod::Head;
    connector.request(p, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));

    ASSERT_FALSE(out[0].error.has_value());
    EXPECT_EQ(out[0].status, 200);
    EXPECT_EQ(*out[0].body, "");
}

TEST(IntegrationTest, KeepAliveReusesIdleSocket) {
    HttpTestServer server(
        [](const httplib::Request&, httplib::Response& res) {
            res.set_content("ok", "text/plain");
        },
        /*honor_keep_alive=*/true);

    net::io_context ioc;
    Host host = loopback(server.port());
    ConnectorConfiguration cfg;
    cfg.keep_alive = true;
    HttpConnector connector(ioc.get_executor(), host, cfg);

    std::vector<Outcome> out;
    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return out.size() == 1; }));
    ASSERT_FALSE(out[0].error.has_value());

    auto free = connector.agent()->free_sockets(host.key());
    ASSERT_EQ(free.size(), 1u);
    const auto first_id = free.front()->id();

    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return out.size() == 2; }));
    ASSERT_FALSE(out[1].error.has_value());

    auto stats = connector.agent()->stats();
    EXPECT_EQ(stats.created, 1u);
    EXPECT_EQ(stats.reused, 1u);
    free = connector.agent()->free_sockets(host.key());
    ASSERT_EQ(free.size(), 1u);
    EXPECT_EQ(free.front()->id(), first_id);
    EXPECT_EQ(free.front()->requests_served(), 2u);
}

TEST(IntegrationTest, ConnectionCloseResponseIsNotReused) {
    HttpTestServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content("ok", "text/plain");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return out.size() == 1; }));
    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return out.size() == 2; }));

    EXPECT_FALSE(out[1].error.has_value());
    EXPECT_EQ(connector.agent()->stats().created, 2u);
    EXPECT_EQ(connector.agent()->stats().reused, 0u);
    EXPECT_TRUE(connector.agent()->free_sockets(host.key()).empty());
}

TEST(IntegrationTest, MaxSocketsLimitsConcurrency) {
    HttpTestServer server(
        [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(20ms);
            res.set_content("ok", "text/plain");
        },
        /*honor_keep_alive=*/true);

    net::io_context ioc;
    Host host = loopback(server.port());
    ConnectorConfiguration cfg;
    cfg.max_sockets = 1;
    HttpConnector connector(ioc.get_executor(), host, cfg);

    std::vector<Outcome> out;
    for (int i = 0; i < 3; ++i) connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return out.size() == 3; }));

    for (const auto& o : out) EXPECT_FALSE(o.error.has_value());
    EXPECT_EQ(server.max_inflight.load(), 1);
    EXPECT_EQ(connector.agent()->stats().created, 1u);
    EXPECT_EQ(connector.agent()->stats().reused, 2u);
}

TEST(IntegrationTest, TraceSinkSeesCompletedRequest) {
    HttpTestServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content("pong", "text/plain");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    std::vector<RequestTrace> traces;
    ConnectorConfiguration cfg;
    cfg.trace = [&](const RequestTrace& t) { traces.push_back(t); };
    HttpConnector connector(ioc.get_executor(), host, cfg);

    std::vector<Outcome> out;
    RequestParams p;
    p.method = HttpMethod::Put;
    p.path = "/ping";
    p.body = std::string("ping");
    connector.request(p, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));

    ASSERT_EQ(traces.size(), 1u);
    EXPECT_EQ(traces[0].method, HttpMethod::Put);
    EXPECT_EQ(traces[0].target.path, "/ping");
    EXPECT_EQ(traces[0].request_body, "ping");
    EXPECT_EQ(traces[0].response_body, "pong");
    EXPECT_EQ(traces[0].status, 200);
}

TEST(IntegrationTest, ConnectionRefusedIsTransportError) {
    net::io_context ioc;
    Host host = loopback(unused_port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));
    run_for(ioc, 50ms);

    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].error.has_value());
    EXPECT_EQ(out[0].error->code, Error::Code::ConnectionFailed);
    EXPECT_TRUE(is_transport_error(out[0].error->code));
    EXPECT_FALSE(out[0].body.has_value());
    EXPECT_EQ(out[0].status, 0);
    EXPECT_TRUE(out[0].headers.empty());
    EXPECT_EQ(connector.agent()->stats().in_use, 0u);
}

TEST(IntegrationTest, MalformedGzipIsDecodingError) {
    HttpTestServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content("definitely not gzip", "application/json");
        res.set_header("Content-Encoding", "gzip");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));
    run_for(ioc, 50ms);

    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].error.has_value());
    EXPECT_EQ(out[0].error->code, Error::Code::DecodingFailed);
    EXPECT_FALSE(out[0].body.has_value());
    EXPECT_EQ(out[0].status, 200);
    EXPECT_EQ(out[0].headers.at("content-encoding"), "gzip");
    EXPECT_TRUE(connector.agent()->free_sockets(host.key()).empty());
}

TEST(IntegrationTest, CancelInFlightIsIdempotentAndFiresOnce) {
    HttpTestServer server([](const httplib::Request&, httplib::Response& res) {
        std::this_thread::sleep_for(300ms);
        res.set_content("too late", "text/plain");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    auto cancel = connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return server.request_count.load() == 1; }));

    cancel();
    cancel();
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));
    cancel();
    run_for(ioc, 500ms);

    ASSERT_EQ(out.size(), 1u);
    ASSERT_TRUE(out[0].error.has_value());
    EXPECT_EQ(out[0].error->code, Error::Code::Aborted);
    EXPECT_FALSE(out[0].body.has_value());

    auto stats = connector.agent()->stats();
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(stats.free, 0u);
    EXPECT_EQ(stats.destroyed, 1u);
}

TEST(IntegrationTest, CancelAfterCompletionIsNoop) {
    HttpTestServer server([](const httplib::Request&, httplib::Response& res) {
        res.set_content("done", "text/plain");
    });

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    auto cancel = connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));

    cancel();
    run_for(ioc, 50ms);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_FALSE(out[0].error.has_value());
    EXPECT_EQ(*out[0].body, "done");
}

TEST(IntegrationTest, ClosedStatusFailsInFlightAndLaterRequests) {
    HttpTestServer server(
        [](const httplib::Request&, httplib::Response& res) {
            std::this_thread::sleep_for(200ms);
            res.set_content("slow", "text/plain");
        },
        /*honor_keep_alive=*/true);

    net::io_context ioc;
    Host host = loopback(server.port());
    HttpConnector connector(ioc.get_executor(), host, {});

    std::vector<Outcome> out;
    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return server.request_count.load() == 1; }));

    connector.set_status(ConnectionStatus::Closed);
    ASSERT_TRUE(run_until(ioc, [&] { return !out.empty(); }));

    ASSERT_TRUE(out[0].error.has_value());
    EXPECT_EQ(out[0].error->code, Error::Code::ReceiveFailed);
    EXPECT_EQ(connector.agent()->max_sockets(), 0u);

    connector.request({}, collect(out));
    ASSERT_TRUE(run_until(ioc, [&] { return out.size() == 2; }));
    run_for(ioc, 300ms);

    ASSERT_EQ(out.size(), 2u);
    ASSERT_TRUE(out[1].error.has_value());
    EXPECT_EQ(out[1].error->code, Error::Code::PoolClosed);
    EXPECT_EQ(server.request_count.load(), 1);
    EXPECT_EQ(connector.agent()->stats().created, 1u);
}
