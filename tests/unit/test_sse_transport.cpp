#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "dispatch/dispatch_core.hpp"
#include "recording_composer.hpp"
#include "session/draft_registry.hpp"
#include "transport/sse_channel.hpp"
#include "transport/sse_transport.hpp"

namespace {

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

using draftline::dispatch::DispatchCore;
using draftline::session::DraftRegistry;
using draftline::test_support::RecordingComposer;
using draftline::transport::HttpRequest;
using draftline::transport::PostOutcome;
using draftline::transport::SseChannelHub;
using draftline::transport::SseOptions;
using draftline::transport::SseServer;
using draftline::transport::format_sse_event;
using nlohmann::json;

std::shared_ptr<const DispatchCore> make_dispatch() {
    return std::make_shared<const DispatchCore>(std::make_shared<DraftRegistry>(),
                                                std::make_shared<RecordingComposer>());
}

HttpRequest make_request(http::verb method, const std::string& target,
                         const std::string& body = "") {
    HttpRequest request{method, target, 11};
    request.body() = body;
    request.prepare_payload();
    return request;
}

// Minimal blocking HTTP client for the live-server tests.
class SseClient {
public:
    explicit SseClient(std::uint16_t port) : port_(port), stream_(ioc_) {}

    // Opens GET /sse and reads the response header.
    void open_stream() {
        stream_.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port_});
        HttpRequest request{http::verb::get, "/sse", 11};
        request.set(http::field::host, "127.0.0.1");
        request.set(http::field::accept, "text/event-stream");
        http::write(stream_, request);
        parser_.body_limit(boost::none);
        http::read_header(stream_, buffer_, parser_);
    }

    http::status stream_status() const { return parser_.get().result(); }

    // Reads stream data until `count` occurrences of `needle` arrived or
    // five seconds pass. Returns everything received so far.
    std::string read_until(const std::string& needle, std::size_t count) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (occurrences(parser_.get().body(), needle) < count &&
               std::chrono::steady_clock::now() < deadline) {
            beast::error_code ec;
            http::read_some(stream_, buffer_, parser_, ec);
            if (ec) {
                break;
            }
        }
        return parser_.get().body();
    }

    http::response<http::string_body> post(const std::string& target, const json& body) {
        net::io_context ioc;
        tcp::socket socket(ioc);
        socket.connect(tcp::endpoint{net::ip::make_address("127.0.0.1"), port_});
        HttpRequest request{http::verb::post, target, 11};
        request.set(http::field::host, "127.0.0.1");
        request.set(http::field::content_type, "application/json");
        request.body() = body.dump();
        request.prepare_payload();
        http::write(socket, request);

        beast::flat_buffer buffer;
        http::response<http::string_body> response;
        http::read(socket, buffer, response);
        beast::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return response;
    }

    void close() {
        beast::error_code ec;
        stream_.shutdown(tcp::socket::shutdown_both, ec);
        stream_.close(ec);
    }

private:
    static std::size_t occurrences(const std::string& text, const std::string& needle) {
        std::size_t found = 0;
        for (auto pos = text.find(needle); pos != std::string::npos;
             pos = text.find(needle, pos + needle.size())) {
            ++found;
        }
        return found;
    }

    std::uint16_t port_;
    net::io_context ioc_;
    tcp::socket stream_;
    beast::flat_buffer buffer_;
    http::response_parser<http::string_body> parser_;
};

// Data payloads of every `event: <name>` frame in a stream body, in order.
std::vector<std::string> event_data(const std::string& body, const std::string& name) {
    std::vector<std::string> payloads;
    const std::string marker = "event: " + name + "\ndata: ";
    for (auto pos = body.find(marker); pos != std::string::npos;
         pos = body.find(marker, pos + marker.size())) {
        const auto begin = pos + marker.size();
        payloads.push_back(body.substr(begin, body.find('\n', begin) - begin));
    }
    return payloads;
}

TEST(SseEventTest, FormatsSingleAndMultiLineData) {
    EXPECT_EQ(format_sse_event("endpoint", "/messages?session_id=ab"),
              "event: endpoint\ndata: /messages?session_id=ab\n\n");
    EXPECT_EQ(format_sse_event("message", "a\nb"), "event: message\ndata: a\ndata: b\n\n");
}

TEST(SseChannelTest, QueuesInArrivalOrder) {
    SseChannelHub hub;
    auto channel = hub.open(make_dispatch(), false);
    EXPECT_EQ(hub.size(), 1u);
    EXPECT_EQ(hub.find(channel->id()), channel);

    EXPECT_EQ(channel->post(json{{"n", 1}}), PostOutcome::Queued);
    EXPECT_EQ(channel->post(json{{"n", 2}}), PostOutcome::Queued);
    EXPECT_EQ(channel->pending(), 2u);

    auto first = channel->next(std::chrono::milliseconds(10));
    auto second = channel->next(std::chrono::milliseconds(10));
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ((*first)["n"], 1);
    EXPECT_EQ((*second)["n"], 2);
    EXPECT_FALSE(channel->next(std::chrono::milliseconds(10)).has_value());
}

TEST(SseChannelTest, ClosedChannelRejectsPosts) {
    SseChannelHub hub;
    auto channel = hub.open(make_dispatch(), false);
    const std::string id = channel->id();
    hub.close(id);

    EXPECT_TRUE(channel->closed());
    EXPECT_EQ(channel->post(json::object()), PostOutcome::Closed);
    EXPECT_EQ(hub.find(id), nullptr);
    EXPECT_EQ(hub.size(), 0u);
}

TEST(SseChannelTest, FullInboxRefusesPosts) {
    SseChannelHub hub;
    auto channel = hub.open(make_dispatch(), false, 2);

    EXPECT_EQ(channel->post(json{{"n", 1}}), PostOutcome::Queued);
    EXPECT_EQ(channel->post(json{{"n", 2}}), PostOutcome::Queued);
    EXPECT_EQ(channel->post(json{{"n", 3}}), PostOutcome::Full);
    EXPECT_EQ(channel->pending(), 2u);

    ASSERT_TRUE(channel->next(std::chrono::milliseconds(10)).has_value());
    EXPECT_EQ(channel->post(json{{"n", 3}}), PostOutcome::Queued);
}

TEST(SseChannelTest, ChannelsHaveIndependentSessions) {
    SseChannelHub hub;
    auto dispatch = make_dispatch();
    auto a = hub.open(dispatch, false);
    auto b = hub.open(dispatch, false);
    EXPECT_NE(a->id(), b->id());

    auto initialized = a->process(json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    ASSERT_TRUE(initialized.has_value());

    auto refused = b->process(json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/list"}});
    ASSERT_TRUE(refused.has_value());
    EXPECT_EQ((*refused)["error"]["code"], draftline::protocol::kServerNotInitialized);
}

TEST(SseChannelTest, RemoteEnvelopeOmitsTracebackByDefault) {
    auto composer = std::make_shared<RecordingComposer>();
    composer->fail_next("create_draft", "backend offline");
    auto dispatch =
        std::make_shared<const DispatchCore>(std::make_shared<DraftRegistry>(), composer);
    SseChannelHub hub;
    auto channel = hub.open(dispatch, false);

    channel->process(json{{"jsonrpc", "2.0"}, {"id", 1}, {"method", "initialize"}});
    auto response = channel->process(json{{"jsonrpc", "2.0"},
                                          {"id", 2},
                                          {"method", "tools/call"},
                                          {"params", {{"name", "create_draft"}}}});
    ASSERT_TRUE(response.has_value());
    const json envelope =
        json::parse((*response)["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(envelope["error"], "backend offline");
    EXPECT_FALSE(envelope.contains("traceback"));
}

TEST(SseServerTest, PostRoutesToChannel) {
    SseServer server(make_dispatch(), SseOptions{});
    auto channel = server.channels().open(make_dispatch(), false);

    auto response = server.handle_request(make_request(
        http::verb::post, "/messages?session_id=" + channel->id(),
        R"({"jsonrpc":"2.0","id":1,"method":"ping"})"));
    EXPECT_EQ(response.result(), http::status::accepted);
    EXPECT_EQ(channel->pending(), 1u);
}

TEST(SseServerTest, PostErrors) {
    SseServer server(make_dispatch(), SseOptions{});
    auto channel = server.channels().open(make_dispatch(), false);

    EXPECT_EQ(server.handle_request(make_request(http::verb::post, "/messages", "{}")).result(),
              http::status::bad_request);
    EXPECT_EQ(server.handle_request(make_request(http::verb::post,
                                                 "/messages?session_id=unknown", "{}"))
                  .result(),
              http::status::not_found);
    EXPECT_EQ(server.handle_request(make_request(http::verb::post,
                                                 "/messages?session_id=" + channel->id(),
                                                 "{broken"))
                  .result(),
              http::status::bad_request);
    EXPECT_EQ(channel->pending(), 0u);
}

TEST(SseServerTest, FullInboxAnswersServiceUnavailable) {
    SseOptions options;
    options.inbox_capacity = 1;
    SseServer server(make_dispatch(), options);
    auto channel = server.channels().open(make_dispatch(), false, options.inbox_capacity);
    const std::string target = "/messages?session_id=" + channel->id();
    const std::string ping = R"({"jsonrpc":"2.0","id":1,"method":"ping"})";

    EXPECT_EQ(server.handle_request(make_request(http::verb::post, target, ping)).result(),
              http::status::accepted);
    auto refused = server.handle_request(make_request(http::verb::post, target, ping));
    EXPECT_EQ(refused.result(), http::status::service_unavailable);
    EXPECT_EQ(refused[http::field::retry_after], "1");
    EXPECT_EQ(channel->pending(), 1u);
}

TEST(SseServerTest, UnknownRoutesAreNotFound) {
    SseServer server(make_dispatch(), SseOptions{});
    EXPECT_EQ(server.handle_request(make_request(http::verb::get, "/health")).result(),
              http::status::not_found);
    EXPECT_EQ(server.handle_request(make_request(http::verb::get, "/messages")).result(),
              http::status::method_not_allowed);
}

TEST(SseServerTest, ListensOnEphemeralPort) {
    SseOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    SseServer server(make_dispatch(), options);

    auto bound = server.listen();
    ASSERT_FALSE(draftline::core::errors::is_error(bound));
    EXPECT_GT(draftline::core::errors::get_value(bound), 0);
    EXPECT_EQ(server.port(), draftline::core::errors::get_value(bound));
    server.stop();
}

TEST(SseServerTest, StreamCarriesEndpointThenRepliesInOrder) {
    SseOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    options.keepalive_ms = 200;
    SseServer server(make_dispatch(), options);
    auto bound = server.listen();
    ASSERT_FALSE(draftline::core::errors::is_error(bound));
    std::thread runner([&server] { server.run(); });

    SseClient client(server.port());
    client.open_stream();
    EXPECT_EQ(client.stream_status(), http::status::ok);

    const auto endpoints = event_data(client.read_until("event: endpoint", 1), "endpoint");
    ASSERT_EQ(endpoints.size(), 1u);
    const std::string messages_url = endpoints[0];
    EXPECT_EQ(messages_url.rfind("/messages?session_id=", 0), 0u);
    EXPECT_EQ(server.channels().size(), 1u);

    EXPECT_EQ(client.post(messages_url, json{{"jsonrpc", "2.0"},
                                             {"id", 1},
                                             {"method", "initialize"}})
                  .result(),
              http::status::accepted);
    EXPECT_EQ(client.post(messages_url,
                          json{{"jsonrpc", "2.0"},
                               {"id", 2},
                               {"method", "tools/call"},
                               {"params", {{"name", "create_draft"},
                                           {"arguments", {{"width", 720}}}}}})
                  .result(),
              http::status::accepted);

    const auto replies = event_data(client.read_until("event: message", 2), "message");
    ASSERT_EQ(replies.size(), 2u);
    const json initialized = json::parse(replies[0]);
    EXPECT_EQ(initialized["id"], 1);
    EXPECT_EQ(initialized["result"]["protocolVersion"], "2024-11-05");

    const json called = json::parse(replies[1]);
    EXPECT_EQ(called["id"], 2);
    EXPECT_EQ(called["result"]["isError"], false);
    const json envelope =
        json::parse(called["result"]["content"][0]["text"].get<std::string>());
    EXPECT_EQ(envelope["success"], true);
    EXPECT_EQ(envelope["width"], 720);
    EXPECT_TRUE(envelope.contains("draft_id"));

    server.stop();
    runner.join();
    client.close();
    EXPECT_EQ(server.channels().size(), 0u);
}

TEST(SseServerTest, StopEndsIdleAcceptLoop) {
    SseOptions options;
    options.host = "127.0.0.1";
    options.port = 0;
    SseServer server(make_dispatch(), options);
    ASSERT_FALSE(draftline::core::errors::is_error(server.listen()));

    std::thread runner([&server] { server.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    server.stop();
    runner.join();

    SseClient late(server.port());
    EXPECT_ANY_THROW(late.open_stream());
}

TEST(SseServerTest, RejectsInvalidHost) {
    SseOptions options;
    options.host = "not an address";
    SseServer server(make_dispatch(), options);

    auto bound = server.listen();
    ASSERT_TRUE(draftline::core::errors::is_error(bound));
    EXPECT_EQ(draftline::core::errors::get_error(bound).code, "invalid_host");
}

}  // namespace
