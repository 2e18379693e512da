#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http.hpp>
#include "core/errors/draft_errors.hpp"
#include "dispatch/dispatch_core.hpp"
#include "transport/sse_channel.hpp"

namespace draftline::transport {

struct SseOptions {
    std::string host = "0.0.0.0";
    std::uint16_t port = 5001;
    std::uint32_t keepalive_ms = 15000;
    bool include_traceback = false;
    // Messages a channel may hold before POST /messages answers 503.
    std::size_t inbox_capacity = kDefaultInboxCapacity;
};

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

// HTTP front end: GET /sse opens an event stream, POST /messages?session_id=
// feeds it. Each connection is served on its own thread; all of them share
// one dispatch core.
class SseServer {
public:
    SseServer(std::shared_ptr<const dispatch::DispatchCore> dispatch, SseOptions options);
    ~SseServer();

    SseServer(const SseServer&) = delete;
    SseServer& operator=(const SseServer&) = delete;

    // Binds the listening socket. Returns the bound port (useful with port 0).
    core::errors::Result<std::uint16_t> listen();

    // Accept loop; blocks until stop().
    void run();
    void stop();

    std::uint16_t port() const;
    SseChannelHub& channels();

    // Routes every non-streaming request (POST /messages and errors).
    HttpResponse handle_request(const HttpRequest& request);

    struct Context;

private:
    std::shared_ptr<Context> context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::uint16_t bound_port_ = 0;
};

}  // namespace draftline::transport
