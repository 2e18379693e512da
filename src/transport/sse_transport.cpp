#include "transport/sse_transport.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>
#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include "core/logging/logger.hpp"

namespace draftline::transport {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;
using nlohmann::json;

struct SseServer::Context {
    net::io_context ioc;
    SseChannelHub hub;
    std::shared_ptr<const dispatch::DispatchCore> dispatch;
    SseOptions options;
    std::atomic_bool running{false};
};

namespace {

struct Target {
    std::string path;
    std::string session_id;
};

Target parse_target(const beast::string_view raw) {
    const std::string text(raw.data(), raw.size());
    Target target;
    const auto query_pos = text.find('?');
    target.path = text.substr(0, query_pos);
    if (query_pos == std::string::npos) {
        return target;
    }

    const std::string query = text.substr(query_pos + 1);
    std::size_t begin = 0;
    while (begin <= query.size()) {
        const auto end = std::min(query.find('&', begin), query.size());
        const std::string pair = query.substr(begin, end - begin);
        const auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == "session_id") {
            target.session_id = pair.substr(eq + 1);
        }
        begin = end + 1;
    }
    return target;
}

HttpResponse make_response(const HttpRequest& request, const http::status status,
                           const std::string& body,
                           const std::string& content_type = "application/json") {
    HttpResponse response{status, request.version()};
    response.set(http::field::server, "draftline");
    response.set(http::field::content_type, content_type);
    response.keep_alive(false);
    response.body() = body;
    response.prepare_payload();
    return response;
}

HttpResponse error_response(const HttpRequest& request, const http::status status,
                            const std::string& message) {
    return make_response(request, status, json{{"error", message}}.dump());
}

HttpResponse route(SseServer::Context& context, const HttpRequest& request) {
    const Target target = parse_target(request.target());

    if (target.path == "/messages") {
        if (request.method() != http::verb::post) {
            return error_response(request, http::status::method_not_allowed,
                                  "Use POST for /messages");
        }
        if (target.session_id.empty()) {
            return error_response(request, http::status::bad_request, "Missing session_id");
        }
        auto channel = context.hub.find(target.session_id);
        if (!channel) {
            return error_response(request, http::status::not_found, "Unknown session_id");
        }

        json message;
        try {
            message = json::parse(request.body());
        } catch (const json::parse_error& e) {
            return error_response(request, http::status::bad_request,
                                  std::string("Parse error: ") + e.what());
        }
        switch (channel->post(std::move(message))) {
            case PostOutcome::Queued:
                return make_response(request, http::status::accepted, "Accepted",
                                     "text/plain");
            case PostOutcome::Full: {
                LOG_WARN("SseServer: channel " + target.session_id + " inbox full");
                HttpResponse busy = error_response(request, http::status::service_unavailable,
                                                   "Session inbox full");
                busy.set(http::field::retry_after, "1");
                return busy;
            }
            case PostOutcome::Closed:
            default:
                return error_response(request, http::status::not_found, "Session closed");
        }
    }

    if (target.path == "/sse") {
        return error_response(request, http::status::method_not_allowed, "Use GET for /sse");
    }
    return error_response(request, http::status::not_found, "Not Found");
}

bool write_chunk(tcp::socket& socket, const std::string& text) {
    beast::error_code ec;
    net::write(socket, http::make_chunk(net::buffer(text)), ec);
    return !ec;
}

// Holds the connection open as an event stream until the client goes away,
// the channel is shut down, or the server stops.
void stream_events(SseServer::Context& context, tcp::socket& socket,
                   const HttpRequest& request) {
    http::response<http::empty_body> response{http::status::ok, request.version()};
    response.set(http::field::server, "draftline");
    response.set(http::field::content_type, "text/event-stream");
    response.set(http::field::cache_control, "no-cache");
    response.keep_alive(true);
    response.chunked(true);

    beast::error_code ec;
    http::response_serializer<http::empty_body> serializer{response};
    http::write_header(socket, serializer, ec);
    if (ec) {
        LOG_WARN("SseServer: failed to open event stream: " + ec.message());
        return;
    }

    auto channel = context.hub.open(context.dispatch, context.options.include_traceback,
                                    context.options.inbox_capacity);
    const std::string channel_id = channel->id();
    if (!write_chunk(socket,
                     format_sse_event("endpoint", "/messages?session_id=" + channel_id))) {
        context.hub.close(channel_id);
        return;
    }

    const auto keepalive = std::chrono::milliseconds(context.options.keepalive_ms);
    while (context.running.load() && !channel->closed()) {
        auto message = channel->next(keepalive);
        if (!message.has_value()) {
            if (channel->closed() || !write_chunk(socket, ": ping\n\n")) {
                break;
            }
            continue;
        }

        auto reply = channel->process(message.value());
        if (reply.has_value()) {
            const std::string data =
                reply->dump(-1, ' ', false, json::error_handler_t::replace);
            if (!write_chunk(socket, format_sse_event("message", data))) {
                LOG_INFO("SseServer: client on channel " + channel_id + " went away");
                break;
            }
        }
        if (channel->should_close()) {
            break;
        }
    }

    context.hub.close(channel_id);
    net::write(socket, http::make_chunk_last(), ec);
}

void serve_connection(std::shared_ptr<SseServer::Context> context, tcp::socket socket) {
    try {
        beast::error_code ec;
        beast::flat_buffer buffer;
        HttpRequest request;
        http::read(socket, buffer, request, ec);
        if (ec) {
            if (ec != http::error::end_of_stream) {
                LOG_DEBUG("SseServer: read failed: " + ec.message());
            }
            return;
        }

        if (request.method() == http::verb::get && parse_target(request.target()).path == "/sse") {
            stream_events(*context, socket, request);
        } else {
            HttpResponse response = route(*context, request);
            http::write(socket, response, ec);
            if (ec) {
                LOG_DEBUG("SseServer: write failed: " + ec.message());
            }
        }
        socket.shutdown(tcp::socket::shutdown_send, ec);
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("SseServer: connection failed: ") + e.what());
    }
}

net::ip::address wake_address(const std::string& host) {
    if (host == "0.0.0.0") {
        return net::ip::address_v4::loopback();
    }
    if (host == "::") {
        return net::ip::address_v6::loopback();
    }
    beast::error_code ec;
    auto address = net::ip::make_address(host, ec);
    return ec ? net::ip::address(net::ip::address_v4::loopback()) : address;
}

}  // namespace

SseServer::SseServer(std::shared_ptr<const dispatch::DispatchCore> dispatch,
                     SseOptions options)
    : context_(std::make_shared<Context>()), acceptor_(context_->ioc) {
    context_->dispatch = std::move(dispatch);
    context_->options = std::move(options);
}

SseServer::~SseServer() {
    stop();
}

core::errors::Result<std::uint16_t> SseServer::listen() {
    using core::errors::DraftError;
    using core::errors::ErrorKind;

    const auto& options = context_->options;
    const std::string where = options.host + ":" + std::to_string(options.port);

    beast::error_code ec;
    const auto address = net::ip::make_address(options.host, ec);
    if (ec) {
        return DraftError{ErrorKind::Input, "Invalid listen address: " + options.host,
                          "invalid_host", ec.message()};
    }

    const tcp::endpoint endpoint{address, options.port};
    acceptor_.open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor_.bind(endpoint, ec);
    }
    if (!ec) {
        acceptor_.listen(net::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        beast::error_code close_ec;
        acceptor_.close(close_ec);
        return DraftError{ErrorKind::Input, "Unable to listen on " + where + ": " + ec.message(),
                          "listen_failed", ec.message()};
    }

    bound_port_ = acceptor_.local_endpoint(ec).port();
    context_->running.store(true);
    return bound_port_;
}

void SseServer::run() {
    if (!acceptor_.is_open()) {
        auto listening = listen();
        if (core::errors::is_error(listening)) {
            LOG_ERROR("SseServer: " + core::errors::get_error(listening).message);
            return;
        }
    }

    LOG_INFO("SseServer: listening on " + context_->options.host + ":" +
             std::to_string(bound_port_) + " (GET /sse, POST /messages)");

    while (context_->running.load()) {
        tcp::socket socket{context_->ioc};
        beast::error_code ec;
        acceptor_.accept(socket, ec);
        if (!context_->running.load()) {
            break;
        }
        if (ec) {
            LOG_WARN("SseServer: accept failed: " + ec.message());
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
            continue;
        }
        std::thread(serve_connection, context_, std::move(socket)).detach();
    }

    beast::error_code ec;
    acceptor_.close(ec);
    LOG_INFO("SseServer: stopped");
}

void SseServer::stop() {
    context_->hub.close_all();
    if (!context_->running.exchange(false)) {
        return;
    }

    // Unblock a pending accept() with a throwaway connection.
    net::io_context wake_context;
    tcp::socket wake{wake_context};
    beast::error_code ec;
    wake.connect(tcp::endpoint{wake_address(context_->options.host), bound_port_}, ec);
    wake.close(ec);
}

std::uint16_t SseServer::port() const {
    return bound_port_;
}

SseChannelHub& SseServer::channels() {
    return context_->hub;
}

HttpResponse SseServer::handle_request(const HttpRequest& request) {
    return route(*context_, request);
}

}  // namespace draftline::transport
