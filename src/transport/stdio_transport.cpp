#include "transport/stdio_transport.hpp"

#include <istream>
#include <ostream>
#include <string>
#include <utility>
#include "core/logging/logger.hpp"

namespace draftline::transport {

using nlohmann::json;

StdioTransport::StdioTransport(std::shared_ptr<const dispatch::DispatchCore> dispatch,
                               std::istream& in, std::ostream& out)
    : session_(std::move(dispatch), protocol::SessionOptions{"stdio", true}),
      in_(in),
      out_(out) {}

void StdioTransport::send(const json& message) {
    out_ << message.dump(-1, ' ', false, json::error_handler_t::replace) << "\n";
    out_.flush();
}

std::size_t StdioTransport::run() {
    LOG_INFO("StdioTransport: serving on stdin/stdout");

    std::size_t handled = 0;
    std::string line;
    while (std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.find_first_not_of(" \t") == std::string::npos) {
            continue;
        }

        json request;
        try {
            request = json::parse(line);
        } catch (const json::parse_error& e) {
            LOG_WARN(std::string("StdioTransport: JSON parse error: ") + e.what());
            send(protocol::JsonRpcSession::make_error(
                json(), protocol::kParseError, std::string("Parse error: ") + e.what()));
            continue;
        }

        ++handled;
        auto response = session_.handle(request);
        if (response.has_value()) {
            send(response.value());
        }
        if (session_.should_close()) {
            LOG_INFO("StdioTransport: shutdown requested");
            break;
        }
    }

    LOG_INFO("StdioTransport: input closed after " + std::to_string(handled) + " messages");
    return handled;
}

}  // namespace draftline::transport
