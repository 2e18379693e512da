#pragma once

#include <cstddef>
#include <iosfwd>
#include <memory>
#include <nlohmann/json.hpp>
#include "dispatch/dispatch_core.hpp"
#include "protocol/jsonrpc_session.hpp"

namespace draftline::transport {

// Newline-delimited JSON-RPC over a pair of streams. One request is read,
// handled and answered before the next is read.
class StdioTransport {
public:
    StdioTransport(std::shared_ptr<const dispatch::DispatchCore> dispatch,
                   std::istream& in, std::ostream& out);

    // Runs until EOF or a shutdown request. Returns the number of messages handled.
    std::size_t run();

    const protocol::JsonRpcSession& session() const { return session_; }

private:
    void send(const nlohmann::json& message);

    protocol::JsonRpcSession session_;
    std::istream& in_;
    std::ostream& out_;
};

}  // namespace draftline::transport
