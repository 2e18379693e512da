#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include "app/cli_parser.hpp"
#include "composer/draft_folder_composer.hpp"
#include "core/config/server_config.hpp"
#include "core/errors/draft_errors.hpp"
#include "core/logging/logger.hpp"
#include "dispatch/dispatch_core.hpp"
#include "protocol/jsonrpc_session.hpp"
#include "session/draft_registry.hpp"
#include "transport/sse_transport.hpp"
#include "transport/stdio_transport.hpp"

namespace {

int run_sse(const draftline::core::config::ServerConfig& config,
            std::shared_ptr<const draftline::dispatch::DispatchCore> dispatch) {
    draftline::transport::SseOptions options;
    options.host = config.host;
    options.port = config.port;
    options.keepalive_ms = config.sse_keepalive_ms;
    options.include_traceback = config.sse_traceback;

    draftline::transport::SseServer server(std::move(dispatch), options);
    auto listening = server.listen();
    if (draftline::core::errors::is_error(listening)) {
        const auto& err = draftline::core::errors::get_error(listening);
        LOG_ERROR("Failed to start SSE transport [" + err.code + "]: " + err.message);
        return 3;
    }

    // SIGINT/SIGTERM stop the accept loop so main can return normally.
    boost::asio::io_context signal_context;
    boost::asio::signal_set signals(signal_context, SIGINT, SIGTERM);
    signals.async_wait([&server](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            LOG_INFO("Received signal " + std::to_string(signal_number) + ", shutting down");
            server.stop();
        }
    });
    std::thread signal_thread([&signal_context] { signal_context.run(); });

    server.run();

    signal_context.stop();
    signal_thread.join();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    draftline::core::logging::Logger::get().set_context("draftline");

    // 1. Parse CLI input and return normalized input errors
    auto parsed = draftline::app::cli::parse_and_validate(argc, argv);
    if (draftline::core::errors::is_error(parsed)) {
        const auto& err = draftline::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.detail.empty()) {
            LOG_INFO("Hint: " + err.detail);
        }
        return 2;
    }

    const auto& config = draftline::core::errors::get_value(parsed);
    draftline::core::logging::Logger::get().set_level(config.log_level);
    LOG_INFO("Bootstrapping " + std::string(draftline::protocol::kServerName) + " " +
             draftline::protocol::kServerVersion + " on " +
             draftline::core::config::to_string(config.transport));

    // 2. Fail fast when the drafts directory is unusable
    auto composer = std::make_shared<draftline::composer::DraftFolderComposer>(config.drafts_dir);
    auto prepared = composer->prepare();
    if (draftline::core::errors::is_error(prepared)) {
        const auto& err = draftline::core::errors::get_error(prepared);
        LOG_ERROR("Composer unavailable [" + err.code + "]: " + err.message);
        return 3;
    }
    LOG_INFO("Drafts directory: " + draftline::core::errors::get_value(prepared).string());

    // 3. One registry and dispatch core shared by every channel
    auto registry = std::make_shared<draftline::session::DraftRegistry>();
    draftline::dispatch::DispatchOptions options;
    options.composer_timeout_ms = config.composer_timeout_ms;
    auto dispatch =
        std::make_shared<const draftline::dispatch::DispatchCore>(registry, composer, options);

    if (config.transport == draftline::core::config::TransportMode::Sse) {
        return run_sse(config, dispatch);
    }

    draftline::core::logging::Logger::get().set_context("stdio");
    draftline::transport::StdioTransport transport(dispatch, std::cin, std::cout);
    transport.run();
    LOG_INFO("Drafts created this session: " + std::to_string(registry->size()));
    return 0;
}
