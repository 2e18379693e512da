#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include "core/logging/logger.hpp"

namespace draftline::core::config {

    enum class TransportMode {
        Stdio,
        Sse
    };

    inline std::string to_string(const TransportMode mode) {
        switch (mode) {
            case TransportMode::Stdio:
                return "stdio";
            case TransportMode::Sse:
                return "sse";
            default:
                return "unknown";
        }
    }

    // Validated process configuration produced by the CLI parser
    struct ServerConfig {
        TransportMode transport = TransportMode::Stdio;
        std::string host = "0.0.0.0";
        uint16_t port = 5001;
        std::filesystem::path drafts_dir = std::filesystem::current_path() / "drafts";
        uint32_t composer_timeout_ms = 0;  // 0 disables the boundary timeout
        uint32_t sse_keepalive_ms = 15000;
        bool sse_traceback = false;
        logging::LogLevel log_level = logging::LogLevel::INFO;
    };

} // namespace draftline::core::config
