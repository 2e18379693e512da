#include "cli_parser.hpp"
#include <charconv>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace draftline::app::cli {

    using namespace draftline::core::errors;
    using draftline::core::config::ServerConfig;
    using draftline::core::config::TransportMode;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> host;
        std::optional<std::string> port;
        std::optional<std::string> drafts_dir;
        std::optional<std::string> composer_timeout_ms;
        std::optional<std::string> sse_keepalive_ms;
        std::optional<std::string> log_level;
        bool sse_traceback = false;
    };

    const char* usage() {
        return "Usage: draftline <stdio|sse> [--host H] [--port P] [--drafts-dir DIR] "
               "[--composer-timeout-ms N] [--sse-keepalive-ms N] [--log-level debug|info|warn|error] "
               "[--sse-traceback]";
    }

    namespace {

        DraftError input_error(const std::string& message, const std::string& code,
                               const std::string& hint = "") {
            return DraftError{ErrorKind::Input, message, code, hint};
        }

        // Exception-free integer parsing with inclusive bounds
        Result<uint32_t> parse_bounded(const std::string& flag, const std::string& text,
                                       uint32_t min_value, uint32_t max_value) {
            uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return input_error("Invalid number for " + flag, "invalid_integer",
                                   "Provide a non-negative integer.");
            }
            if (value < min_value || value > max_value) {
                return input_error(flag + " out of bounds", "bounds_error",
                                   "Must be between " + std::to_string(min_value) + " and " +
                                       std::to_string(max_value) + ".");
            }
            return value;
        }

    } // namespace

    Result<ServerConfig> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return input_error("No transport provided.", "missing_command", usage());
        }

        ServerConfig config;
        std::string command = argv[1];
        if (command == "stdio") {
            config.transport = TransportMode::Stdio;
        } else if (command == "sse") {
            config.transport = TransportMode::Sse;
        } else {
            return input_error("Unknown transport: " + command, "unknown_command",
                               "Supported transports are 'stdio' and 'sse'.");
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and transport
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const auto take_value = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) {
                return false;
            }
            slot = args[++i];
            return true;
        };

        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& flag = args[i];
            bool has_value = true;
            if (flag == "--host") {
                has_value = take_value(i, raw.host);
            } else if (flag == "--port") {
                has_value = take_value(i, raw.port);
            } else if (flag == "--drafts-dir") {
                has_value = take_value(i, raw.drafts_dir);
            } else if (flag == "--composer-timeout-ms") {
                has_value = take_value(i, raw.composer_timeout_ms);
            } else if (flag == "--sse-keepalive-ms") {
                has_value = take_value(i, raw.sse_keepalive_ms);
            } else if (flag == "--log-level") {
                has_value = take_value(i, raw.log_level);
            } else if (flag == "--sse-traceback") {
                raw.sse_traceback = true;
            } else {
                return input_error("Unknown argument: " + flag, "unknown_argument", usage());
            }
            if (!has_value) {
                return input_error("Missing value for " + flag, "missing_value");
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        config.sse_traceback = raw.sse_traceback;

        if (raw.host) {
            if (raw.host->empty()) {
                return input_error("--host cannot be empty", "invalid_host");
            }
            config.host = raw.host.value();
        }

        if (raw.port) {
            auto port = parse_bounded("--port", raw.port.value(), 1, 65535);
            if (is_error(port)) return get_error(port);
            config.port = static_cast<uint16_t>(get_value(port));
        }

        if (raw.composer_timeout_ms) {
            auto timeout = parse_bounded("--composer-timeout-ms", raw.composer_timeout_ms.value(), 0, 3600000);
            if (is_error(timeout)) return get_error(timeout);
            config.composer_timeout_ms = get_value(timeout);
        }

        if (raw.sse_keepalive_ms) {
            auto keepalive = parse_bounded("--sse-keepalive-ms", raw.sse_keepalive_ms.value(), 100, 3600000);
            if (is_error(keepalive)) return get_error(keepalive);
            config.sse_keepalive_ms = get_value(keepalive);
        }

        if (raw.log_level) {
            auto level = draftline::core::logging::parse_level(raw.log_level.value());
            if (!level.has_value()) {
                return input_error("Invalid log level: " + raw.log_level.value(), "invalid_log_level",
                                   "Use one of debug, info, warn, error.");
            }
            config.log_level = level.value();
        }

        // Path validation: the directory may not exist yet, but it must not be a file
        if (raw.drafts_dir) {
            if (raw.drafts_dir->empty()) {
                return input_error("--drafts-dir cannot be empty", "invalid_path");
            }
            std::filesystem::path p(raw.drafts_dir.value());
            std::error_code path_ec;
            const bool exists = std::filesystem::exists(p, path_ec);
            if (!path_ec && exists && !std::filesystem::is_directory(p, path_ec)) {
                return input_error("Drafts path exists and is not a directory", "invalid_path");
            }

            std::filesystem::path absolute_path = std::filesystem::absolute(p, path_ec);
            if (path_ec) {
                return input_error("Failed to resolve drafts directory", "invalid_path");
            }
            config.drafts_dir = std::move(absolute_path);
        }

        return config;
    }

} // namespace draftline::app::cli
