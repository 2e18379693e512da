#pragma once
#include "core/config/server_config.hpp"
#include "core/errors/draft_errors.hpp"

namespace draftline::app::cli {
    draftline::core::errors::Result<draftline::core::config::ServerConfig> parse_and_validate(int argc, char* argv[]);

    // Usage text printed alongside input errors
    const char* usage();
}
