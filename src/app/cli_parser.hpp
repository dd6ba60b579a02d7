#pragma once
#include "core/errors/tool_errors.hpp"
#include "protocol/cli_request.hpp"

namespace wasmbox::app::cli {
    wasmbox::core::errors::Result<wasmbox::protocol::CliRequest> parse_and_validate(int argc, char* argv[]);
}
