#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "protocol/execution_contract.hpp"
#include "protocol/manifest.hpp"

namespace wasmbox::tools {

// A tool that does not run as a WASI command, e.g. a library with its own
// calling API. Adapters are looked up by name before the tool store.
class ToolAdapter {
public:
    virtual ~ToolAdapter() = default;

    virtual const protocol::ToolManifest& manifest() const = 0;

    // Called on a worker thread of the manager. Must report failures through
    // the result, not by throwing.
    virtual protocol::ToolExecutionResult execute(const nlohmann::json& args) = 0;
};

}  // namespace wasmbox::tools
