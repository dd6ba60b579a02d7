#pragma once

#include <string>
#include <vector>
#include "protocol/bytes.hpp"
#include "protocol/execution_contract.hpp"
#include "vfs/virtual_file_system.hpp"

namespace wasmbox::runtime {

struct HostSettings {
    // Interrupt the guest through the engine epoch once timeout_ms elapses.
    // The isolate turns this off: its parent kills it instead.
    bool interrupt_on_timeout = true;
    // Cap linear memory at memory_pages. Without it the ceiling is advisory.
    bool enforce_memory_limit = false;
};

// Runs a WASI preview1 command module to completion. Shared by the
// in-process path and the isolate; only the VFS backend differs.
class WasiHost {
public:
    explicit WasiHost(HostSettings settings = {});

    // Never throws and never returns a host failure as anything other than
    // a result: faults land on stderr with exit code 1.
    protocol::ExecutionResult execute(const protocol::Bytes& wasm_binary,
                                      const std::vector<std::string>& argv,
                                      const protocol::ExecutionOptions& options,
                                      vfs::VirtualFileSystem& vfs) const;

private:
    HostSettings settings_;
};

}  // namespace wasmbox::runtime
