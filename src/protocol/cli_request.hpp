#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace wasmbox::protocol {

    enum class CliCommand {
        Run,       // execute one tool
        Validate   // check a package directory, run nothing
    };

    // Validated command line of the wasmbox executable
    struct CliRequest {
        CliCommand command = CliCommand::Run;
        // Either package_dir, or manifest_file together with wasm_file
        std::optional<std::filesystem::path> package_dir;
        std::optional<std::filesystem::path> manifest_file;
        std::optional<std::filesystem::path> wasm_file;
        nlohmann::json args = nlohmann::json::object();
        std::optional<std::filesystem::path> workspace;
        std::optional<std::filesystem::path> worker_executable;
        std::optional<std::uint32_t> timeout_ms;
        bool in_process = false;
        bool llm_format = false;
        bool journal = false;
        bool verbose = false;
    };

} // namespace wasmbox::protocol
