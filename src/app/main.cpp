#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include "app/cli_parser.hpp"
#include "core/config/request_id.hpp"
#include "core/errors/tool_errors.hpp"
#include "core/logging/logger.hpp"
#include "manifest/manifest_codec.hpp"
#include "manifest/package_loader.hpp"
#include "pipeline/result_cache.hpp"
#include "pipeline/result_formatter.hpp"
#include "session/execution_journal.hpp"
#include "tools/tool_manager.hpp"
#include "tools/tool_store.hpp"

namespace {

using wasmbox::core::errors::ErrorCategory;
using wasmbox::core::errors::Result;
using wasmbox::core::errors::ToolError;

Result<std::string> read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return ToolError{ErrorCategory::Input, "Unable to open " + path.string(), "file_open_failed"};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

Result<wasmbox::manifest::LoadedPackage> load_package(const wasmbox::protocol::CliRequest& req) {
    if (req.package_dir.has_value()) {
        return wasmbox::manifest::load_package_directory(*req.package_dir);
    }

    auto manifest_text = read_file(*req.manifest_file);
    if (wasmbox::core::errors::is_error(manifest_text)) {
        return wasmbox::core::errors::get_error(manifest_text);
    }
    auto manifest = wasmbox::manifest::parse_manifest(wasmbox::core::errors::get_value(manifest_text));
    if (wasmbox::core::errors::is_error(manifest)) {
        return wasmbox::core::errors::get_error(manifest);
    }

    auto wasm_text = read_file(*req.wasm_file);
    if (wasmbox::core::errors::is_error(wasm_text)) {
        return wasmbox::core::errors::get_error(wasm_text);
    }
    auto binary = wasmbox::manifest::validate_wasm_binary(
        wasmbox::protocol::to_bytes(wasmbox::core::errors::get_value(wasm_text)));
    if (wasmbox::core::errors::is_error(binary)) {
        return wasmbox::core::errors::get_error(binary);
    }

    wasmbox::manifest::LoadedPackage package;
    package.manifest = wasmbox::core::errors::take_value(manifest);
    package.wasm_binary = wasmbox::core::errors::take_value(binary);
    return package;
}

// The isolate ships next to this executable.
std::optional<std::filesystem::path> default_worker(const char* argv0) {
    std::error_code ec;
    const auto self = std::filesystem::weakly_canonical(argv0, ec);
    if (ec) {
        return std::nullopt;
    }
    const auto candidate = self.parent_path() / "wasmbox-sandbox";
    if (!std::filesystem::is_regular_file(candidate, ec) || ec) {
        return std::nullopt;
    }
    return candidate;
}

}  // namespace

int main(int argc, char* argv[]) {
    wasmbox::core::logging::Logger::get().set_request_id(wasmbox::core::config::generate_request_id());

    auto parsed = wasmbox::app::cli::parse_and_validate(argc, argv);
    if (wasmbox::core::errors::is_error(parsed)) {
        const auto& err = wasmbox::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = wasmbox::core::errors::get_value(parsed);
    if (req.verbose) {
        wasmbox::core::logging::Logger::get().set_min_level(wasmbox::core::logging::LogLevel::DEBUG);
    }

    auto loaded = load_package(req);
    if (wasmbox::core::errors::is_error(loaded)) {
        const auto& err = wasmbox::core::errors::get_error(loaded);
        LOG_ERROR("Package error [" + err.code + "]: " + err.message);
        return 3;
    }
    auto package = wasmbox::core::errors::take_value(loaded);

    if (req.command == wasmbox::protocol::CliCommand::Validate) {
        std::cout << "Package valid: " << package.manifest.name << " " << package.manifest.version
                  << " (" << package.wasm_binary.size() << " bytes)" << std::endl;
        return 0;
    }

    if (req.timeout_ms.has_value()) {
        package.manifest.execution.timeout_ms = req.timeout_ms;
    }
    const std::string tool_name = package.manifest.name;

    auto store = req.workspace.has_value()
                     ? std::make_shared<wasmbox::tools::ToolStore>(*req.workspace)
                     : std::make_shared<wasmbox::tools::ToolStore>();
    if (store->is_persistent()) {
        auto restored = store->load();
        if (wasmbox::core::errors::is_error(restored)) {
            const auto& err = wasmbox::core::errors::get_error(restored);
            LOG_ERROR("Tool registry error [" + err.code + "]: " + err.message);
            return 3;
        }
        // A rerun of the same package replaces the copy left by the last run
        const auto previous = store->find_by_name(tool_name);
        if (previous.has_value() && previous->source == wasmbox::tools::ToolSource::User) {
            auto removed = store->uninstall(previous->id);
            if (wasmbox::core::errors::is_error(removed)) {
                const auto& err = wasmbox::core::errors::get_error(removed);
                LOG_ERROR("Tool registry error [" + err.code + "]: " + err.message);
                return 3;
            }
        }
    }
    auto installed = store->install(std::move(package));
    if (wasmbox::core::errors::is_error(installed)) {
        const auto& err = wasmbox::core::errors::get_error(installed);
        LOG_ERROR("Install failed [" + err.code + "]: " + err.message);
        return 3;
    }

    wasmbox::tools::ToolManagerOptions options;
    options.workspace_root = req.workspace;
    options.worker_executable =
        req.worker_executable.has_value() ? req.worker_executable : default_worker(argv[0]);
    options.force_in_process = req.in_process;

    wasmbox::tools::ToolManager manager(store, options);
    if (req.journal) {
        manager.set_journal(std::make_shared<wasmbox::session::ExecutionJournal>(*req.workspace));
    }

    LOG_DEBUG("Executing " + tool_name + (manager.isolate_available() ? " in the sandbox" : " in-process"));
    const auto result = manager.execute_tool(tool_name, req.args).get();

    if (req.llm_format) {
        wasmbox::pipeline::ResultCache cache;
        std::cout << wasmbox::pipeline::format_for_llm(tool_name, result, cache).dump(2) << std::endl;
    } else {
        if (result.stdout_binary.has_value()) {
            std::cout.write(reinterpret_cast<const char*>(result.stdout_binary->data()),
                            static_cast<std::streamsize>(result.stdout_binary->size()));
        } else {
            std::cout << result.stdout_text;
        }
        std::cout.flush();
        std::cerr << result.stderr_text;
    }

    if (result.error.has_value()) {
        LOG_ERROR(tool_name + ": " + *result.error);
    }
    LOG_DEBUG(tool_name + " finished with exit code " + std::to_string(result.exit_code) + " in " +
              std::to_string(static_cast<long long>(result.duration_ms)) + "ms");
    return result.exit_code;
}
