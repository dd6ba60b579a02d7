#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <vector>
#include "core/config/limits.hpp"

namespace wasmbox::app::cli {

    using namespace wasmbox::core::errors;
    using wasmbox::protocol::CliCommand;
    using wasmbox::protocol::CliRequest;

    namespace {

        constexpr const char* kUsage =
            "Usage: wasmbox run (--package <dir> | --manifest <file> --wasm <file>) "
            "[--args <json>] [--workspace <dir>] [--worker <path>] [--in-process] "
            "[--timeout <ms>] [--llm] [--journal] [--verbose]\n"
            "       wasmbox validate --package <dir>";

        // 1. Raw Options Struct (Internal only)
        struct RawCliOptions {
            std::optional<std::string> package_dir;
            std::optional<std::string> manifest_file;
            std::optional<std::string> wasm_file;
            std::optional<std::string> args;
            std::optional<std::string> workspace;
            std::optional<std::string> worker;
            std::optional<std::string> timeout;
            bool in_process = false;
            bool llm = false;
            bool journal = false;
            bool verbose = false;
        };

        Result<std::filesystem::path> existing_path(const std::string& value, bool want_directory,
                                                    const std::string& flag) {
            std::filesystem::path p(value);
            std::error_code ec;
            const bool exists = std::filesystem::exists(p, ec);
            if (ec || !exists) {
                return ToolError{ErrorCategory::Input, flag + " does not exist: " + value, "invalid_path"};
            }
            const bool matches = want_directory ? std::filesystem::is_directory(p, ec)
                                                : std::filesystem::is_regular_file(p, ec);
            if (ec || !matches) {
                return ToolError{ErrorCategory::Input,
                                 flag + (want_directory ? " is not a directory: " : " is not a file: ") + value,
                                 "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, ec);
            if (ec) {
                return ToolError{ErrorCategory::Input, "Failed to canonicalize " + flag + ": " + value, "invalid_path"};
            }
            return canonical_path;
        }

    }  // namespace

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return ToolError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        CliRequest req;
        std::string command = argv[1];
        if (command == "run") {
            req.command = CliCommand::Run;
        } else if (command == "validate") {
            req.command = CliCommand::Validate;
        } else {
            return ToolError{ErrorCategory::Input, "Unknown command: " + command, "unknown_command",
                             "Supported commands are 'run' and 'validate'."};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const auto read_value = [&](size_t& i, std::optional<std::string>& slot) -> std::optional<ToolError> {
            if (i + 1 < args.size()) {
                slot = args[++i];
                return std::nullopt;
            }
            return ToolError{ErrorCategory::Input, "Missing value for " + args[i], "missing_value"};
        };

        for (size_t i = 0; i < args.size(); ++i) {
            std::optional<ToolError> error;
            if (args[i] == "--package") {
                error = read_value(i, raw.package_dir);
            } else if (args[i] == "--manifest") {
                error = read_value(i, raw.manifest_file);
            } else if (args[i] == "--wasm") {
                error = read_value(i, raw.wasm_file);
            } else if (args[i] == "--args") {
                error = read_value(i, raw.args);
            } else if (args[i] == "--workspace") {
                error = read_value(i, raw.workspace);
            } else if (args[i] == "--worker") {
                error = read_value(i, raw.worker);
            } else if (args[i] == "--timeout") {
                error = read_value(i, raw.timeout);
            } else if (args[i] == "--in-process") {
                raw.in_process = true;
            } else if (args[i] == "--llm") {
                raw.llm = true;
            } else if (args[i] == "--journal") {
                raw.journal = true;
            } else if (args[i] == "--verbose") {
                raw.verbose = true;
            } else {
                return ToolError{ErrorCategory::Input, "Unknown argument: " + args[i], "unknown_argument", kUsage};
            }
            if (error.has_value()) {
                return *error;
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;
        req.in_process = raw.in_process;
        req.llm_format = raw.llm;
        req.journal = raw.journal;

        if (req.command == CliCommand::Validate) {
            if (!raw.package_dir.has_value()) {
                return ToolError{ErrorCategory::Input, "validate requires --package", "missing_required_flag"};
            }
            if (raw.manifest_file || raw.wasm_file || raw.args || raw.workspace || raw.worker || raw.timeout) {
                return ToolError{ErrorCategory::Input, "validate only accepts --package and --verbose", "conflicting_flags"};
            }
        }

        const bool split_files = raw.manifest_file.has_value() || raw.wasm_file.has_value();
        if (!raw.package_dir.has_value() && !split_files) {
            return ToolError{ErrorCategory::Input, "Must provide either --package or --manifest with --wasm",
                             "missing_required_flag"};
        }
        if (raw.package_dir.has_value() && split_files) {
            return ToolError{ErrorCategory::Input, "Cannot provide both --package and --manifest/--wasm",
                             "conflicting_flags"};
        }
        if (split_files && (!raw.manifest_file.has_value() || !raw.wasm_file.has_value())) {
            return ToolError{ErrorCategory::Input, "--manifest and --wasm must be given together",
                             "missing_required_flag"};
        }

        // Exception-free integer parsing
        if (raw.timeout) {
            uint32_t timeout = 0;
            const char* begin = raw.timeout->data();
            const char* end = raw.timeout->data() + raw.timeout->size();
            auto [ptr, ec] = std::from_chars(begin, end, timeout);
            if (ec != std::errc() || ptr != end) {
                return ToolError{ErrorCategory::Input, "Invalid number for --timeout", "invalid_integer",
                                 "Provide a positive integer of milliseconds."};
            }
            if (timeout < core::config::kMinTimeoutMs || timeout > core::config::kMaxTimeoutMs) {
                return ToolError{ErrorCategory::Input, "--timeout out of bounds", "bounds_error",
                                 "Must be between " + std::to_string(core::config::kMinTimeoutMs) + " and " +
                                     std::to_string(core::config::kMaxTimeoutMs) + "."};
            }
            req.timeout_ms = timeout;
        }

        if (raw.args) {
            auto parsed = nlohmann::json::parse(*raw.args, nullptr, false);
            if (parsed.is_discarded() || !parsed.is_object()) {
                return ToolError{ErrorCategory::Input, "--args must be a JSON object", "invalid_json",
                                 "Example: --args '{\"input\":\"hello\"}'"};
            }
            req.args = std::move(parsed);
        }

        // Path validation
        const auto assign = [](Result<std::filesystem::path> resolved,
                               std::optional<std::filesystem::path>& slot) -> std::optional<ToolError> {
            if (is_error(resolved)) {
                return get_error(resolved);
            }
            slot = take_value(resolved);
            return std::nullopt;
        };

        std::optional<ToolError> path_error;
        if (raw.package_dir && !path_error) {
            path_error = assign(existing_path(*raw.package_dir, true, "--package"), req.package_dir);
        }
        if (raw.manifest_file && !path_error) {
            path_error = assign(existing_path(*raw.manifest_file, false, "--manifest"), req.manifest_file);
        }
        if (raw.wasm_file && !path_error) {
            path_error = assign(existing_path(*raw.wasm_file, false, "--wasm"), req.wasm_file);
        }
        if (raw.workspace && !path_error) {
            path_error = assign(existing_path(*raw.workspace, true, "--workspace"), req.workspace);
        }
        if (raw.worker && !path_error) {
            path_error = assign(existing_path(*raw.worker, false, "--worker"), req.worker_executable);
        }
        if (path_error.has_value()) {
            return *path_error;
        }

        if (req.journal && !req.workspace.has_value()) {
            return ToolError{ErrorCategory::Input, "--journal requires --workspace", "missing_required_flag"};
        }

        return req;
    }

} // namespace wasmbox::app::cli
