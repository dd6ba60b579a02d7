#include "runtime/wasi_host.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <optional>
#include <thread>
#include <wasmtime.hh>
#include "core/encoding/utf8.hpp"
#include "core/logging/logger.hpp"
#include "runtime/wasi_abi.hpp"
#include "runtime/wasi_context.hpp"

namespace wasmbox::runtime {

namespace {

constexpr const char* kExitSentinel = "wasi proc_exit";

// Bumps the engine epoch once the deadline passes, which traps the guest at
// its next epoch check.
class EpochTimer {
public:
    EpochTimer(const wasmtime::Engine& engine, const std::chrono::milliseconds timeout)
        : engine_(engine), thread_([this, timeout]() { run(timeout); }) {}

    ~EpochTimer() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        thread_.join();
    }

    bool fired() const { return fired_.load(); }

private:
    void run(const std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, timeout, [this]() { return done_; })) {
            return;
        }
        fired_.store(true);
        engine_.increment_epoch();
    }

    const wasmtime::Engine& engine_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::atomic_bool fired_{false};
    std::thread thread_;
};

// Glue between wasmtime imports and WasiContext.
class ImportBinder {
public:
    ImportBinder(wasmtime::Linker& linker, WasiContext& context)
        : linker_(linker), context_(context) {}

    void set_memory(wasmtime::Memory memory) { memory_ = memory; }

    template <typename... Args>
    void bind(std::string_view name,
              std::int32_t (WasiContext::*method)(GuestMemory&, Args...)) {
        WasiContext* context = &context_;
        ImportBinder* self = this;
        auto defined = linker_.func_wrap(
            wasi::kModuleName, name,
            [context, self, method](wasmtime::Caller caller, Args... args)
                -> wasmtime::Result<std::int32_t, wasmtime::Trap> {
                try {
                    GuestMemory memory = self->memory_view(caller);
                    return (context->*method)(memory, args...);
                } catch (const std::exception& e) {
                    context->record_fault(e.what());
                    return wasmtime::Trap(e.what());
                }
            });
        record(name, static_cast<bool>(defined));
    }

    // Imports that answer with a fixed errno and never touch memory
    template <typename... Args>
    void bind_errno(std::string_view name, const std::int32_t code) {
        auto defined = linker_.func_wrap(
            wasi::kModuleName, name, [code](Args...) -> std::int32_t { return code; });
        record(name, static_cast<bool>(defined));
    }

    void bind_proc_exit() {
        WasiContext* context = &context_;
        auto defined = linker_.func_wrap(
            wasi::kModuleName, "proc_exit",
            [context](std::int32_t code) -> wasmtime::Result<std::monostate, wasmtime::Trap> {
                context->proc_exit(code);
                return wasmtime::Trap(kExitSentinel);
            });
        record("proc_exit", static_cast<bool>(defined));
    }

    const std::optional<std::string>& failure() const { return failure_; }

private:
    GuestMemory memory_view(wasmtime::Caller& caller) const {
        if (memory_.has_value()) {
            auto span = memory_->data(caller.context());
            return GuestMemory(span.data(), span.size());
        }
        auto exported = caller.get_export("memory");
        if (!exported.has_value()) {
            throw HostFault("WASM module does not export memory");
        }
        auto* memory = std::get_if<wasmtime::Memory>(&*exported);
        if (memory == nullptr) {
            throw HostFault("WASM module does not export memory");
        }
        auto span = memory->data(caller.context());
        return GuestMemory(span.data(), span.size());
    }

    void record(std::string_view name, const bool ok) {
        if (!ok && !failure_.has_value()) {
            failure_ = "Failed to define import " + std::string(name);
        }
    }

    wasmtime::Linker& linker_;
    WasiContext& context_;
    std::optional<wasmtime::Memory> memory_;
    std::optional<std::string> failure_;
};

void link_preview1(ImportBinder& binder) {
    using C = WasiContext;
    using std::int32_t;
    using std::int64_t;

    binder.bind("args_get", &C::args_get);
    binder.bind("args_sizes_get", &C::args_sizes_get);
    binder.bind("environ_get", &C::environ_get);
    binder.bind("environ_sizes_get", &C::environ_sizes_get);
    binder.bind("clock_res_get", &C::clock_res_get);
    binder.bind("clock_time_get", &C::clock_time_get);
    binder.bind("random_get", &C::random_get);

    binder.bind("fd_read", &C::fd_read);
    binder.bind("fd_write", &C::fd_write);
    binder.bind("fd_close", &C::fd_close);
    binder.bind("fd_seek", &C::fd_seek);
    binder.bind("fd_tell", &C::fd_tell);
    binder.bind("fd_fdstat_get", &C::fd_fdstat_get);
    binder.bind("fd_filestat_get", &C::fd_filestat_get);
    binder.bind("fd_prestat_get", &C::fd_prestat_get);
    binder.bind("fd_prestat_dir_name", &C::fd_prestat_dir_name);
    binder.bind("fd_datasync", &C::fd_noop);
    binder.bind("fd_sync", &C::fd_noop);
    binder.bind_errno<int32_t, int64_t, int64_t, int32_t>("fd_advise", wasi::kErrnoSuccess);

    binder.bind("path_open", &C::path_open);
    binder.bind("path_filestat_get", &C::path_filestat_get);

    binder.bind_proc_exit();
    binder.bind_errno<>("sched_yield", wasi::kErrnoSuccess);

    // Present so modules link, but not supported
    binder.bind_errno<int32_t, int64_t, int64_t>("fd_allocate", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t>("fd_fdstat_set_flags", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int64_t, int64_t>("fd_fdstat_set_rights", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int64_t>("fd_filestat_set_size", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int64_t, int64_t, int32_t>("fd_filestat_set_times",
                                                          wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t, int64_t, int32_t>("fd_pread",
                                                                   wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t, int64_t, int32_t>("fd_pwrite",
                                                                   wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t, int64_t, int32_t>("fd_readdir",
                                                                   wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t>("fd_renumber", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t>("path_create_directory", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t, int32_t, int64_t, int64_t, int32_t>(
        "path_filestat_set_times", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t, int32_t, int32_t, int32_t, int32_t>(
        "path_link", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t, int32_t, int32_t, int32_t>(
        "path_readlink", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t>("path_remove_directory", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t, int32_t, int32_t, int32_t>(
        "path_rename", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t, int32_t, int32_t>("path_symlink",
                                                                   wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t>("path_unlink_file", wasi::kErrnoNosys);
    binder.bind_errno<int32_t, int32_t, int32_t, int32_t>("poll_oneoff", wasi::kErrnoNosys);
    binder.bind_errno<int32_t>("proc_raise", wasi::kErrnoNosys);

    // Network isolation is a boundary: refuse, do not report "unsupported"
    binder.bind_errno<int32_t, int32_t, int32_t>("sock_accept", wasi::kErrnoPerm);
    binder.bind_errno<int32_t, int32_t, int32_t, int32_t, int32_t, int32_t>("sock_recv",
                                                                            wasi::kErrnoPerm);
    binder.bind_errno<int32_t, int32_t, int32_t, int32_t, int32_t>("sock_send",
                                                                   wasi::kErrnoPerm);
    binder.bind_errno<int32_t, int32_t>("sock_shutdown", wasi::kErrnoPerm);
}

void fail(vfs::VirtualFileSystem& vfs, protocol::ExecutionResult& result,
          const std::string& message) {
    const std::string line = "Error: " + message + "\n";
    vfs.write_stderr(reinterpret_cast<const std::uint8_t*>(line.data()), line.size());
    result.exit_code = 1;
}

void collect_output(const vfs::VirtualFileSystem& vfs, protocol::ExecutionResult& result) {
    auto stdout_bytes = vfs.get_stdout_binary();
    result.stdout_text = core::encoding::decode_utf8_lossy(stdout_bytes);
    if (!core::encoding::is_valid_utf8(stdout_bytes)) {
        result.stdout_binary = std::move(stdout_bytes);
    }
    result.stderr_text = vfs.get_stderr();
}

}  // namespace

WasiHost::WasiHost(HostSettings settings) : settings_(settings) {}

protocol::ExecutionResult WasiHost::execute(const protocol::Bytes& wasm_binary,
                                            const std::vector<std::string>& argv,
                                            const protocol::ExecutionOptions& options,
                                            vfs::VirtualFileSystem& vfs) const {
    protocol::ExecutionResult result;
    if (options.stdin_binary.has_value()) {
        vfs.set_stdin(*options.stdin_binary);
    } else if (options.stdin_text.has_value()) {
        vfs.set_stdin(std::string_view(*options.stdin_text));
    }

    try {
        wasmtime::Config config;
        config.epoch_interruption(settings_.interrupt_on_timeout);
        wasmtime::Engine engine(std::move(config));

        auto compiled = wasmtime::Module::compile(
            engine, wasmtime::Span<uint8_t>(const_cast<std::uint8_t*>(wasm_binary.data()),
                                            wasm_binary.size()));
        if (!compiled) {
            fail(vfs, result, "Failed to compile WASM module: " + compiled.err().message());
            collect_output(vfs, result);
            return result;
        }
        wasmtime::Module module = compiled.ok();

        wasmtime::Store store(engine);
        if (settings_.enforce_memory_limit) {
            store.limiter(static_cast<std::int64_t>(options.memory_pages) *
                              core::config::kWasmPageSize,
                          -1, -1, -1, -1);
        }
        if (settings_.interrupt_on_timeout) {
            store.context().set_epoch_deadline(1);
        }

        WasiContext context(argv, vfs);
        wasmtime::Linker linker(engine);
        ImportBinder binder(linker, context);
        link_preview1(binder);
        if (binder.failure().has_value()) {
            fail(vfs, result, *binder.failure());
            collect_output(vfs, result);
            return result;
        }

        auto instantiated = linker.instantiate(store.context(), module);
        if (!instantiated) {
            fail(vfs, result,
                 "Failed to instantiate WASM module: " + instantiated.err().message());
            collect_output(vfs, result);
            return result;
        }
        wasmtime::Instance instance = instantiated.ok();

        auto memory_export = instance.get(store.context(), "memory");
        auto* memory = memory_export.has_value()
                           ? std::get_if<wasmtime::Memory>(&*memory_export)
                           : nullptr;
        if (memory == nullptr) {
            fail(vfs, result, "WASM module does not export memory");
            collect_output(vfs, result);
            return result;
        }
        binder.set_memory(*memory);

        auto start_export = instance.get(store.context(), "_start");
        auto* start = start_export.has_value()
                          ? std::get_if<wasmtime::Func>(&*start_export)
                          : nullptr;
        if (start == nullptr) {
            fail(vfs, result, "WASM module does not export _start function");
            collect_output(vfs, result);
            return result;
        }

        bool timed_out = false;
        std::optional<std::string> trap_message;
        {
            std::optional<EpochTimer> timer;
            if (settings_.interrupt_on_timeout) {
                timer.emplace(engine, std::chrono::milliseconds(options.timeout_ms));
            }
            auto called = start->call(store.context(), std::vector<wasmtime::Val>{});
            if (!called) {
                trap_message = called.err().message();
            }
            timed_out = timer.has_value() && timer->fired();
        }

        if (context.exited()) {
            result.exit_code = context.exit_code();
        } else if (!trap_message.has_value()) {
            result.exit_code = 0;
        } else if (context.fault().has_value()) {
            fail(vfs, result, *context.fault());
        } else if (timed_out) {
            const std::string message =
                "Tool execution timed out after " + std::to_string(options.timeout_ms) + "ms";
            fail(vfs, result, message);
            result.error = message;
        } else {
            fail(vfs, result, *trap_message);
        }
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("WASI host failure: ") + e.what());
        fail(vfs, result, e.what());
    }

    collect_output(vfs, result);
    return result;
}

}  // namespace wasmbox::runtime
