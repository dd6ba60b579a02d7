#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <random>
#include <sstream>
#include <string>

namespace wasmbox::core::config {

    inline std::int64_t now_unix_ms() {
        const auto now = std::chrono::system_clock::now();
        return static_cast<std::int64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count());
    }

    inline std::string random_hex(int length) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 15);

        std::stringstream ss;
        for (int i = 0; i < length; ++i) {
            ss << std::hex << dis(gen);
        }
        return ss.str();
    }

    // "wasm-<unix-ms>-<9 hex chars>", one per isolate execution
    inline std::string generate_request_id() {
        return "wasm-" + std::to_string(now_unix_ms()) + "-" + random_hex(9);
    }

    // Version 4 layout, used for user-installed tool ids
    inline std::string generate_uuid() {
        std::string hex = random_hex(32);
        hex[12] = '4';
        const char variants[] = {'8', '9', 'a', 'b'};
        hex[16] = variants[std::stoi(hex.substr(16, 1), nullptr, 16) % 4];
        return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" +
               hex.substr(12, 4) + "-" + hex.substr(16, 4) + "-" +
               hex.substr(20, 12);
    }

} // namespace wasmbox::core::config
