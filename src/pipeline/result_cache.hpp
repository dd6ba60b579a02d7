#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include "protocol/bytes.hpp"

namespace wasmbox::pipeline {

struct CachedResultMetadata {
    std::optional<std::string> path;
    std::optional<std::size_t> line_count;
    std::optional<std::size_t> byte_size;
    std::optional<std::string> file_type;
    std::optional<std::string> mime_type;
};

struct CachedResult {
    std::string id;
    std::string tool_name;
    std::int64_t timestamp_ms = 0;
    // Exactly one of the two is meaningful, depending on is_binary
    std::string text;
    protocol::Bytes binary;
    bool is_binary = false;
    CachedResultMetadata metadata;
};

struct CacheStats {
    std::size_t size = 0;
    std::optional<std::int64_t> oldest_age_ms;
};

// Full tool output kept on the side so only a summary reaches the model.
// Thread-safe.
class ResultCache {
public:
    using Clock = std::function<std::int64_t()>;

    ResultCache();
    explicit ResultCache(Clock clock);

    std::string store(const std::string& tool_name, std::string content,
                      CachedResultMetadata metadata = {});
    std::string store_binary(const std::string& tool_name, protocol::Bytes content,
                             CachedResultMetadata metadata = {});

    std::optional<CachedResult> get(const std::string& id) const;
    std::optional<std::string> get_content(const std::string& id) const;
    bool has(const std::string& id) const;
    void clear();
    CacheStats stats() const;

private:
    std::string insert(CachedResult entry);
    void cleanup_locked(std::int64_t now);

    Clock clock_;
    mutable std::mutex mutex_;
    std::map<std::string, CachedResult> entries_;
    std::uint64_t counter_ = 0;
};

struct ContentSummary {
    std::string summary;  // "<type>, <n> lines, <size>"
    std::size_t line_count = 0;
    std::size_t byte_size = 0;
    std::string file_type;
    std::string preview;
};

ContentSummary generate_content_summary(const std::string& content, const std::string& path,
                                        std::size_t preview_lines = 5);

// "N bytes", "x.x KB" or "x.x MB"
std::string format_byte_size(std::size_t bytes);

}  // namespace wasmbox::pipeline
