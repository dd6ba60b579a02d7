#include "pipeline/result_cache.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <utility>
#include <vector>
#include "core/config/limits.hpp"
#include "core/config/request_id.hpp"

namespace wasmbox::pipeline {

namespace {

std::string detect_file_type(const std::string& path) {
    static const std::map<std::string, std::string> kTypes = {
        {"js", "JavaScript"},   {"ts", "TypeScript"},    {"jsx", "React JSX"},
        {"tsx", "React TSX"},   {"json", "JSON"},        {"html", "HTML"},
        {"css", "CSS"},         {"md", "Markdown"},      {"txt", "Plain text"},
        {"py", "Python"},       {"rb", "Ruby"},          {"go", "Go"},
        {"rs", "Rust"},         {"java", "Java"},        {"c", "C"},
        {"cpp", "C++"},         {"h", "C Header"},       {"hpp", "C++ Header"},
        {"sh", "Shell script"}, {"yaml", "YAML"},        {"yml", "YAML"},
        {"xml", "XML"},         {"svg", "SVG"},          {"sql", "SQL"},
    };

    const auto dot = path.rfind('.');
    std::string ext = dot == std::string::npos ? path : path.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const auto it = kTypes.find(ext);
    if (it != kTypes.end()) {
        return it->second;
    }
    if (ext.empty()) {
        return "Unknown file";
    }
    std::string upper = ext;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper + " file";
}

}  // namespace

ResultCache::ResultCache() : ResultCache(core::config::now_unix_ms) {}

ResultCache::ResultCache(Clock clock) : clock_(std::move(clock)) {}

std::string ResultCache::store(const std::string& tool_name, std::string content,
                               CachedResultMetadata metadata) {
    CachedResult entry;
    entry.tool_name = tool_name;
    entry.text = std::move(content);
    entry.metadata = std::move(metadata);
    return insert(std::move(entry));
}

std::string ResultCache::store_binary(const std::string& tool_name, protocol::Bytes content,
                                      CachedResultMetadata metadata) {
    CachedResult entry;
    entry.tool_name = tool_name;
    entry.binary = std::move(content);
    entry.is_binary = true;
    entry.metadata = std::move(metadata);
    return insert(std::move(entry));
}

std::string ResultCache::insert(CachedResult entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::int64_t now = clock_();
    cleanup_locked(now);

    entry.id = "result_" + std::to_string(now) + "_" + std::to_string(counter_++);
    entry.timestamp_ms = now;
    std::string id = entry.id;
    entries_.emplace(id, std::move(entry));
    return id;
}

void ResultCache::cleanup_locked(const std::int64_t now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now - it->second.timestamp_ms > core::config::kResultCacheMaxAgeMs) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }

    if (entries_.size() < core::config::kResultCacheMaxEntries) {
        return;
    }

    std::vector<std::pair<std::int64_t, std::string>> by_age;
    by_age.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
        by_age.emplace_back(entry.timestamp_ms, id);
    }
    std::stable_sort(by_age.begin(), by_age.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    const std::size_t to_remove =
        std::min(by_age.size(), entries_.size() - core::config::kResultCacheMaxEntries + 10);
    for (std::size_t i = 0; i < to_remove; ++i) {
        entries_.erase(by_age[i].second);
    }
}

std::optional<CachedResult> ResultCache::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<std::string> ResultCache::get_content(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = entries_.find(id);
    if (it == entries_.end() || it->second.is_binary) {
        return std::nullopt;
    }
    return it->second.text;
}

bool ResultCache::has(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(id) > 0;
}

void ResultCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

CacheStats ResultCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats stats;
    stats.size = entries_.size();
    if (entries_.empty()) {
        return stats;
    }
    const std::int64_t now = clock_();
    std::int64_t oldest = now;
    for (const auto& [id, entry] : entries_) {
        oldest = std::min(oldest, entry.timestamp_ms);
    }
    stats.oldest_age_ms = now - oldest;
    return stats;
}

ContentSummary generate_content_summary(const std::string& content, const std::string& path,
                                        const std::size_t preview_lines) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (true) {
        const auto newline = content.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, newline - start));
        start = newline + 1;
    }

    ContentSummary summary;
    summary.line_count = lines.size();
    summary.byte_size = content.size();
    summary.file_type = detect_file_type(path);

    for (std::size_t i = 0; i < lines.size() && i < preview_lines; ++i) {
        if (i > 0) {
            summary.preview += "\n";
        }
        summary.preview += lines[i].size() > 100 ? lines[i].substr(0, 100) + "..." : lines[i];
    }

    summary.summary = summary.file_type + ", " + std::to_string(summary.line_count) +
                      " lines, " + format_byte_size(summary.byte_size);
    return summary;
}

std::string format_byte_size(const std::size_t bytes) {
    if (bytes < 1024) {
        return std::to_string(bytes) + " bytes";
    }
    char buffer[32];
    if (bytes < 1024 * 1024) {
        std::snprintf(buffer, sizeof(buffer), "%.1f KB", static_cast<double>(bytes) / 1024.0);
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.1f MB",
                      static_cast<double>(bytes) / (1024.0 * 1024.0));
    }
    return buffer;
}

}  // namespace wasmbox::pipeline
