#include "core/encoding/base64.hpp"

#include <cctype>
#include <openssl/evp.h>

namespace wasmbox::core::encoding {

using core::errors::ErrorCategory;
using core::errors::ToolError;

namespace {

bool is_base64_char(const unsigned char c) {
    return std::isalnum(c) != 0 || c == '+' || c == '/';
}

ToolError invalid_input(const std::string& detail) {
    return ToolError{ErrorCategory::Input, "Invalid base64 data: " + detail,
                     "invalid_base64"};
}

}  // namespace

std::string base64_encode(const protocol::Bytes& bytes) {
    if (bytes.empty()) {
        return {};
    }
    std::string out(4 * ((bytes.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
        static_cast<int>(bytes.size()));
    out.resize(static_cast<std::size_t>(written));
    return out;
}

core::errors::Result<protocol::Bytes> base64_decode(std::string_view text) {
    std::string compact;
    compact.reserve(text.size());
    for (const char raw : text) {
        const auto c = static_cast<unsigned char>(raw);
        if (std::isspace(c) != 0) {
            continue;
        }
        compact.push_back(raw);
    }

    std::size_t padding = 0;
    while (!compact.empty() && compact.back() == '=') {
        compact.pop_back();
        ++padding;
    }
    if (padding > 2) {
        return invalid_input("too much padding");
    }
    for (const char c : compact) {
        if (!is_base64_char(static_cast<unsigned char>(c))) {
            return invalid_input("unexpected character");
        }
    }
    if (compact.size() % 4 == 1) {
        return invalid_input("truncated input");
    }
    if (compact.empty()) {
        return protocol::Bytes{};
    }

    const std::size_t missing = (4 - compact.size() % 4) % 4;
    compact.append(missing, '=');

    protocol::Bytes out(3 * (compact.size() / 4));
    const int decoded = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(compact.data()),
        static_cast<int>(compact.size()));
    if (decoded < 0) {
        return invalid_input("decoder rejected input");
    }
    // EVP_DecodeBlock keeps the zero bytes that stand in for padding
    out.resize(static_cast<std::size_t>(decoded) - missing);
    return out;
}

}  // namespace wasmbox::core::encoding
