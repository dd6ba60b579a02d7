#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include "protocol/bytes.hpp"

namespace wasmbox::core::encoding {

bool is_valid_utf8(const std::uint8_t* data, std::size_t size);

inline bool is_valid_utf8(const protocol::Bytes& bytes) {
    return is_valid_utf8(bytes.data(), bytes.size());
}

// Decodes with U+FFFD for every maximal invalid subsequence. Not reversible.
std::string decode_utf8_lossy(const protocol::Bytes& bytes);

}  // namespace wasmbox::core::encoding
