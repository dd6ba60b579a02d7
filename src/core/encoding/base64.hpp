#pragma once

#include <string>
#include <string_view>
#include "core/errors/tool_errors.hpp"
#include "protocol/bytes.hpp"

namespace wasmbox::core::encoding {

std::string base64_encode(const protocol::Bytes& bytes);

// Accepts standard alphabet input with or without padding. ASCII whitespace is
// ignored. Anything else yields an invalid_base64 error.
core::errors::Result<protocol::Bytes> base64_decode(std::string_view text);

}  // namespace wasmbox::core::encoding
