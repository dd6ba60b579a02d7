#include "core/encoding/utf8.hpp"

namespace wasmbox::core::encoding {

namespace {

constexpr char kReplacement[] = "\xEF\xBF\xBD";

// Length of the well-formed sequence at data[i], or 0 when it is ill-formed.
std::size_t sequence_length(const std::uint8_t* data, std::size_t size,
                            std::size_t i) {
    const std::uint8_t lead = data[i];
    if (lead < 0x80) {
        return 1;
    }

    std::size_t length = 0;
    std::uint8_t lower = 0x80;
    std::uint8_t upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) lower = 0xA0;
        if (lead == 0xED) upper = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) lower = 0x90;
        if (lead == 0xF4) upper = 0x8F;
    } else {
        return 0;
    }

    if (i + length > size) {
        return 0;
    }
    if (data[i + 1] < lower || data[i + 1] > upper) {
        return 0;
    }
    for (std::size_t k = 2; k < length; ++k) {
        if (data[i + k] < 0x80 || data[i + k] > 0xBF) {
            return 0;
        }
    }
    return length;
}

// Bytes consumed by one replacement character: the lead plus any valid
// continuation bytes of the truncated sequence.
std::size_t invalid_span(const std::uint8_t* data, std::size_t size,
                         std::size_t i) {
    const std::uint8_t lead = data[i];
    std::size_t expected = 0;
    std::uint8_t lower = 0x80;
    std::uint8_t upper = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        expected = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        expected = 3;
        if (lead == 0xE0) lower = 0xA0;
        if (lead == 0xED) upper = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        expected = 4;
        if (lead == 0xF0) lower = 0x90;
        if (lead == 0xF4) upper = 0x8F;
    } else {
        return 1;
    }

    std::size_t consumed = 1;
    while (consumed < expected && i + consumed < size) {
        const std::uint8_t next = data[i + consumed];
        const std::uint8_t lo = consumed == 1 ? lower : 0x80;
        const std::uint8_t hi = consumed == 1 ? upper : 0xBF;
        if (next < lo || next > hi) {
            break;
        }
        ++consumed;
    }
    return consumed;
}

}  // namespace

bool is_valid_utf8(const std::uint8_t* data, std::size_t size) {
    std::size_t i = 0;
    while (i < size) {
        const std::size_t length = sequence_length(data, size, i);
        if (length == 0) {
            return false;
        }
        i += length;
    }
    return true;
}

std::string decode_utf8_lossy(const protocol::Bytes& bytes) {
    std::string out;
    out.reserve(bytes.size());
    const std::uint8_t* data = bytes.data();
    const std::size_t size = bytes.size();
    std::size_t i = 0;
    while (i < size) {
        const std::size_t length = sequence_length(data, size, i);
        if (length == 0) {
            out += kReplacement;
            i += invalid_span(data, size, i);
            continue;
        }
        out.append(reinterpret_cast<const char*>(data + i), length);
        i += length;
    }
    return out;
}

}  // namespace wasmbox::core::encoding
