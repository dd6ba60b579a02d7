#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>

namespace wasmbox::runtime {

// Thrown by a host import that touches guest memory out of bounds. The
// import wrapper turns it into a trap.
class HostFault : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Bounds-checked little-endian view of a module's linear memory. Valid only
// for the duration of one host call: memory.grow may move the base.
class GuestMemory {
public:
    GuestMemory(std::uint8_t* base, std::size_t size) : base_(base), size_(size) {}

    std::uint8_t* at(std::uint32_t offset, std::uint32_t length) const {
        const std::uint64_t end = static_cast<std::uint64_t>(offset) + length;
        if (base_ == nullptr || end > size_) {
            throw HostFault("memory access out of bounds: offset " +
                            std::to_string(offset) + ", length " +
                            std::to_string(length));
        }
        return base_ + offset;
    }

    std::uint32_t read_u32(std::uint32_t offset) const {
        const std::uint8_t* p = at(offset, 4);
        return static_cast<std::uint32_t>(p[0]) |
               (static_cast<std::uint32_t>(p[1]) << 8) |
               (static_cast<std::uint32_t>(p[2]) << 16) |
               (static_cast<std::uint32_t>(p[3]) << 24);
    }

    void write_u8(std::uint32_t offset, std::uint8_t value) const {
        *at(offset, 1) = value;
    }

    void write_u16(std::uint32_t offset, std::uint16_t value) const {
        write_le(offset, value, 2);
    }

    void write_u32(std::uint32_t offset, std::uint32_t value) const {
        write_le(offset, value, 4);
    }

    void write_u64(std::uint32_t offset, std::uint64_t value) const {
        write_le(offset, value, 8);
    }

    void write_bytes(std::uint32_t offset, const void* data, std::uint32_t length) const {
        if (length == 0) {
            return;
        }
        std::memcpy(at(offset, length), data, length);
    }

    void fill_zero(std::uint32_t offset, std::uint32_t length) const {
        std::memset(at(offset, length), 0, length);
    }

    std::string read_string(std::uint32_t offset, std::uint32_t length) const {
        const std::uint8_t* p = at(offset, length);
        return std::string(reinterpret_cast<const char*>(p), length);
    }

private:
    void write_le(std::uint32_t offset, std::uint64_t value, std::uint32_t width) const {
        std::uint8_t* p = at(offset, width);
        for (std::uint32_t i = 0; i < width; ++i) {
            p[i] = static_cast<std::uint8_t>(value >> (8 * i));
        }
    }

    std::uint8_t* base_;
    std::size_t size_;
};

}  // namespace wasmbox::runtime
