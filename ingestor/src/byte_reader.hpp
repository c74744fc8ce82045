#pragma once

#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <vector>
#include "util.hpp"

class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string& msg) : std::runtime_error(msg) {}
};

// Bounds-checked little-endian reads over a borrowed buffer (Borsh / packed C layouts).
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit ByteReader(const std::vector<uint8_t>& buf) : ByteReader(buf.data(), buf.size()) {}

    size_t size() const { return size_; }

    uint8_t u8(size_t offset) const {
        require(offset, 1);
        return data_[offset];
    }

    bool boolean(size_t offset) const {
        uint8_t v = u8(offset);
        if (v > 1) {
            throw DecodeError("invalid bool byte at offset " + std::to_string(offset));
        }
        return v == 1;
    }

    uint16_t u16(size_t offset) const { return read_le<uint16_t>(offset); }
    uint32_t u32(size_t offset) const { return read_le<uint32_t>(offset); }
    uint64_t u64(size_t offset) const { return read_le<uint64_t>(offset); }
    int64_t i64(size_t offset) const { return static_cast<int64_t>(read_le<uint64_t>(offset)); }

    std::vector<uint8_t> bytes(size_t offset, size_t len) const {
        require(offset, len);
        return std::vector<uint8_t>(data_ + offset, data_ + offset + len);
    }

    // 32-byte public key, base58 encoded
    std::string pubkey(size_t offset) const {
        return util::base58_encode(bytes(offset, 32));
    }

    bool starts_with(const std::vector<uint8_t>& prefix) const {
        return prefix.size() <= size_ &&
               std::memcmp(data_, prefix.data(), prefix.size()) == 0;
    }

private:
    const uint8_t* data_;
    size_t size_;

    void require(size_t offset, size_t len) const {
        if (offset > size_ || len > size_ - offset) {
            throw DecodeError("read of " + std::to_string(len) + " bytes at offset " +
                              std::to_string(offset) + " exceeds buffer of " +
                              std::to_string(size_));
        }
    }

    template <typename T>
    T read_le(size_t offset) const {
        require(offset, sizeof(T));
        T value = 0;
        for (size_t i = 0; i < sizeof(T); ++i) {
            value |= static_cast<T>(data_[offset + i]) << (8 * i);
        }
        return value;
    }
};
