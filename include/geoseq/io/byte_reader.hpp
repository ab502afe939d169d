#pragma once

#include "geoseq/core/errors.hpp"

#include <cstdint>
#include <cstring>
#include <string>

namespace geoseq::io {

// Bounds-checked cursor over a byte range. Every read past the end throws
// ParseError so truncated containers are rejected instead of overrun.
class ByteReader {
public:
    ByteReader(const uint8_t* data, size_t size) : data_(data), size_(size) {}

    size_t pos() const { return pos_; }
    size_t size() const { return size_; }
    size_t remaining() const { return size_ - pos_; }
    bool at_end() const { return pos_ >= size_; }
    const uint8_t* current() const { return data_ + pos_; }

    void seek(size_t pos) {
        if (pos > size_) {
            throw ParseError("Seek past end of buffer");
        }
        pos_ = pos;
    }

    void skip(size_t n) {
        require(n);
        pos_ += n;
    }

    uint8_t u8() {
        require(1);
        return data_[pos_++];
    }

    uint16_t u16be() {
        require(2);
        uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    uint32_t u32be() {
        require(4);
        uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return v;
    }

    uint64_t u64be() {
        uint64_t hi = u32be();
        uint64_t lo = u32be();
        return (hi << 32) | lo;
    }

    int16_t i16be() { return static_cast<int16_t>(u16be()); }
    int32_t i32be() { return static_cast<int32_t>(u32be()); }
    int64_t i64be() { return static_cast<int64_t>(u64be()); }

    float f32be() {
        uint32_t bits = u32be();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    double f64be() {
        uint64_t bits = u64be();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    uint16_t u16le() {
        require(2);
        uint16_t v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }

    uint32_t u32le() {
        require(4);
        uint32_t v = static_cast<uint32_t>(data_[pos_]) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
        pos_ += 4;
        return v;
    }

    uint64_t u64le() {
        uint64_t lo = u32le();
        uint64_t hi = u32le();
        return (hi << 32) | lo;
    }

    int32_t i32le() { return static_cast<int32_t>(u32le()); }

    float f32le() {
        uint32_t bits = u32le();
        float v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    double f64le() {
        uint64_t bits = u64le();
        double v;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    std::string fourcc() {
        require(4);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), 4);
        pos_ += 4;
        return s;
    }

    std::string str(size_t n) {
        require(n);
        std::string s(reinterpret_cast<const char*>(data_ + pos_), n);
        pos_ += n;
        return s;
    }

private:
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;

    void require(size_t n) const {
        if (n > size_ - pos_) {
            throw ParseError("Unexpected end of data at offset " + std::to_string(pos_) +
                             " (need " + std::to_string(n) + " bytes, have " +
                             std::to_string(size_ - pos_) + ")");
        }
    }
};

} // namespace geoseq::io
