#pragma once

#include <cstddef>
#include <cstdint>
#include <format>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace rstools::binutil {

// --- Errors ---

// DecodeError is the base of every failure raised while parsing cache bytes.
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// OutOfBounds is thrown when a read would run past the end of the buffer.
// The cursor that threw must not be used again.
class OutOfBounds : public DecodeError {
public:
    using DecodeError::DecodeError;
};

// MalformedRecord is thrown by decoders when a record is structurally
// inconsistent (truncated, values outside their field range, duplicates).
class MalformedRecord : public DecodeError {
public:
    using DecodeError::DecodeError;
};

// ByteCursor is a forward reader over an immutable byte buffer.
// All multi-byte integers are big-endian, matching the cache layout.
class ByteCursor {
public:
    explicit ByteCursor(std::span<const uint8_t> data) : data_(data) {}
    ByteCursor(const uint8_t* data, size_t size) : data_(data, size) {}

    // --- Fixed width ---

    uint8_t read_u8() {
        need(1);
        return data_[pos_++];
    }

    int8_t read_i8() { return static_cast<int8_t>(read_u8()); }

    uint16_t read_u16() {
        need(2);
        uint16_t v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
        pos_ += 2;
        return v;
    }

    int16_t read_i16() { return static_cast<int16_t>(read_u16()); }

    uint32_t read_u24() {
        need(3);
        uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 8) |
                     static_cast<uint32_t>(data_[pos_ + 2]);
        pos_ += 3;
        return v;
    }

    uint32_t read_u32() {
        need(4);
        uint32_t v = (static_cast<uint32_t>(data_[pos_]) << 24) |
                     (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return v;
    }

    int32_t read_i32() { return static_cast<int32_t>(read_u32()); }

    // --- Variable length ---

    // read_smart reads one byte for values below 0x80, otherwise two bytes
    // with the high bit cleared (0..32767).
    uint16_t read_smart() {
        if (peek_u8() < 0x80) return read_u8();
        return static_cast<uint16_t>(read_u16() - 0x8000);
    }

    // read_extended_smart sums smarts while each equals 0x7FFF, so values
    // above 32767 are a run of 0x7FFF followed by the remainder.
    uint32_t read_extended_smart() {
        uint32_t value = 0;
        uint16_t part = read_smart();
        while (part == 0x7FFF) {
            if (value > UINT32_MAX - 2 * 0x7FFF)
                throw MalformedRecord("extended smart exceeds 32 bits");
            value += 0x7FFF;
            part = read_smart();
        }
        return value + part;
    }

    // read_big_smart reads two bytes, or four bytes when the high bit is set.
    uint32_t read_big_smart() {
        if (peek_u8() & 0x80) return read_u32() & 0x7FFFFFFF;
        return read_u16();
    }

    // --- Strings and blobs ---

    // read_string reads a NUL terminated string. Cache text is single-byte
    // Latin-1 and is returned as UTF-8.
    std::string read_string() {
        std::string s;
        for (;;) {
            uint8_t c = read_u8();
            if (c == 0) return s;
            append_latin1(s, c);
        }
    }

    // read_fixed_string reads exactly size bytes, truncated at the first NUL.
    std::string read_fixed_string(size_t size) {
        need(size);
        std::string s;
        for (size_t i = 0; i < size; i++) {
            uint8_t c = data_[pos_ + i];
            if (c == 0) break;
            append_latin1(s, c);
        }
        pos_ += size;
        return s;
    }

    std::span<const uint8_t> read_bytes(size_t n) {
        need(n);
        auto view = data_.subspan(pos_, n);
        pos_ += n;
        return view;
    }

    std::vector<uint8_t> read_byte_vector(size_t n) {
        auto view = read_bytes(n);
        return {view.begin(), view.end()};
    }

    void skip(size_t n) {
        need(n);
        pos_ += n;
    }

    uint8_t peek_u8() const {
        need(1);
        return data_[pos_];
    }

    // --- State ---

    size_t position() const { return pos_; }
    size_t size() const { return data_.size(); }
    size_t remaining() const { return data_.size() - pos_; }
    bool at_end() const { return pos_ >= data_.size(); }

    // rest returns the unread part of the buffer without consuming it.
    std::span<const uint8_t> rest() const { return data_.subspan(pos_); }

private:
    void need(size_t n) const {
        if (n > data_.size() - pos_)
            throw OutOfBounds(std::format(
                "binutil: read of {} bytes at offset {} exceeds buffer of {} bytes",
                n, pos_, data_.size()));
    }

    static void append_latin1(std::string& s, uint8_t c) {
        if (c < 0x80) {
            s += static_cast<char>(c);
        } else {
            s += static_cast<char>(0xC0 | (c >> 6));
            s += static_cast<char>(0x80 | (c & 0x3F));
        }
    }

    std::span<const uint8_t> data_;
    size_t pos_ = 0;
};

} // namespace rstools::binutil
