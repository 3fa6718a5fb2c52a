/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "msgpack_error.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>

namespace mpk::msgpack {
// Big-endian cursor over an immutable buffer. Every read is bounds checked and
// names the element being read in the UnexpectedEnd message.
class ByteReader {
   public:
    explicit ByteReader(std::span<const std::uint8_t> data) : _data(data), _pos(0) {}

    std::size_t position() const { return _pos; }
    std::size_t size() const { return _data.size(); }
    std::size_t remaining() const { return _data.size() - _pos; }
    bool at_end() const { return _pos >= _data.size(); }

    std::uint8_t read_u8(const char* what) {
        require(1, what);
        return _data[_pos++];
    }

    std::int8_t read_i8(const char* what) { return static_cast<std::int8_t>(read_u8(what)); }

    std::uint16_t read_u16(const char* what) {
        return static_cast<std::uint16_t>(read_be(2, what));
    }

    std::uint32_t read_u32(const char* what) {
        return static_cast<std::uint32_t>(read_be(4, what));
    }

    std::uint64_t read_u64(const char* what) { return read_be(8, what); }

    float read_f32(const char* what) {
        const std::uint32_t bits = read_u32(what);
        float v = 0;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    double read_f64(const char* what) {
        const std::uint64_t bits = read_u64(what);
        double v = 0;
        std::memcpy(&v, &bits, sizeof(v));
        return v;
    }

    // Returns a view into the underlying buffer; callers copy what they keep.
    std::span<const std::uint8_t> read_span(std::size_t len, const char* what) {
        require(len, what);
        const auto out = _data.subspan(_pos, len);
        _pos += len;
        return out;
    }

   private:
    std::span<const std::uint8_t> _data;
    std::size_t _pos;

    std::uint64_t read_be(std::size_t width, const char* what) {
        require(width, what);
        std::uint64_t value = 0;
        for (std::size_t i = 0; i < width; i++) {
            value = (value << 8) | _data[_pos + i];
        }
        _pos += width;
        return value;
    }

    void require(std::size_t len, const char* what) const {
        if (len > remaining()) {
            throw MsgpackError(
                ErrorKind::UnexpectedEnd,
                std::string("Unexpected end of input (") + what + ") at offset "
                    + std::to_string(_pos) + ": need " + std::to_string(len) + " byte(s), "
                    + std::to_string(remaining()) + " left"
            );
        }
    }
};
}  // namespace mpk::msgpack
