/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace mpk::msgpack {

std::string_view trim_ascii(std::string_view s);

// Optional leading "0x", whitespace anywhere. Throws MsgpackError(MalformedInput).
std::vector<std::uint8_t> parse_hex(std::string_view text);

// Standard alphabet, ASCII whitespace ignored, padding optional.
// Throws MsgpackError(MalformedInput).
std::vector<std::uint8_t> parse_base64(std::string_view text);

// b'...' / b"..." literal or bare escaped text (\xHH, \n, \r, \t, \\, \", \', \0).
// Lenient: never throws; unrecognized escapes fall back to literal characters.
std::vector<std::uint8_t> parse_escaped_bytes(std::string_view text);

std::string bytes_to_base64(std::span<const std::uint8_t> bytes);
std::string bytes_to_hex(std::span<const std::uint8_t> bytes, std::string_view separator = {});

}  // namespace mpk::msgpack
