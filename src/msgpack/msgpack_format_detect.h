/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mpk::msgpack {

enum class InputFormat {
    Auto,
    Hex,
    Base64,
    EscapedBytes,
};

std::string_view input_format_name(InputFormat format);
std::optional<InputFormat> parse_input_format(std::string_view name);

struct RecoveredBytes {
    std::vector<std::uint8_t> bytes;
    InputFormat format = InputFormat::Auto;
    // Failures of candidates tried before the one that succeeded.
    std::vector<std::string> candidate_errors;
};

// Runs the parser for a pinned format. Auto is rejected with std::invalid_argument.
std::vector<std::uint8_t> recover_bytes(std::string_view text, InputFormat format);

// Tries escaped literal, hex, base64 and bare escaped text in that order and
// returns the first success. Throws MsgpackError(FormatUndetected) otherwise.
RecoveredBytes detect_and_recover(std::string_view text);

}  // namespace mpk::msgpack
