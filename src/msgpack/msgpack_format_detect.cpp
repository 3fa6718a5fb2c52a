/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgpack_format_detect.h"
#include "msgpack_error.h"
#include "msgpack_text_input.h"

#include <stdexcept>

namespace mpk::msgpack {

static bool all_hex(std::string_view s) {
    for (char c : s) {
        const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
        if (!ok) {
            return false;
        }
    }
    return true;
}

static bool all_base64_chars(std::string_view s) {
    for (char c : s) {
        const bool ok = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
                        || c == '+' || c == '/' || c == '=';
        if (!ok) {
            return false;
        }
    }
    return true;
}

static std::string strip_hex_decoration(std::string_view s) {
    if (s.rfind("0x", 0) == 0) {
        s.remove_prefix(2);
    }
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c != ' ' && c != '\t' && c != '\n' && c != '\r' && c != '\f' && c != '\v') {
            out.push_back(c);
        }
    }
    return out;
}

std::string_view input_format_name(InputFormat format) {
    switch (format) {
        case InputFormat::Auto:
            return "auto";
        case InputFormat::Hex:
            return "hex";
        case InputFormat::Base64:
            return "base64";
        case InputFormat::EscapedBytes:
            return "bytes";
    }
    return "auto";
}

std::optional<InputFormat> parse_input_format(std::string_view name) {
    if (name == "auto") {
        return InputFormat::Auto;
    }
    if (name == "hex") {
        return InputFormat::Hex;
    }
    if (name == "base64" || name == "b64") {
        return InputFormat::Base64;
    }
    if (name == "bytes" || name == "python") {
        return InputFormat::EscapedBytes;
    }
    return std::nullopt;
}

std::vector<std::uint8_t> recover_bytes(std::string_view text, InputFormat format) {
    switch (format) {
        case InputFormat::Hex:
            return parse_hex(text);
        case InputFormat::Base64:
            return parse_base64(text);
        case InputFormat::EscapedBytes:
            return parse_escaped_bytes(text);
        case InputFormat::Auto:
            break;
    }
    throw std::invalid_argument("recover_bytes needs a concrete input format");
}

RecoveredBytes detect_and_recover(std::string_view text) {
    const std::string_view clean = trim_ascii(text);
    RecoveredBytes out{};

    auto attempt = [&](InputFormat format, const char* label) -> bool {
        try {
            out.bytes = recover_bytes(clean, format);
            out.format = format;
            return true;
        } catch (const MsgpackError& e) {
            out.candidate_errors.push_back(std::string(label) + ": " + e.what());
            return false;
        }
    };

    if (clean.rfind("b'", 0) == 0 || clean.rfind("b\"", 0) == 0) {
        if (attempt(InputFormat::EscapedBytes, "Bytes literal")) {
            return out;
        }
    }

    const std::string hex_clean = strip_hex_decoration(clean);
    if (!hex_clean.empty() && hex_clean.size() % 2 == 0 && all_hex(hex_clean)) {
        if (attempt(InputFormat::Hex, "Hex")) {
            return out;
        }
    }

    if (clean.size() % 4 == 0 && !clean.empty() && all_base64_chars(clean)) {
        if (attempt(InputFormat::Base64, "Base64")) {
            return out;
        }
    }

    if (clean.find("\\x") != std::string_view::npos) {
        if (attempt(InputFormat::EscapedBytes, "Escaped text")) {
            return out;
        }
    }

    std::string message = "Could not auto-detect format. Please select one manually.";
    for (const auto& err : out.candidate_errors) {
        message += "\n  " + err;
    }
    throw MsgpackError(ErrorKind::FormatUndetected, message);
}

}  // namespace mpk::msgpack
