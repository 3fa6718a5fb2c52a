/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgpack_text_input.h"
#include "msgpack_error.h"

#include <array>

namespace mpk::msgpack {

static bool is_ascii_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

static int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

static int base64_value(char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '+') {
        return 62;
    }
    if (c == '/') {
        return 63;
    }
    return -1;
}

std::string_view trim_ascii(std::string_view s) {
    while (!s.empty() && is_ascii_space(s.front())) {
        s.remove_prefix(1);
    }
    while (!s.empty() && is_ascii_space(s.back())) {
        s.remove_suffix(1);
    }
    return s;
}

std::vector<std::uint8_t> parse_hex(std::string_view text) {
    std::string_view body = trim_ascii(text);
    if (body.rfind("0x", 0) == 0) {
        body.remove_prefix(2);
    }

    std::string clean;
    clean.reserve(body.size());
    for (char c : body) {
        if (!is_ascii_space(c)) {
            clean.push_back(c);
        }
    }

    if (clean.size() % 2 != 0) {
        throw MsgpackError(ErrorKind::MalformedInput, "Invalid Hex string length");
    }

    std::vector<std::uint8_t> out;
    out.reserve(clean.size() / 2);
    for (std::size_t i = 0; i < clean.size(); i += 2) {
        const int hi = hex_value(clean[i]);
        const int lo = hex_value(clean[i + 1]);
        if (hi < 0 || lo < 0) {
            throw MsgpackError(
                ErrorKind::MalformedInput,
                "Invalid Hex characters near position " + std::to_string(i)
            );
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

std::vector<std::uint8_t> parse_base64(std::string_view text) {
    std::string clean;
    clean.reserve(text.size());
    for (char c : text) {
        if (!is_ascii_space(c)) {
            clean.push_back(c);
        }
    }

    if (clean.size() % 4 == 0) {
        if (!clean.empty() && clean.back() == '=') {
            clean.pop_back();
            if (!clean.empty() && clean.back() == '=') {
                clean.pop_back();
            }
        }
    }
    if (clean.size() % 4 == 1) {
        throw MsgpackError(ErrorKind::MalformedInput, "Invalid Base64 string length");
    }

    std::vector<std::uint8_t> out;
    out.reserve(clean.size() / 4 * 3 + 2);
    std::uint32_t acc = 0;
    int acc_bits = 0;
    for (std::size_t i = 0; i < clean.size(); i++) {
        const int v = base64_value(clean[i]);
        if (v < 0) {
            throw MsgpackError(
                ErrorKind::MalformedInput,
                "Invalid Base64 character at position " + std::to_string(i)
            );
        }
        acc = (acc << 6) | static_cast<std::uint32_t>(v);
        acc_bits += 6;
        if (acc_bits >= 8) {
            acc_bits -= 8;
            out.push_back(static_cast<std::uint8_t>((acc >> acc_bits) & 0xFFu));
        }
    }
    return out;
}

// Splits UTF-8 text into UTF-16 code units. Ill-formed bytes become U+FFFD.
static std::vector<std::uint16_t> utf16_units(std::string_view text) {
    std::vector<std::uint16_t> units;
    units.reserve(text.size());
    std::size_t i = 0;
    while (i < text.size()) {
        const auto b = static_cast<std::uint8_t>(text[i]);
        std::size_t len = 0;
        std::uint32_t cp = 0;
        std::uint32_t min_cp = 0;
        if (b <= 0x7F) {
            units.push_back(b);
            i++;
            continue;
        } else if ((b & 0xE0) == 0xC0) {
            len = 2;
            cp = b & 0x1Fu;
            min_cp = 0x80;
        } else if ((b & 0xF0) == 0xE0) {
            len = 3;
            cp = b & 0x0Fu;
            min_cp = 0x800;
        } else if ((b & 0xF8) == 0xF0) {
            len = 4;
            cp = b & 0x07u;
            min_cp = 0x10000;
        }

        bool ok = len != 0 && i + len <= text.size();
        for (std::size_t k = 1; ok && k < len; k++) {
            const auto cont = static_cast<std::uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                ok = false;
            } else {
                cp = (cp << 6) | (cont & 0x3Fu);
            }
        }
        if (ok && (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            ok = false;
        }
        if (!ok) {
            units.push_back(0xFFFD);
            i++;
            continue;
        }

        if (cp >= 0x10000) {
            cp -= 0x10000;
            units.push_back(static_cast<std::uint16_t>(0xD800 + (cp >> 10)));
            units.push_back(static_cast<std::uint16_t>(0xDC00 + (cp & 0x3FFu)));
        } else {
            units.push_back(static_cast<std::uint16_t>(cp));
        }
        i += len;
    }
    return units;
}

static int hex_unit_value(std::uint16_t u) {
    return u < 0x80 ? hex_value(static_cast<char>(u)) : -1;
}

std::vector<std::uint8_t> parse_escaped_bytes(std::string_view text) {
    std::string_view content = trim_ascii(text);

    const bool single = content.rfind("b'", 0) == 0;
    const bool dbl = content.rfind("b\"", 0) == 0;
    if (single || dbl) {
        const char quote = single ? '\'' : '"';
        if (content.size() >= 3 && content.back() == quote) {
            content = content.substr(2, content.size() - 3);
        } else {
            content.remove_prefix(2);
        }
    }

    // Each character contributes its UTF-16 code unit truncated to one byte.
    const std::vector<std::uint16_t> units = utf16_units(content);
    std::vector<std::uint8_t> out;
    out.reserve(units.size());
    std::size_t i = 0;
    while (i < units.size()) {
        const std::uint16_t c = units[i];
        if (c != '\\') {
            out.push_back(static_cast<std::uint8_t>(c & 0xFFu));
            i++;
            continue;
        }

        if (i + 1 >= units.size()) {
            out.push_back('\\');
            break;
        }

        const std::uint16_t next = units[i + 1];
        if (next == 'x') {
            if (i + 3 < units.size()) {
                const int hi = hex_unit_value(units[i + 2]);
                const int lo = hex_unit_value(units[i + 3]);
                if (hi >= 0 && lo >= 0) {
                    out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
                    i += 4;
                    continue;
                }
            }
            out.push_back('\\');
            out.push_back('x');
            i += 2;
            continue;
        }

        switch (next) {
            case 'n':
                out.push_back(10);
                break;
            case 'r':
                out.push_back(13);
                break;
            case 't':
                out.push_back(9);
                break;
            case '\\':
                out.push_back(92);
                break;
            case '"':
                out.push_back(34);
                break;
            case '\'':
                out.push_back(39);
                break;
            case '0':
                out.push_back(0);
                break;
            default:
                out.push_back(static_cast<std::uint8_t>(next & 0xFFu));
                break;
        }
        i += 2;
    }
    return out;
}

std::string bytes_to_base64(std::span<const std::uint8_t> bytes) {
    static const char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);
    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        const std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 16)
                                | (static_cast<std::uint32_t>(bytes[i + 1]) << 8) | bytes[i + 2];
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out.push_back(alphabet[(v >> 6) & 0x3F]);
        out.push_back(alphabet[v & 0x3F]);
    }
    const std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        const std::uint32_t v = static_cast<std::uint32_t>(bytes[i]) << 16;
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        const std::uint32_t v = (static_cast<std::uint32_t>(bytes[i]) << 16)
                                | (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
        out.push_back(alphabet[(v >> 18) & 0x3F]);
        out.push_back(alphabet[(v >> 12) & 0x3F]);
        out.push_back(alphabet[(v >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::string bytes_to_hex(std::span<const std::uint8_t> bytes, std::string_view separator) {
    static const char hexdig[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * (2 + separator.size()));
    for (std::size_t i = 0; i < bytes.size(); i++) {
        if (i != 0) {
            out.append(separator);
        }
        out.push_back(hexdig[(bytes[i] >> 4) & 0xF]);
        out.push_back(hexdig[bytes[i] & 0xF]);
    }
    return out;
}

}  // namespace mpk::msgpack
