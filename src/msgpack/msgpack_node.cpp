/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgpack_node.h"

#include <charconv>
#include <cmath>
#include <limits>
#include <string_view>
#include <system_error>

namespace mpk::msgpack {

std::string_view node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Null:
            return "Null";
        case NodeKind::Boolean:
            return "Boolean";
        case NodeKind::Integer:
            return "Integer";
        case NodeKind::Float:
            return "Float";
        case NodeKind::String:
            return "String";
        case NodeKind::Binary:
            return "Binary";
        case NodeKind::Array:
            return "Array";
        case NodeKind::Map:
            return "Map";
        case NodeKind::Extension:
            return "Extension";
        case NodeKind::Unknown:
            return "Unknown";
    }
    return "Unknown";
}

IntegerValue IntegerValue::from_signed(std::int64_t v, int bits) {
    IntegerValue out{};
    if (v < 0) {
        out.value = v;
    } else {
        out.value = static_cast<std::uint64_t>(v);
    }
    out.wire_bits = bits;
    return out;
}

IntegerValue IntegerValue::from_unsigned(std::uint64_t v, int bits) {
    IntegerValue out{};
    out.value = v;
    out.wire_bits = bits;
    return out;
}

std::optional<std::int64_t> IntegerValue::as_i64() const {
    if (const auto* s = std::get_if<std::int64_t>(&value)) {
        return *s;
    }
    const std::uint64_t u = std::get<std::uint64_t>(value);
    if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(u);
}

std::optional<std::uint64_t> IntegerValue::as_u64() const {
    if (const auto* u = std::get_if<std::uint64_t>(&value)) {
        return *u;
    }
    return std::nullopt;
}

std::string IntegerValue::to_string() const {
    return std::visit([](auto v) { return std::to_string(v); }, value);
}

const DecodedNode* MapKey::node() const {
    if (const auto* n = std::get_if<NodeKey>(&value)) {
        return n->get();
    }
    return nullptr;
}

const std::string* MapKey::as_string() const {
    if (const auto* p = primitive()) {
        return std::get_if<std::string>(p);
    }
    return nullptr;
}

const std::vector<DecodedNode>* DecodedNode::children() const {
    if (const auto* a = get<ArrayValue>()) {
        return &a->children;
    }
    if (const auto* m = get<MapValue>()) {
        return &m->children;
    }
    return nullptr;
}

std::optional<std::int8_t> DecodedNode::extension_tag() const {
    if (const auto* e = get<ExtensionValue>()) {
        return e->type;
    }
    return std::nullopt;
}

std::string format_double(double v) {
    if (std::isnan(v)) {
        return "NaN";
    }
    if (std::isinf(v)) {
        return v < 0 ? "-Infinity" : "Infinity";
    }
    if (v == 0.0) {
        return "0";
    }
    if (v < 0) {
        return "-" + format_double(-v);
    }

    // Shortest round-trip digits, laid out the way ECMAScript Number::toString does.
    char buf[64];
    const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    if (ec != std::errc{}) {
        return std::to_string(v);
    }
    const std::string_view sci(buf, static_cast<std::size_t>(ptr - buf));
    const std::size_t e_pos = sci.find('e');
    std::string digits;
    for (const char c : sci.substr(0, e_pos)) {
        if (c != '.') {
            digits.push_back(c);
        }
    }
    std::string_view exp_text = sci.substr(e_pos + 1);
    if (!exp_text.empty() && exp_text.front() == '+') {
        exp_text.remove_prefix(1);
    }
    int exp10 = 0;
    if (std::from_chars(exp_text.data(), exp_text.data() + exp_text.size(), exp10).ec != std::errc{}) {
        return std::string(sci);
    }

    const int k = static_cast<int>(digits.size());
    const int n = exp10 + 1;
    if (k <= n && n <= 21) {
        return digits + std::string(static_cast<std::size_t>(n - k), '0');
    }
    if (0 < n && n <= 21) {
        return digits.substr(0, static_cast<std::size_t>(n)) + "." + digits.substr(static_cast<std::size_t>(n));
    }
    if (-6 < n && n <= 0) {
        return "0." + std::string(static_cast<std::size_t>(-n), '0') + digits;
    }

    std::string out = digits.substr(0, 1);
    if (k > 1) {
        out += "." + digits.substr(1);
    }
    out += n - 1 < 0 ? "e-" : "e+";
    out += std::to_string(n - 1 < 0 ? 1 - n : n - 1);
    return out;
}

}  // namespace mpk::msgpack
