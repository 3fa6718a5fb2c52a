/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgpack_tree_text.h"
#include "msgpack_projector.h"
#include "msgpack_text_input.h"

#include <span>

namespace mpk::msgpack {

static std::string byte_preview(std::span<const std::uint8_t> bytes, std::size_t limit) {
    const std::size_t n = bytes.size() < limit ? bytes.size() : limit;
    std::string out = "<Bytes: " + bytes_to_hex(bytes.first(n), " ");
    if (bytes.size() > n) {
        out += "...";
    }
    out += ">";
    return out;
}

static std::string scalar_text(const DecodedNode& node, const TreeTextOptions& opt) {
    return std::visit(
        Overloaded{
            [](std::nullptr_t) -> std::string { return "null"; },
            [](bool b) -> std::string { return b ? "true" : "false"; },
            [](const IntegerValue& v) -> std::string { return v.to_string(); },
            [](const FloatValue& v) -> std::string { return format_double(v.value); },
            [](const std::string& s) -> std::string { return nlohmann::ordered_json(s).dump(); },
            [&opt](const BinaryValue& v) -> std::string {
                return byte_preview(v.bytes, opt.byte_preview);
            },
            [](const ArrayValue& v) -> std::string {
                return "[" + std::to_string(v.children.size()) + " items]";
            },
            [](const MapValue& v) -> std::string {
                return "{" + std::to_string(v.children.size()) + " entries}";
            },
            [&opt](const ExtensionValue& v) -> std::string {
                return "type=" + std::to_string(static_cast<int>(v.type)) + " "
                       + byte_preview(v.bytes, opt.byte_preview);
            },
            [](const UnknownValue&) -> std::string { return "?"; },
        },
        node.value
    );
}

static std::string key_text(const MapKey& key) {
    if (key.node() != nullptr) {
        return map_key_to_string(key);
    }
    if (const auto* s = key.as_string()) {
        return nlohmann::ordered_json(*s).dump();
    }
    return map_key_to_string(key);
}

static void render_into(
    std::string& out,
    const DecodedNode& node,
    std::size_t level,
    const TreeTextOptions& opt
) {
    out.append(level * opt.indent, ' ');
    if (opt.show_ids) {
        out += "#" + std::to_string(node.id) + " ";
    }
    if (node.key) {
        out += key_text(*node.key) + ": ";
    }
    out += node_kind_name(node.kind());
    out += " <" + node.raw_subtype + "> ";
    out += scalar_text(node, opt);
    out += '\n';

    if (const auto* children = node.children()) {
        for (const auto& child : *children) {
            render_into(out, child, level + 1, opt);
        }
    }
}

std::string render_tree(const DecodedNode& root, const TreeTextOptions& opt) {
    std::string out;
    render_into(out, root, 0, opt);
    return out;
}

}  // namespace mpk::msgpack
