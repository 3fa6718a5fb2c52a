/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgpack_decoder.h"
#include "msgpack_byte_reader.h"

#include <algorithm>
#include <cstdio>
#include <string>
#include <utility>

namespace mpk::msgpack {

struct DecodeContext {
    ByteReader reader;
    std::size_t max_depth = 0;
    std::uint64_t next_id = 0;
};

static DecodedNode decode_node(DecodeContext& ctx, std::optional<MapKey> key, std::size_t depth);

static std::string hex_byte(std::uint8_t b) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02x", static_cast<unsigned>(b));
    return buf;
}

static std::string with_count(const char* label, std::uint64_t n) {
    return std::string(label) + "(" + std::to_string(n) + ")";
}

// UTF-8 to UTF-8 with every ill-formed subsequence replaced by U+FFFD, using
// the maximal-subpart rule of the WHATWG decoder. A leading BOM is dropped.
static std::string decode_utf8_lossy(std::span<const std::uint8_t> in) {
    static const char kReplacement[] = "\xEF\xBF\xBD";
    if (in.size() >= 3 && in[0] == 0xEF && in[1] == 0xBB && in[2] == 0xBF) {
        in = in.subspan(3);
    }
    std::string out;
    out.reserve(in.size());

    std::size_t needed = 0;
    std::size_t seen = 0;
    std::size_t seq_start = 0;
    std::uint8_t lower = 0x80;
    std::uint8_t upper = 0xBF;

    std::size_t i = 0;
    while (i < in.size()) {
        const std::uint8_t b = in[i];
        if (needed == 0) {
            if (b <= 0x7F) {
                out.push_back(static_cast<char>(b));
            } else if (b >= 0xC2 && b <= 0xDF) {
                needed = 1;
                seq_start = i;
            } else if (b >= 0xE0 && b <= 0xEF) {
                if (b == 0xE0) {
                    lower = 0xA0;
                }
                if (b == 0xED) {
                    upper = 0x9F;
                }
                needed = 2;
                seq_start = i;
            } else if (b >= 0xF0 && b <= 0xF4) {
                if (b == 0xF0) {
                    lower = 0x90;
                }
                if (b == 0xF4) {
                    upper = 0x8F;
                }
                needed = 3;
                seq_start = i;
            } else {
                out += kReplacement;
            }
            i++;
            continue;
        }

        if (b < lower || b > upper) {
            // Drop the partial sequence and reprocess this byte as a lead byte.
            needed = 0;
            seen = 0;
            lower = 0x80;
            upper = 0xBF;
            out += kReplacement;
            continue;
        }

        lower = 0x80;
        upper = 0xBF;
        seen++;
        i++;
        if (seen == needed) {
            out.append(reinterpret_cast<const char*>(in.data() + seq_start), needed + 1);
            needed = 0;
            seen = 0;
        }
    }
    if (needed != 0) {
        out += kReplacement;
    }
    return out;
}

static MapKey to_map_key(DecodedNode key_node) {
    MapKey key{};
    switch (key_node.kind()) {
        case NodeKind::Null:
            key.value = PrimitiveKey(nullptr);
            break;
        case NodeKind::Boolean:
            key.value = PrimitiveKey(std::get<bool>(key_node.value));
            break;
        case NodeKind::Integer:
            key.value = PrimitiveKey(std::get<IntegerValue>(key_node.value));
            break;
        case NodeKind::Float:
            key.value = PrimitiveKey(std::get<FloatValue>(key_node.value));
            break;
        case NodeKind::String:
            key.value = PrimitiveKey(std::move(std::get<std::string>(key_node.value)));
            break;
        case NodeKind::Binary:
        case NodeKind::Array:
        case NodeKind::Map:
        case NodeKind::Extension:
        case NodeKind::Unknown:
            key.value = std::make_shared<const DecodedNode>(std::move(key_node));
            break;
    }
    return key;
}

static void read_string(DecodeContext& ctx, DecodedNode& node, std::uint64_t len, const char* label) {
    const auto bytes = ctx.reader.read_span(static_cast<std::size_t>(len), "String");
    node.value = decode_utf8_lossy(bytes);
    node.raw_subtype = with_count(label, len);
    node.declared_length = len;
}

static void read_binary(DecodeContext& ctx, DecodedNode& node, std::uint64_t len, const char* label) {
    const auto bytes = ctx.reader.read_span(static_cast<std::size_t>(len), "Binary");
    node.value = BinaryValue{std::vector<std::uint8_t>(bytes.begin(), bytes.end())};
    node.raw_subtype = with_count(label, len);
    node.declared_length = len;
}

static void read_extension(DecodeContext& ctx, DecodedNode& node, std::uint64_t len, const char* label) {
    ExtensionValue ext{};
    ext.type = ctx.reader.read_i8("Extension type");
    const auto bytes = ctx.reader.read_span(static_cast<std::size_t>(len), "Extension");
    ext.bytes.assign(bytes.begin(), bytes.end());
    node.value = std::move(ext);
    node.raw_subtype = label;
    node.declared_length = len;
}

static void read_array(
    DecodeContext& ctx,
    DecodedNode& node,
    std::uint64_t count,
    const char* label,
    std::size_t depth
) {
    ArrayValue arr{};
    // Every element takes at least one byte, so a forged count cannot reserve
    // more than the buffer could possibly hold.
    arr.children.reserve(static_cast<std::size_t>(
        std::min<std::uint64_t>(count, ctx.reader.remaining())
    ));
    for (std::uint64_t i = 0; i < count; i++) {
        arr.children.push_back(decode_node(ctx, std::nullopt, depth + 1));
    }
    node.value = std::move(arr);
    node.raw_subtype = with_count(label, count);
    node.declared_length = count;
}

static void read_map(
    DecodeContext& ctx,
    DecodedNode& node,
    std::uint64_t count,
    const char* label,
    std::size_t depth
) {
    MapValue map{};
    map.children.reserve(static_cast<std::size_t>(
        std::min<std::uint64_t>(count, ctx.reader.remaining() / 2)
    ));
    for (std::uint64_t i = 0; i < count; i++) {
        DecodedNode key_node = decode_node(ctx, std::nullopt, depth + 1);
        MapKey key = to_map_key(std::move(key_node));
        map.children.push_back(decode_node(ctx, std::move(key), depth + 1));
    }
    node.value = std::move(map);
    node.raw_subtype = with_count(label, count);
    node.declared_length = count;
}

static DecodedNode decode_node(DecodeContext& ctx, std::optional<MapKey> key, std::size_t depth) {
    auto& r = ctx.reader;
    if (depth > ctx.max_depth) {
        throw MsgpackError(
            ErrorKind::NestingTooDeep,
            "Nesting depth " + std::to_string(depth) + " exceeds limit "
                + std::to_string(ctx.max_depth) + " at offset " + std::to_string(r.position())
        );
    }

    const std::size_t offset = r.position();
    const std::uint8_t tag = r.read_u8("Tag");

    DecodedNode node{};
    node.id = ctx.next_id++;
    node.key = std::move(key);

    if (tag <= 0x7F) {
        node.value = IntegerValue::from_unsigned(tag, 0);
        node.raw_subtype = "fixint";
        return node;
    }
    if (tag >= 0xE0) {
        node.value = IntegerValue::from_signed(static_cast<std::int64_t>(tag) - 0x100, 0);
        node.raw_subtype = "fixint";
        return node;
    }
    if (tag <= 0x8F) {
        read_map(ctx, node, tag & 0x0Fu, "map", depth);
        return node;
    }
    if (tag <= 0x9F) {
        read_array(ctx, node, tag & 0x0Fu, "arr", depth);
        return node;
    }
    if (tag <= 0xBF) {
        read_string(ctx, node, tag & 0x1Fu, "str");
        return node;
    }

    switch (tag) {
        case 0xC0:
            node.value = nullptr;
            node.raw_subtype = "nil";
            return node;
        case 0xC2:
            node.value = false;
            node.raw_subtype = "false";
            return node;
        case 0xC3:
            node.value = true;
            node.raw_subtype = "true";
            return node;

        case 0xC4:
            read_binary(ctx, node, r.read_u8("bin8 length"), "bin8");
            return node;
        case 0xC5:
            read_binary(ctx, node, r.read_u16("bin16 length"), "bin16");
            return node;
        case 0xC6:
            read_binary(ctx, node, r.read_u32("bin32 length"), "bin32");
            return node;

        case 0xC7:
            read_extension(ctx, node, r.read_u8("ext8 length"), "ext8");
            return node;
        case 0xC8:
            read_extension(ctx, node, r.read_u16("ext16 length"), "ext16");
            return node;
        case 0xC9:
            read_extension(ctx, node, r.read_u32("ext32 length"), "ext32");
            return node;

        case 0xCA:
            node.value = FloatValue{static_cast<double>(r.read_f32("float 32")), 32};
            node.raw_subtype = "float(32)";
            return node;
        case 0xCB:
            node.value = FloatValue{r.read_f64("float 64"), 64};
            node.raw_subtype = "float(64)";
            return node;

        case 0xCC:
            node.value = IntegerValue::from_unsigned(r.read_u8("uint 8"), 8);
            node.raw_subtype = "uint(8)";
            return node;
        case 0xCD:
            node.value = IntegerValue::from_unsigned(r.read_u16("uint 16"), 16);
            node.raw_subtype = "uint(16)";
            return node;
        case 0xCE:
            node.value = IntegerValue::from_unsigned(r.read_u32("uint 32"), 32);
            node.raw_subtype = "uint(32)";
            return node;
        case 0xCF:
            node.value = IntegerValue::from_unsigned(r.read_u64("uint 64"), 64);
            node.raw_subtype = "uint(64)";
            return node;

        case 0xD0:
            node.value = IntegerValue::from_signed(r.read_i8("int 8"), 8);
            node.raw_subtype = "int(8)";
            return node;
        case 0xD1:
            node.value = IntegerValue::from_signed(
                static_cast<std::int16_t>(r.read_u16("int 16")), 16
            );
            node.raw_subtype = "int(16)";
            return node;
        case 0xD2:
            node.value = IntegerValue::from_signed(
                static_cast<std::int32_t>(r.read_u32("int 32")), 32
            );
            node.raw_subtype = "int(32)";
            return node;
        case 0xD3:
            node.value = IntegerValue::from_signed(
                static_cast<std::int64_t>(r.read_u64("int 64")), 64
            );
            node.raw_subtype = "int(64)";
            return node;

        case 0xD4:
            read_extension(ctx, node, 1, "fixext1");
            return node;
        case 0xD5:
            read_extension(ctx, node, 2, "fixext2");
            return node;
        case 0xD6:
            read_extension(ctx, node, 4, "fixext4");
            return node;
        case 0xD7:
            read_extension(ctx, node, 8, "fixext8");
            return node;
        case 0xD8:
            read_extension(ctx, node, 16, "fixext16");
            return node;

        case 0xD9:
            read_string(ctx, node, r.read_u8("str8 length"), "str8");
            return node;
        case 0xDA:
            read_string(ctx, node, r.read_u16("str16 length"), "str16");
            return node;
        case 0xDB:
            read_string(ctx, node, r.read_u32("str32 length"), "str32");
            return node;

        case 0xDC:
            read_array(ctx, node, r.read_u16("array16 length"), "arr16", depth);
            return node;
        case 0xDD:
            read_array(ctx, node, r.read_u32("array32 length"), "arr32", depth);
            return node;

        case 0xDE:
            read_map(ctx, node, r.read_u16("map16 length"), "map16", depth);
            return node;
        case 0xDF:
            read_map(ctx, node, r.read_u32("map32 length"), "map32", depth);
            return node;

        default:
            break;
    }

    throw MsgpackError(
        ErrorKind::UnknownTag,
        "Unknown byte " + hex_byte(tag) + " at offset " + std::to_string(offset)
    );
}

DecodeResult decode_msgpack(std::span<const std::uint8_t> bytes, const DecodeOptions& options) {
    DecodeContext ctx{ByteReader(bytes), options.max_depth, 0};
    DecodeResult out{};
    out.root = decode_node(ctx, std::nullopt, 0);
    out.consumed = ctx.reader.position();
    out.node_count = ctx.next_id;
    return out;
}

}  // namespace mpk::msgpack
