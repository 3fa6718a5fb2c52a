/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
// test_decoder.cpp – MessagePack tree decoding from fixed byte fixtures.

#include "msgpack/msgpack_decoder.h"
#include "msgpack/msgpack_error.h"

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

using namespace mpk::msgpack;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

using Bytes = std::vector<std::uint8_t>;

static void hexdump(const Bytes& v, const std::string& label) {
    std::cout << label << " [" << v.size() << "B]: ";
    for (std::uint8_t b : v)
        std::cout << std::hex << std::setw(2) << std::setfill('0') << (int)b << ' ';
    std::cout << std::dec << '\n';
}

static DecodedNode decode_root(const Bytes& b, const DecodeOptions& opt = {}) {
    return decode_msgpack(b, opt).root;
}

// Decodes b and returns the error kind and message it failed with.
static bool fails_with(const Bytes& b, ErrorKind kind, std::string* message = nullptr,
                       const DecodeOptions& opt = {}) {
    try {
        (void)decode_msgpack(b, opt);
    } catch (const MsgpackError& e) {
        if (message) *message = e.what();
        return e.kind() == kind;
    }
    return false;
}

static const IntegerValue* int_of(const DecodedNode& n) { return n.get<IntegerValue>(); }

// ─────────────────────────────────────────────────────────────────────────────
//  Scalars
// ─────────────────────────────────────────────────────────────────────────────
static void testScalars() {
    std::cout << "\n=== Test: Scalars ===\n";

    auto n = decode_root({0xc0});
    CHECK(n.kind() == NodeKind::Null && n.raw_subtype == "nil", "nil");
    n = decode_root({0xc2});
    CHECK(n.kind() == NodeKind::Boolean && *n.get<bool>() == false && n.raw_subtype == "false", "false");
    n = decode_root({0xc3});
    CHECK(n.kind() == NodeKind::Boolean && *n.get<bool>() == true && n.raw_subtype == "true", "true");

    n = decode_root({0xca, 0x3f, 0xc0, 0x00, 0x00});
    CHECK(n.kind() == NodeKind::Float && n.get<FloatValue>()->value == 1.5, "float32 1.5");
    CHECK(n.get<FloatValue>()->wire_bits == 32 && n.raw_subtype == "float(32)", "float32 width");
    n = decode_root({0xcb, 0x3f, 0xf8, 0, 0, 0, 0, 0, 0});
    CHECK(n.kind() == NodeKind::Float && n.get<FloatValue>()->value == 1.5, "float64 1.5");
    CHECK(n.raw_subtype == "float(64)", "float64 label");
    CHECK(!n.declared_length.has_value() && n.children() == nullptr, "scalar has no length/children");
}

static void testIntegers() {
    std::cout << "\n=== Test: Integers ===\n";

    auto n = decode_root({0x05});
    CHECK(n.kind() == NodeKind::Integer && int_of(n)->as_u64() == 5u, "positive fixint 5");
    CHECK(n.raw_subtype == "fixint", "fixint label");
    n = decode_root({0xff});
    CHECK(int_of(n)->as_i64() == -1, "negative fixint 0xff = -1");
    n = decode_root({0xe0});
    CHECK(int_of(n)->as_i64() == -32, "negative fixint 0xe0 = -32");

    n = decode_root({0xcc, 0xff});
    CHECK(int_of(n)->as_u64() == 255u && n.raw_subtype == "uint(8)", "uint8 255");
    n = decode_root({0xcd, 0x01, 0x00});
    CHECK(int_of(n)->as_u64() == 256u && n.raw_subtype == "uint(16)", "uint16 256");
    n = decode_root({0xce, 0xff, 0xff, 0xff, 0xff});
    CHECK(int_of(n)->as_u64() == 4294967295u && n.raw_subtype == "uint(32)", "uint32 max");

    n = decode_root({0xcf, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
    CHECK(int_of(n)->as_u64() == 4294967296ull, "uint64 4294967296 exact");
    CHECK(int_of(n)->is_wide() && n.raw_subtype == "uint(64)", "uint64 is wide");
    n = decode_root({0xcf, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff});
    CHECK(int_of(n)->as_u64() == std::numeric_limits<std::uint64_t>::max(), "uint64 max");
    CHECK(int_of(n)->to_string() == "18446744073709551615", "uint64 max text");
    CHECK(!int_of(n)->as_i64().has_value(), "uint64 max does not fit int64");

    n = decode_root({0xd0, 0x80});
    CHECK(int_of(n)->as_i64() == -128 && n.raw_subtype == "int(8)", "int8 -128");
    n = decode_root({0xd1, 0xff, 0x38});
    CHECK(int_of(n)->as_i64() == -200 && n.raw_subtype == "int(16)", "int16 -200");
    n = decode_root({0xd2, 0xff, 0xff, 0xff, 0xff});
    CHECK(int_of(n)->as_i64() == -1 && n.raw_subtype == "int(32)", "int32 -1");
    n = decode_root({0xd3, 0x80, 0, 0, 0, 0, 0, 0, 0});
    CHECK(int_of(n)->as_i64() == std::numeric_limits<std::int64_t>::min(), "int64 min");
    CHECK(int_of(n)->to_string() == "-9223372036854775808", "int64 min text");
    n = decode_root({0xd3, 0, 0, 0, 0, 0, 0, 0, 0x07});
    CHECK(int_of(n)->as_u64() == 7u && !int_of(n)->is_negative(), "int64 7 is non-negative");

    const auto a = decode_root({0x05});
    const auto b = decode_root({0xcc, 0x05});
    CHECK(*int_of(a) == *int_of(b), "fixint 5 == uint8 5 by value");
    CHECK(a.raw_subtype != b.raw_subtype && int_of(a)->wire_bits != int_of(b)->wire_bits,
          "widths stay distinguishable");
}

static void testStringsAndBinary() {
    std::cout << "\n=== Test: Strings / binary / extensions ===\n";

    auto n = decode_root({0xa3, 'f', 'o', 'o'});
    CHECK(n.kind() == NodeKind::String && *n.get<std::string>() == "foo", "fixstr foo");
    CHECK(n.raw_subtype == "str(3)" && n.declared_length == 3u, "fixstr label/length");
    n = decode_root({0xa0});
    CHECK(n.get<std::string>()->empty() && n.raw_subtype == "str(0)", "empty fixstr");
    n = decode_root({0xd9, 0x03, 'a', 'b', 'c'});
    CHECK(*n.get<std::string>() == "abc" && n.raw_subtype == "str8(3)", "str8");
    n = decode_root({0xda, 0x00, 0x01, 'z'});
    CHECK(*n.get<std::string>() == "z" && n.raw_subtype == "str16(1)", "str16");
    n = decode_root({0xdb, 0x00, 0x00, 0x00, 0x01, 'y'});
    CHECK(*n.get<std::string>() == "y" && n.raw_subtype == "str32(1)", "str32");

    n = decode_root({0xa2, 0xc3, 0xa9});
    CHECK(*n.get<std::string>() == "\xc3\xa9", "valid UTF-8 kept");
    n = decode_root({0xa3, 'a', 0xff, 'b'});
    CHECK(*n.get<std::string>() == "a\xEF\xBF\xBD" "b", "invalid byte replaced");
    n = decode_root({0xa2, 0xe2, 0x82});
    CHECK(*n.get<std::string>() == "\xEF\xBF\xBD", "truncated sequence -> one replacement");
    n = decode_root({0xa2, 0xed, 0xa0});
    CHECK(*n.get<std::string>() == "\xEF\xBF\xBD\xEF\xBF\xBD", "surrogate half -> two replacements");
    n = decode_root({0xa5, 0xef, 0xbb, 0xbf, 'h', 'i'});
    CHECK(*n.get<std::string>() == "hi" && n.declared_length == 5u, "leading BOM dropped");
    n = decode_root({0xa4, 'a', 0xef, 0xbb, 0xbf});
    CHECK(*n.get<std::string>() == "a\xEF\xBB\xBF", "inner BOM kept");

    n = decode_root({0xc4, 0x02, 0x01, 0x02});
    CHECK(n.kind() == NodeKind::Binary && n.get<BinaryValue>()->bytes == (Bytes{1, 2}), "bin8");
    CHECK(n.raw_subtype == "bin8(2)" && n.declared_length == 2u, "bin8 label");
    n = decode_root({0xc5, 0x00, 0x01, 0x09});
    CHECK(n.get<BinaryValue>()->bytes == (Bytes{9}) && n.raw_subtype == "bin16(1)", "bin16");
    n = decode_root({0xc6, 0x00, 0x00, 0x00, 0x00});
    CHECK(n.get<BinaryValue>()->bytes.empty() && n.raw_subtype == "bin32(0)", "empty bin32");

    n = decode_root({0xd6, 0xff, 0x00, 0x00, 0x00, 0x01});
    CHECK(n.kind() == NodeKind::Extension && n.extension_tag() == std::int8_t{-1}, "fixext4 tag -1");
    CHECK(n.get<ExtensionValue>()->bytes == (Bytes{0, 0, 0, 1}) && n.raw_subtype == "fixext4",
          "fixext4 payload");
    n = decode_root({0xd4, 0x01, 0xaa});
    CHECK(n.extension_tag() == std::int8_t{1} && n.raw_subtype == "fixext1", "fixext1");
    n = decode_root({0xc7, 0x03, 0x05, 0xaa, 0xbb, 0xcc});
    CHECK(n.extension_tag() == std::int8_t{5} && n.declared_length == 3u, "ext8 tag/length");
    CHECK(n.get<ExtensionValue>()->bytes == (Bytes{0xaa, 0xbb, 0xcc}) && n.raw_subtype == "ext8",
          "ext8 payload");
    CHECK(!decode_root({0x01}).extension_tag().has_value(), "non-extension has no tag");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Containers
// ─────────────────────────────────────────────────────────────────────────────
static void testFixMap() {
    std::cout << "\n=== Test: fixmap {\"key\": \"value\"} ===\n";
    const Bytes b = {0x81, 0xa3, 'k', 'e', 'y', 0xa5, 'v', 'a', 'l', 'u', 'e'};
    hexdump(b, "input");
    const auto res = decode_msgpack(b);
    const auto& root = res.root;

    CHECK(root.kind() == NodeKind::Map, "root is Map");
    CHECK(root.raw_subtype == "map(1)" && root.declared_length == 1u, "map(1)");
    CHECK(root.children() && root.children()->size() == 1, "one child");
    if (!root.children() || root.children()->empty()) return;

    const auto& child = root.children()->front();
    CHECK(child.kind() == NodeKind::String && *child.get<std::string>() == "value", "value node");
    CHECK(child.key && child.key->as_string() && *child.key->as_string() == "key",
          "associated key = \"key\"");
    CHECK(!root.key.has_value(), "root has no key");
    CHECK(res.consumed == b.size(), "all bytes consumed");
}

static void testArrays() {
    std::cout << "\n=== Test: Arrays ===\n";
    auto n = decode_root({0x93, 0x01, 0xa1, 'x', 0xc0});
    CHECK(n.kind() == NodeKind::Array && n.raw_subtype == "arr(3)", "fixarray(3)");
    CHECK(n.children()->size() == 3, "three children");
    CHECK(n.children()->at(0).kind() == NodeKind::Integer
              && n.children()->at(1).kind() == NodeKind::String
              && n.children()->at(2).kind() == NodeKind::Null,
          "children in wire order");
    CHECK(!n.children()->at(0).key.has_value(), "array children carry no key");

    n = decode_root({0xdc, 0x00, 0x02, 0x01, 0x02});
    CHECK(n.raw_subtype == "arr16(2)" && n.declared_length == 2u && n.children()->size() == 2,
          "array16");
    n = decode_root({0xdd, 0x00, 0x00, 0x00, 0x00});
    CHECK(n.raw_subtype == "arr32(0)" && n.children()->empty(), "empty array32");
    n = decode_root({0x90});
    CHECK(n.kind() == NodeKind::Array && n.children()->empty(), "empty fixarray");
}

static void testMaps() {
    std::cout << "\n=== Test: Maps ===\n";

    auto n = decode_root({0xde, 0x00, 0x01, 0xa1, 'a', 0xc0});
    CHECK(n.raw_subtype == "map16(1)" && n.children()->size() == 1, "map16");

    n = decode_root({0x81, 0x07, 0xc3});
    const auto* key = n.children()->at(0).key ? n.children()->at(0).key->primitive() : nullptr;
    CHECK(key && std::holds_alternative<IntegerValue>(*key)
              && std::get<IntegerValue>(*key).as_u64() == 7u,
          "integer key unwrapped");

    n = decode_root({0x81, 0xc0, 0x01});
    key = n.children()->at(0).key->primitive();
    CHECK(key && std::holds_alternative<std::nullptr_t>(*key), "nil key unwrapped");

    n = decode_root({0x81, 0xc3, 0x01});
    key = n.children()->at(0).key->primitive();
    CHECK(key && std::get<bool>(*key) == true, "bool key unwrapped");

    n = decode_root({0x81, 0x92, 0x01, 0x02, 0xa1, 'x'});
    const auto& k = *n.children()->at(0).key;
    CHECK(k.is_node() && k.node()->kind() == NodeKind::Array, "array key kept as node");
    CHECK(k.node()->children()->size() == 2, "array key keeps its children");
    CHECK(*n.children()->at(0).get<std::string>() == "x", "value after array key");

    n = decode_root({0x81, 0xc4, 0x01, 0xaa, 0x01});
    CHECK(n.children()->at(0).key->is_node()
              && n.children()->at(0).key->node()->kind() == NodeKind::Binary,
          "binary key kept as node");

    n = decode_root({0x82, 0xa1, 'a', 0x01, 0xa1, 'a', 0x02});
    CHECK(n.children()->size() == 2, "duplicate keys both preserved");
    CHECK(int_of(n.children()->at(0))->as_u64() == 1u && int_of(n.children()->at(1))->as_u64() == 2u,
          "duplicates kept in arrival order");

    n = decode_root({0x82, 0xa1, 'b', 0x01, 0xa1, 'a', 0x02});
    CHECK(*n.children()->at(0).key->as_string() == "b" && *n.children()->at(1).key->as_string() == "a",
          "map entries are not resorted");
}

static void testIdentities() {
    std::cout << "\n=== Test: Node identities ===\n";
    const auto res = decode_msgpack(Bytes{0x92, 0x01, 0x91, 0x02});
    const auto& root = res.root;
    CHECK(root.id == 0, "root id 0");
    CHECK(root.children()->at(0).id == 1, "first child id 1");
    CHECK(root.children()->at(1).id == 2, "second child id 2");
    CHECK(root.children()->at(1).children()->at(0).id == 3, "grandchild id 3");
    CHECK(res.node_count == 4, "node count 4");

    const auto again = decode_msgpack(Bytes{0x01});
    CHECK(again.root.id == 0, "counter restarts per decode call");

    const auto keyed = decode_msgpack(Bytes{0x81, 0xa1, 'k', 0x01});
    CHECK(keyed.root.children()->at(0).id == 2, "key node consumes an id before its value");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Failures
// ─────────────────────────────────────────────────────────────────────────────
static void testErrors() {
    std::cout << "\n=== Test: Errors ===\n";
    std::string msg;

    CHECK(fails_with({0xa5, 'a', 'b', 'c'}, ErrorKind::UnexpectedEnd, &msg), "fixstr(5) with 3 bytes");
    CHECK(msg.find("String") != std::string::npos, "message names the element: " + msg);

    CHECK(fails_with({0xcd, 0x01}, ErrorKind::UnexpectedEnd), "truncated uint16");
    CHECK(fails_with({0xc4}, ErrorKind::UnexpectedEnd), "missing bin8 length");
    CHECK(fails_with({0xd6, 0x01, 0x00}, ErrorKind::UnexpectedEnd), "truncated fixext4");
    CHECK(fails_with({0xd4}, ErrorKind::UnexpectedEnd), "missing extension type");
    CHECK(fails_with({0x92, 0x01}, ErrorKind::UnexpectedEnd), "array missing an element");
    CHECK(fails_with({0x81, 0xa1, 'k'}, ErrorKind::UnexpectedEnd), "map missing a value");
    CHECK(fails_with({}, ErrorKind::UnexpectedEnd), "empty buffer");

    CHECK(fails_with({0xdd, 0xff, 0xff, 0xff, 0xff}, ErrorKind::UnexpectedEnd),
          "forged array32 count fails without allocating");
    CHECK(fails_with({0xdf, 0xff, 0xff, 0xff, 0xff}, ErrorKind::UnexpectedEnd),
          "forged map32 count fails without allocating");
    CHECK(fails_with({0xc6, 0xff, 0xff, 0xff, 0xff, 0x00}, ErrorKind::UnexpectedEnd),
          "forged bin32 length");

    CHECK(fails_with({0xc1}, ErrorKind::UnknownTag, &msg), "0xc1 -> UnknownTag");
    CHECK(msg.find("0xc1") != std::string::npos && msg.find("offset 0") != std::string::npos,
          "message names byte and offset 0: " + msg);
    CHECK(fails_with({0x91, 0xc1}, ErrorKind::UnknownTag, &msg), "nested 0xc1");
    CHECK(msg.find("offset 1") != std::string::npos, "nested offset 1: " + msg);
}

static void testDepthAndTrailing() {
    std::cout << "\n=== Test: Nesting limit / trailing bytes ===\n";
    DecodeOptions opt{};
    opt.max_depth = 2;
    CHECK(fails_with({0x91, 0x91, 0x91, 0x01}, ErrorKind::NestingTooDeep, nullptr, opt),
          "depth 3 over limit 2");
    opt.max_depth = 3;
    CHECK(decode_root({0x91, 0x91, 0x91, 0x01}, opt).kind() == NodeKind::Array, "depth 3 within limit 3");

    opt.max_depth = 1;
    CHECK(fails_with({0x81, 0x91, 0x91, 0x01, 0x01}, ErrorKind::NestingTooDeep, nullptr, opt),
          "nested map key counts toward the limit");

    Bytes deep(100000, 0x91);
    deep.push_back(0x01);
    CHECK(fails_with(deep, ErrorKind::NestingTooDeep), "default limit stops 100000 levels");

    const auto res = decode_msgpack(Bytes{0x01, 0x02, 0x03});
    CHECK(res.consumed == 1, "only the first value is consumed");
}

int main() {
    testScalars();
    testIntegers();
    testStringsAndBinary();
    testFixMap();
    testArrays();
    testMaps();
    testIdentities();
    testErrors();
    testDepthAndTrailing();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
