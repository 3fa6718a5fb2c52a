/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mpk::msgpack {

// Order matches the alternatives of NodeValue.
enum class NodeKind {
    Null,
    Boolean,
    Integer,
    Float,
    String,
    Binary,
    Array,
    Map,
    Extension,
    Unknown,
};

std::string_view node_kind_name(NodeKind kind);

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

struct DecodedNode;

// Non-negative values are held as uint64, negative ones as int64, so two
// encodings of the same number compare equal regardless of wire width.
struct IntegerValue {
    std::variant<std::int64_t, std::uint64_t> value;
    int wire_bits = 0;  // 0 for fixint

    static IntegerValue from_signed(std::int64_t v, int bits);
    static IntegerValue from_unsigned(std::uint64_t v, int bits);

    bool is_wide() const { return wire_bits == 64; }
    bool is_negative() const { return std::holds_alternative<std::int64_t>(value); }
    std::optional<std::int64_t> as_i64() const;
    std::optional<std::uint64_t> as_u64() const;
    std::string to_string() const;

    bool operator==(const IntegerValue& other) const { return value == other.value; }
};

struct FloatValue {
    double value = 0.0;
    int wire_bits = 64;

    bool operator==(const FloatValue& other) const { return value == other.value; }
};

struct BinaryValue {
    std::vector<std::uint8_t> bytes;
};

struct ExtensionValue {
    std::int8_t type = 0;
    std::vector<std::uint8_t> bytes;
};

struct ArrayValue {
    std::vector<DecodedNode> children;
};

struct MapValue {
    std::vector<DecodedNode> children;
};

struct UnknownValue {};

using NodeValue = std::variant<
    std::nullptr_t,
    bool,
    IntegerValue,
    FloatValue,
    std::string,
    BinaryValue,
    ArrayValue,
    MapValue,
    ExtensionValue,
    UnknownValue>;

static_assert(std::variant_size_v<NodeValue> == static_cast<std::size_t>(NodeKind::Unknown) + 1);

using PrimitiveKey = std::variant<std::nullptr_t, bool, IntegerValue, FloatValue, std::string>;
using NodeKey = std::shared_ptr<const DecodedNode>;

// Key of a map entry. Primitive keys are unwrapped to their value, every other
// key kind keeps the whole decoded key node.
struct MapKey {
    std::variant<PrimitiveKey, NodeKey> value;

    bool is_node() const { return std::holds_alternative<NodeKey>(value); }
    const PrimitiveKey* primitive() const { return std::get_if<PrimitiveKey>(&value); }
    const DecodedNode* node() const;
    const std::string* as_string() const;
};

struct DecodedNode {
    std::uint64_t id = 0;
    NodeValue value;
    std::string raw_subtype;
    std::optional<std::uint64_t> declared_length;
    std::optional<MapKey> key;

    NodeKind kind() const { return static_cast<NodeKind>(value.index()); }

    template <class T>
    const T* get() const {
        return std::get_if<T>(&value);
    }

    // Arrays and maps only; nullptr for every other kind.
    const std::vector<DecodedNode>* children() const;
    std::optional<std::int8_t> extension_tag() const;
};

// Shortest round-trip text for a double; integral values carry no fraction and
// non-finite values read NaN / Infinity / -Infinity.
std::string format_double(double v);

}  // namespace mpk::msgpack
