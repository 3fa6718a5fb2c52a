/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgpack_projector.h"
#include "msgpack_text_input.h"

namespace mpk::msgpack {

static nlohmann::ordered_json project_integer(const IntegerValue& v) {
    if (v.is_wide()) {
        return v.to_string();
    }
    if (const auto s = v.as_i64()) {
        return *s;
    }
    return *v.as_u64();
}

static std::string primitive_key_to_string(const PrimitiveKey& key) {
    return std::visit(
        Overloaded{
            [](std::nullptr_t) -> std::string { return "null"; },
            [](bool b) -> std::string { return b ? "true" : "false"; },
            [](const IntegerValue& v) -> std::string { return v.to_string(); },
            [](const FloatValue& v) -> std::string { return format_double(v.value); },
            [](const std::string& s) -> std::string { return s; },
        },
        key
    );
}

std::string map_key_to_string(const MapKey& key) {
    if (const auto* node = key.node()) {
        return project_node(*node).dump();
    }
    return primitive_key_to_string(*key.primitive());
}

nlohmann::ordered_json project_node(const DecodedNode& node) {
    return std::visit(
        Overloaded{
            [](std::nullptr_t) -> nlohmann::ordered_json { return nullptr; },
            [](bool b) -> nlohmann::ordered_json { return b; },
            [](const IntegerValue& v) -> nlohmann::ordered_json { return project_integer(v); },
            [](const FloatValue& v) -> nlohmann::ordered_json { return v.value; },
            [](const std::string& s) -> nlohmann::ordered_json { return s; },
            [](const BinaryValue& v) -> nlohmann::ordered_json {
                return bytes_to_base64(v.bytes);
            },
            [](const ArrayValue& v) -> nlohmann::ordered_json {
                auto out = nlohmann::ordered_json::array();
                for (const auto& child : v.children) {
                    out.push_back(project_node(child));
                }
                return out;
            },
            [](const MapValue& v) -> nlohmann::ordered_json {
                auto out = nlohmann::ordered_json::object();
                for (const auto& child : v.children) {
                    const std::string key = child.key ? map_key_to_string(*child.key) : "undefined";
                    out[key] = project_node(child);
                }
                return out;
            },
            [](const ExtensionValue& v) -> nlohmann::ordered_json {
                nlohmann::ordered_json out = nlohmann::ordered_json::object();
                out["__ext_type"] = static_cast<int>(v.type);
                out["data"] = bytes_to_base64(v.bytes);
                return out;
            },
            [](const UnknownValue&) -> nlohmann::ordered_json { return nullptr; },
        },
        node.value
    );
}

}  // namespace mpk::msgpack
