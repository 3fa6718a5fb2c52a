/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "msgpack/msgpack_error.h"
#include "msgpack/msgpack_format_detect.h"
#include "msgpack/msgpack_node.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mpk {

struct InspectOptions {
    std::size_t max_depth = 512;
    bool debug = false;
};

struct InspectResult {
    bool success = false;
    std::optional<msgpack::DecodedNode> root;
    msgpack::InputFormat resolved_format = msgpack::InputFormat::Auto;
    std::vector<std::uint8_t> original_bytes;
    std::size_t consumed_bytes = 0;
    std::size_t trailing_bytes = 0;
    std::uint64_t node_count = 0;

    std::optional<msgpack::ErrorKind> error_kind;
    std::string error_message;
    // Auto-detect candidates that failed before the format was settled.
    std::vector<std::string> detect_notes;
};

class MsgpackInspector {
   public:
    // Never throws for bad input: every MsgpackError becomes a failure result.
    static InspectResult Inspect(
        std::string_view text,
        msgpack::InputFormat format = msgpack::InputFormat::Auto,
        const InspectOptions& opt = {}
    );

    static nlohmann::ordered_json ToJson(const msgpack::DecodedNode& root);
};

}  // namespace mpk
