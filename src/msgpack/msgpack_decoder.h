/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "msgpack_node.h"

#include <cstddef>
#include <cstdint>
#include <span>

namespace mpk::msgpack {

struct DecodeOptions {
    // Containers (and map keys) nested deeper than this fail with NestingTooDeep.
    std::size_t max_depth = 512;
};

struct DecodeResult {
    DecodedNode root;
    std::size_t consumed = 0;
    std::uint64_t node_count = 0;
};

// Decodes the first MessagePack value in bytes. Throws MsgpackError
// (UnknownTag, UnexpectedEnd, NestingTooDeep) on the first problem found.
// Bytes after the first value are left unread and reported through consumed.
DecodeResult decode_msgpack(std::span<const std::uint8_t> bytes, const DecodeOptions& options = {});

}  // namespace mpk::msgpack
