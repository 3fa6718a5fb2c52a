/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "msgpack_node.h"

#include <cstddef>
#include <string>

namespace mpk::msgpack {

struct TreeTextOptions {
    std::size_t indent = 2;
    std::size_t byte_preview = 8;
    bool show_ids = false;
};

// One line per node: [key: ]Kind <rawSubtype> value
std::string render_tree(const DecodedNode& root, const TreeTextOptions& opt = {});

}  // namespace mpk::msgpack
