/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "msgpack_node.h"

#include <string>

#include <nlohmann/json.hpp>

namespace mpk::msgpack {

// Lossy, display-only projection of a decoded tree:
//   map        -> object, keys stringified, later duplicates overwrite
//   binary     -> base64 string
//   extension  -> {"__ext_type": tag, "data": base64}
//   64-bit int -> decimal string
nlohmann::ordered_json project_node(const DecodedNode& node);

std::string map_key_to_string(const MapKey& key);

}  // namespace mpk::msgpack
