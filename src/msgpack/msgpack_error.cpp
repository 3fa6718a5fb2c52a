/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "msgpack_error.h"

namespace mpk::msgpack {
std::string_view error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::EmptyInput:
            return "EmptyInput";
        case ErrorKind::MalformedInput:
            return "MalformedInput";
        case ErrorKind::FormatUndetected:
            return "FormatUndetected";
        case ErrorKind::UnknownTag:
            return "UnknownTag";
        case ErrorKind::UnexpectedEnd:
            return "UnexpectedEnd";
        case ErrorKind::NestingTooDeep:
            return "NestingTooDeep";
    }
    return "Unknown";
}
}  // namespace mpk::msgpack
