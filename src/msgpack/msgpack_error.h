/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace mpk::msgpack {

enum class ErrorKind {
    EmptyInput,
    MalformedInput,
    FormatUndetected,
    UnknownTag,
    UnexpectedEnd,
    NestingTooDeep,
};

std::string_view error_kind_name(ErrorKind kind);

class MsgpackError : public std::runtime_error {
   public:
    MsgpackError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), _kind(kind) {}

    ErrorKind kind() const { return _kind; }

   private:
    ErrorKind _kind;
};

}  // namespace mpk::msgpack
