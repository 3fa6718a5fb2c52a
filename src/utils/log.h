/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdarg>

namespace mpk::log {
void info(const char* fmt, ...);
void error(const char* fmt, ...);
void debug(bool enabled, const char* fmt, ...);
}  // namespace mpk::log

#define MPK_LOG_INFO(fmt, ...) ::mpk::log::info(fmt, ##__VA_ARGS__)
#define MPK_LOG_ERROR(fmt, ...) ::mpk::log::error(fmt, ##__VA_ARGS__)
#define MPK_LOG_DEBUG(enabled, fmt, ...) ::mpk::log::debug(enabled, fmt, ##__VA_ARGS__)
