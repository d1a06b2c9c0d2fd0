/**
 * @file log.h
 * @brief Internal logging helpers
 *
 * DO NOT include this file directly from applications. Use vaulthunter.h instead.
 */

#pragma once

#include "../include/vaulthunter.h"

#include <string>

namespace vaulthunter {

/**
 * @brief Write one log line to stderr if debug mode is on and level passes the filter
 */
void debug_log(LogLevel level, const std::string& category, const std::string& message);

} // namespace vaulthunter

// Convenience macros for logging
#define LOG_ERROR(cat, msg) ::vaulthunter::debug_log(::vaulthunter::LogLevel::Error, cat, msg)
#define LOG_WARN(cat, msg) ::vaulthunter::debug_log(::vaulthunter::LogLevel::Warning, cat, msg)
#define LOG_INFO(cat, msg) ::vaulthunter::debug_log(::vaulthunter::LogLevel::Info, cat, msg)
#define LOG_DEBUG(cat, msg) ::vaulthunter::debug_log(::vaulthunter::LogLevel::Debug, cat, msg)
