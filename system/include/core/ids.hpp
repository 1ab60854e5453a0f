// ============= include/core/ids.hpp =============
/*
 * Identifier and clock helpers
 *
 * - generate_id(): random UUID-v4 formatted string (8-4-4-4-12 hex)
 * - now_us(): microseconds since epoch, strictly increasing per process
 */

#pragma once
#include <cstdint>
#include <string>

int64_t now_us();

std::string generate_id();

// "2024-05-01T12:00:00.123456Z"
std::string format_timestamp(int64_t micros);
