#pragma once

#include <string>
#include <chrono>
#include "common/types.hpp"

namespace binbot {
namespace time_utils {

/**
 * Convert timestamp to ISO 8601 string.
 */
std::string to_iso8601(WallClock t);

/**
 * Get current timestamp as ISO 8601.
 */
std::string now_iso8601();

/**
 * Format a millisecond span for display (850ms, 12.5s, 3m07s).
 */
std::string format_duration_ms(int64_t ms);

/**
 * Reconnect delay for a 1-based attempt number: base * 2^(attempt-1),
 * capped at max_ms.
 */
int64_t backoff_delay_ms(int64_t base_ms, int attempt, int64_t max_ms);

/**
 * Milliseconds elapsed since a steady-clock timestamp.
 */
int64_t elapsed_ms(Timestamp since);

} // namespace time_utils
} // namespace binbot
