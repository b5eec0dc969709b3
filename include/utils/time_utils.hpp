#pragma once

#include <string>
#include <chrono>
#include "common/types.hpp"

namespace settle {
namespace time_utils {

/**
 * Epoch milliseconds to ISO 8601 UTC, e.g. "2026-03-01T12:00:00.000Z".
 */
std::string to_iso8601(int64_t epoch_ms);

/**
 * Parse "YYYY-MM-DDTHH:MM:SS[.mmm][Z]" as UTC epoch milliseconds.
 * Throws InvalidRequestError on malformed input.
 */
int64_t from_iso8601(const std::string& s);

/**
 * Format duration for display.
 */
std::string format_duration(Duration d);

/**
 * Exponential backoff: initial * 2^attempt, capped at max. attempt is 0-based.
 */
std::chrono::milliseconds backoff_delay(int attempt, int initial_ms, int max_ms);

} // namespace time_utils
} // namespace settle
