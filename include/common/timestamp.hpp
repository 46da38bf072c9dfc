/**
 * @file timestamp.hpp
 * @brief ISO-8601 (UTC) conversion helpers for report and bundle timestamps
 */

#pragma once

#include <chrono>
#include <string>

namespace valuation
{
    using Timestamp = std::chrono::system_clock::time_point;

    /**
     * @brief Parse "YYYY-MM-DDTHH:MM:SS[.fff][Z]" or "YYYY-MM-DD" as UTC
     *
     * Fractional seconds are truncated.
     * @param text Timestamp string
     * @return Parsed time point
     * @throws ValidationError if the string is not in a supported format
     */
    Timestamp parse_iso8601(const std::string &text);

    /**
     * @brief Format a time point as "YYYY-MM-DDTHH:MM:SSZ"
     */
    std::string format_iso8601(Timestamp time);

} // namespace valuation
