/**
 * @file timestamp.cpp
 * @brief Implementation of ISO-8601 timestamp helpers
 */

#include "common/timestamp.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace valuation
{

    Timestamp parse_iso8601(const std::string &text)
    {
        std::tm tm = {};
        std::istringstream iss(text);

        if (text.size() > 10)
        {
            iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        }
        else
        {
            iss >> std::get_time(&tm, "%Y-%m-%d");
        }

        if (iss.fail())
        {
            throw ValidationError("Invalid timestamp '" + text + "'. Expected YYYY-MM-DDTHH:MM:SSZ or YYYY-MM-DD");
        }

        // Fractional seconds are dropped
        if (text.size() > 10 && iss.peek() == '.')
        {
            iss.get();
            if (!std::isdigit(iss.peek()))
            {
                throw ValidationError("Invalid fractional seconds in timestamp '" + text + "'");
            }
            while (std::isdigit(iss.peek()))
            {
                iss.get();
            }
        }

        // Only a trailing 'Z' is accepted after the seconds field
        std::string rest;
        iss >> rest;
        if (!rest.empty() && rest != "Z")
        {
            throw ValidationError("Unsupported timezone suffix in timestamp '" + text + "'. Only UTC ('Z') is supported");
        }

        std::time_t seconds = timegm(&tm);
        return std::chrono::system_clock::from_time_t(seconds);
    }

    std::string format_iso8601(Timestamp time)
    {
        std::time_t seconds = std::chrono::system_clock::to_time_t(time);
        std::tm tm = {};
        gmtime_r(&seconds, &tm);

        std::ostringstream oss;
        oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return oss.str();
    }

} // namespace valuation
