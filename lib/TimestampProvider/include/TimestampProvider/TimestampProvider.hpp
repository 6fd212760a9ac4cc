#pragma once

#include <ctime>
#include <string>

/**
 * @brief Infrastructure component providing timestamp strings using C time APIs.
 *
 * Timestamps use the process's local timezone, formatted YYYY-MM-DD-HH:MM:SS.
 */
class TimestampProvider
{
  public:
    /**
     * @brief Get the current local date and time as a timestamp string.
     *
     * @return Timestamp string for the moment of the call
     */
    std::string Now() const;

    /**
     * @brief Format an instant as a local timestamp string.
     *
     * @param[in] time Instant to format
     * @return Timestamp string
     */
    std::string Format(std::time_t time) const;
};
