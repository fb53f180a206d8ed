#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

class TimeUtils
{
public:
    /**
     * @brief UTC timestamp such as 2024-05-01T12:30:45.123Z
     */
    static std::string toIso8601(std::chrono::system_clock::time_point time)
    {
        auto time_t_value = std::chrono::system_clock::to_time_t(time);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      time.time_since_epoch()) %
                  1000;

        std::tm utc{};
        gmtime_r(&time_t_value, &utc);

        std::stringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return ss.str();
    }

    static std::string nowIso8601()
    {
        return toIso8601(std::chrono::system_clock::now());
    }
};
