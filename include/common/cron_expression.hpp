#pragma once

#include <bitset>
#include <chrono>
#include <optional>
#include <string>

// Timezone a cron expression is evaluated in. Only UTC, the process-local
// zone and fixed offsets are supported.
struct CronTimezone {
    std::string name{"UTC"};
    bool local{false};
    int offsetMinutes{0};

    // Accepts "UTC", "GMT", "Etc/UTC", "local", "UTC+05:30", "+0530", "-08:00", "UTC-8".
    static std::optional<CronTimezone> parse(const std::string& text);
    static CronTimezone utc() { return CronTimezone{}; }
};

// Standard five-field cron expression (minute hour day-of-month month
// day-of-week), an optional leading seconds field, or one of the @daily
// style macros. When both day fields are restricted a day matches if
// either matches.
class CronExpression {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    // Throws BackupError(InvalidConfig) on a malformed expression.
    static CronExpression parse(const std::string& expression);
    static bool isValid(const std::string& expression);

    // First fire time strictly after `after`, or nullopt if none exists
    // within the next five years (e.g. "0 0 30 2 *").
    std::optional<TimePoint> next(TimePoint after,
                                  const CronTimezone& tz = CronTimezone::utc()) const;

    const std::string& expression() const { return expression_; }

private:
    CronExpression() = default;
    bool dayMatches(int dayOfMonth, int dayOfWeek) const;

    std::string expression_;
    std::bitset<60> seconds_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> daysOfMonth_;
    std::bitset<13> months_;
    std::bitset<7> daysOfWeek_;
    bool domRestricted_{false};
    bool dowRestricted_{false};
};
