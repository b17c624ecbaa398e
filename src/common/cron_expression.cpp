#include "common/cron_expression.hpp"
#include "common/backup_error.hpp"
#include "common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <map>
#include <sstream>
#include <vector>

namespace {

const std::map<std::string, std::string> kMacros = {
    {"@yearly", "0 0 1 1 *"},
    {"@annually", "0 0 1 1 *"},
    {"@monthly", "0 0 1 * *"},
    {"@weekly", "0 0 * * 0"},
    {"@daily", "0 0 * * *"},
    {"@midnight", "0 0 * * *"},
    {"@hourly", "0 * * * *"},
};

const std::vector<std::string> kMonthNames = {
    "jan", "feb", "mar", "apr", "may", "jun", "jul", "aug", "sep", "oct", "nov", "dec"};
const std::vector<std::string> kDayNames = {"sun", "mon", "tue", "wed", "thu", "fri", "sat"};

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

[[noreturn]] void invalid(const std::string& expression, const std::string& reason) {
    throw BackupError(BackupErrorCode::InvalidConfig,
                      "Invalid cron expression '" + expression + "': " + reason);
}

int parseValue(const std::string& token, const std::vector<std::string>& names, int nameBase,
               const std::string& expression) {
    std::string lowered = lower(token);
    for (size_t i = 0; i < names.size(); ++i) {
        if (lowered == names[i]) {
            return static_cast<int>(i) + nameBase;
        }
    }
    if (token.empty() || !std::all_of(token.begin(), token.end(), ::isdigit)) {
        invalid(expression, "bad value '" + token + "'");
    }
    return std::stoi(token);
}

// Parses one field into the bits [min, max]. Returns true if the field
// starts with '*'.
template <size_t N>
bool parseField(const std::string& field, int min, int max, std::bitset<N>& bits,
                const std::vector<std::string>& names, int nameBase,
                const std::string& expression) {
    bits.reset();
    for (const auto& part : utils::split(field, ',')) {
        if (part.empty()) {
            invalid(expression, "empty list element");
        }

        std::string range = part;
        int step = 1;
        auto slash = part.find('/');
        if (slash != std::string::npos) {
            range = part.substr(0, slash);
            std::string stepText = part.substr(slash + 1);
            if (stepText.empty() || !std::all_of(stepText.begin(), stepText.end(), ::isdigit)) {
                invalid(expression, "bad step '" + stepText + "'");
            }
            step = std::stoi(stepText);
            if (step <= 0) {
                invalid(expression, "step must be positive");
            }
        }

        int low = min;
        int high = max;
        if (range != "*") {
            auto dash = range.find('-');
            if (dash != std::string::npos) {
                low = parseValue(range.substr(0, dash), names, nameBase, expression);
                high = parseValue(range.substr(dash + 1), names, nameBase, expression);
            } else {
                low = parseValue(range, names, nameBase, expression);
                high = slash != std::string::npos ? max : low;
            }
        }

        if (low < min || high > max || low > high) {
            invalid(expression, "value out of range in '" + part + "'");
        }
        for (int v = low; v <= high; v += step) {
            bits.set(static_cast<size_t>(v));
        }
    }
    return !field.empty() && field[0] == '*';
}

} // namespace

std::optional<CronTimezone> CronTimezone::parse(const std::string& text) {
    std::string value = utils::trim(text);
    std::string lowered = lower(value);

    CronTimezone tz;
    tz.name = value;
    if (lowered.empty() || lowered == "utc" || lowered == "gmt" || lowered == "z" ||
        lowered == "etc/utc" || lowered == "etc/gmt") {
        tz.name = "UTC";
        return tz;
    }
    if (lowered == "local") {
        tz.local = true;
        return tz;
    }

    std::string offset = value;
    if (lowered.rfind("utc", 0) == 0 || lowered.rfind("gmt", 0) == 0) {
        offset = value.substr(3);
    }
    if (offset.size() < 2 || (offset[0] != '+' && offset[0] != '-')) {
        return std::nullopt;
    }

    int sign = offset[0] == '-' ? -1 : 1;
    std::string digits;
    for (size_t i = 1; i < offset.size(); ++i) {
        if (offset[i] == ':') {
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(offset[i]))) {
            return std::nullopt;
        }
        digits.push_back(offset[i]);
    }

    int hours = 0;
    int minutes = 0;
    if (digits.size() <= 2) {
        hours = std::stoi(digits);
    } else if (digits.size() == 4) {
        hours = std::stoi(digits.substr(0, 2));
        minutes = std::stoi(digits.substr(2, 2));
    } else {
        return std::nullopt;
    }
    if (hours > 14 || minutes > 59) {
        return std::nullopt;
    }
    tz.offsetMinutes = sign * (hours * 60 + minutes);
    return tz;
}

CronExpression CronExpression::parse(const std::string& expression) {
    std::string text = utils::trim(expression);
    auto macro = kMacros.find(lower(text));
    if (macro != kMacros.end()) {
        text = macro->second;
    }

    std::vector<std::string> fields;
    std::istringstream ss(text);
    std::string field;
    while (ss >> field) {
        fields.push_back(field);
    }
    if (fields.size() == 5) {
        fields.insert(fields.begin(), "0");
    } else if (fields.size() != 6) {
        invalid(expression, "expected 5 or 6 fields");
    }

    CronExpression cron;
    cron.expression_ = utils::trim(expression);
    parseField(fields[0], 0, 59, cron.seconds_, {}, 0, expression);
    parseField(fields[1], 0, 59, cron.minutes_, {}, 0, expression);
    parseField(fields[2], 0, 23, cron.hours_, {}, 0, expression);
    cron.domRestricted_ = !parseField(fields[3], 1, 31, cron.daysOfMonth_, {}, 0, expression);
    parseField(fields[4], 1, 12, cron.months_, kMonthNames, 1, expression);

    // Day of week accepts 0-7 with both 0 and 7 meaning Sunday
    std::bitset<8> dow;
    cron.dowRestricted_ = !parseField(fields[5], 0, 7, dow, kDayNames, 0, expression);
    for (size_t i = 0; i < 7; ++i) {
        cron.daysOfWeek_[i] = dow[i];
    }
    if (dow[7]) {
        cron.daysOfWeek_.set(0);
    }
    return cron;
}

bool CronExpression::isValid(const std::string& expression) {
    try {
        parse(expression);
        return true;
    } catch (const BackupError&) {
        return false;
    }
}

bool CronExpression::dayMatches(int dayOfMonth, int dayOfWeek) const {
    bool dom = daysOfMonth_[static_cast<size_t>(dayOfMonth)];
    bool dow = daysOfWeek_[static_cast<size_t>(dayOfWeek)];
    if (domRestricted_ && dowRestricted_) {
        return dom || dow;
    }
    if (domRestricted_) {
        return dom;
    }
    if (dowRestricted_) {
        return dow;
    }
    return true;
}

std::optional<CronExpression::TimePoint> CronExpression::next(TimePoint after,
                                                              const CronTimezone& tz) const {
    std::time_t start = std::chrono::system_clock::to_time_t(after) + 1;
    const std::time_t offset = static_cast<std::time_t>(tz.offsetMinutes) * 60;

    // Wall-clock broken-down time in the target zone
    auto toWall = [&](std::time_t t) {
        std::tm tm{};
        if (tz.local) {
            localtime_r(&t, &tm);
        } else {
            std::time_t shifted = t + offset;
            gmtime_r(&shifted, &tm);
        }
        return tm;
    };
    auto fromWall = [&](std::tm tm) {
        if (tz.local) {
            tm.tm_isdst = -1;
            return std::mktime(&tm);
        }
        return timegm(&tm) - offset;
    };
    auto normalize = [&](std::tm& tm) { tm = toWall(fromWall(tm)); };

    std::tm tm = toWall(start);
    const int horizonYear = tm.tm_year + 5;

    while (tm.tm_year <= horizonYear) {
        if (!months_[static_cast<size_t>(tm.tm_mon + 1)]) {
            tm.tm_mon += 1;
            tm.tm_mday = 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            tm.tm_sec = 0;
            normalize(tm);
            continue;
        }
        if (!dayMatches(tm.tm_mday, tm.tm_wday)) {
            tm.tm_mday += 1;
            tm.tm_hour = 0;
            tm.tm_min = 0;
            tm.tm_sec = 0;
            normalize(tm);
            continue;
        }
        if (!hours_[static_cast<size_t>(tm.tm_hour)]) {
            tm.tm_hour += 1;
            tm.tm_min = 0;
            tm.tm_sec = 0;
            normalize(tm);
            continue;
        }
        if (!minutes_[static_cast<size_t>(tm.tm_min)]) {
            tm.tm_min += 1;
            tm.tm_sec = 0;
            normalize(tm);
            continue;
        }
        if (!seconds_[static_cast<size_t>(tm.tm_sec)]) {
            tm.tm_sec += 1;
            normalize(tm);
            continue;
        }
        return std::chrono::system_clock::from_time_t(fromWall(tm));
    }
    return std::nullopt;
}
