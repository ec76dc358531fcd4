#include "controller/cron_schedule.h"
#include <regex>
#include <sstream>
#include <vector>

namespace kubesim {

namespace {

// 2024-01-01 相对 1970-01-01 的天数
constexpr int64_t kEpochDays = 19723;
constexpr int kFieldCount = 5;

// Howard Hinnant 的 civil_from_days
void civil_from_days(int64_t z, int& year, int& month, int& day) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    day = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

bool parse_int(const std::string& text, int& value) {
    if (text.empty() || text.size() > 4) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    value = std::stoi(text);
    return true;
}

std::vector<std::string> split(const std::string& text, char delimiter) {
    std::vector<std::string> parts;
    std::string part;
    std::istringstream iss(text);
    while (std::getline(iss, part, delimiter)) {
        parts.push_back(part);
    }
    return parts;
}

// 解析一个字段到bitset，支持 * */n a a-b a-b/n 以及逗号列表
template<size_t N>
bool parse_field(const std::string& field, int min, int max, std::bitset<N>& bits, std::string& error) {
    if (field.empty() || field.back() == ',') {
        error = "empty field";
        return false;
    }

    for (const auto& item : split(field, ',')) {
        std::string range = item;
        int step = 1;

        auto slash = item.find('/');
        if (slash != std::string::npos) {
            range = item.substr(0, slash);
            if (!parse_int(item.substr(slash + 1), step) || step < 1) {
                error = "invalid step in '" + item + "'";
                return false;
            }
        }

        int low = min;
        int high = max;
        if (range == "*") {
            // 全范围
        } else {
            auto dash = range.find('-');
            if (dash == std::string::npos) {
                if (!parse_int(range, low)) {
                    error = "invalid value '" + range + "'";
                    return false;
                }
                high = slash == std::string::npos ? low : max;
            } else if (!parse_int(range.substr(0, dash), low) || !parse_int(range.substr(dash + 1), high)) {
                error = "invalid range '" + range + "'";
                return false;
            }
        }

        if (low < min || high > max || low > high) {
            error = "value out of range in '" + item + "'";
            return false;
        }

        for (int v = low; v <= high; v += step) {
            bits.set(static_cast<size_t>(v));
        }
    }
    return true;
}

} // namespace

SimulatedTime SimulatedTime::from_tick(Tick tick) {
    SimulatedTime t;
    int64_t total_minutes = tick < 0 ? 0 : tick;
    int64_t days = total_minutes / 1440;
    int64_t minute_of_day = total_minutes % 1440;

    t.minute = static_cast<int>(minute_of_day % 60);
    t.hour = static_cast<int>(minute_of_day / 60);

    int year = 0;
    civil_from_days(kEpochDays + days, year, t.month, t.day_of_month);

    // 2024-01-01 是星期一
    t.day_of_week = static_cast<int>((1 + days) % 7);
    return t;
}

std::optional<CronSchedule> CronSchedule::parse(const std::string& expression, std::string* error) {
    CronSchedule schedule;
    schedule.expression_ = expression;

    static const std::regex kIntervalPattern("^every-(\\d+)-ticks?$");
    std::smatch match;
    if (std::regex_match(expression, match, kIntervalPattern)) {
        int interval = 0;
        if (!parse_int(match[1].str(), interval) || interval < 1) {
            if (error) *error = "interval must be a positive number of ticks";
            return std::nullopt;
        }
        schedule.interval_ = interval;
        return schedule;
    }

    std::istringstream iss(expression);
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field) {
        fields.push_back(field);
    }

    if (fields.size() != kFieldCount) {
        if (error) *error = "expected 5 fields or every-N-ticks, got '" + expression + "'";
        return std::nullopt;
    }

    std::string field_error;
    std::bitset<8> days_of_week;
    bool ok = parse_field(fields[0], 0, 59, schedule.minutes_, field_error) &&
              parse_field(fields[1], 0, 23, schedule.hours_, field_error) &&
              parse_field(fields[2], 1, 31, schedule.days_of_month_, field_error) &&
              parse_field(fields[3], 1, 12, schedule.months_, field_error) &&
              parse_field(fields[4], 0, 7, days_of_week, field_error);
    if (!ok) {
        if (error) *error = field_error;
        return std::nullopt;
    }

    // 7 也表示星期日
    for (size_t d = 0; d < 7; ++d) {
        schedule.days_of_week_[d] = days_of_week[d];
    }
    if (days_of_week[7]) {
        schedule.days_of_week_.set(0);
    }

    schedule.day_of_month_restricted_ = fields[2].front() != '*';
    schedule.day_of_week_restricted_ = fields[4].front() != '*';
    return schedule;
}

bool CronSchedule::matches(Tick tick) const {
    if (interval_ > 0) {
        return tick > 0 && tick % interval_ == 0;
    }

    SimulatedTime t = SimulatedTime::from_tick(tick);
    if (!minutes_[t.minute] || !hours_[t.hour] || !months_[t.month]) {
        return false;
    }

    bool dom = days_of_month_[t.day_of_month];
    bool dow = days_of_week_[t.day_of_week];
    // 两者都受限时满足其一即可
    if (day_of_month_restricted_ && day_of_week_restricted_) {
        return dom || dow;
    }
    return dom && dow;
}

} // namespace kubesim
