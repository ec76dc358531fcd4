#pragma once

#include <bitset>
#include <optional>
#include <string>
#include "api/types.h"

namespace kubesim {

// 模拟时间：tick 0 对应 2024-01-01 00:00（星期一），每个tick一分钟
struct SimulatedTime {
    int minute;
    int hour;
    int day_of_month;
    int month;
    int day_of_week; // 0 = 星期日

    static SimulatedTime from_tick(Tick tick);
};

// 调度表达式："every-N-ticks" 或五段cron表达式
class CronSchedule {
public:
    static std::optional<CronSchedule> parse(const std::string& expression, std::string* error = nullptr);

    bool matches(Tick tick) const;

    const std::string& expression() const { return expression_; }
    int64_t interval() const { return interval_; }

private:
    CronSchedule() : interval_(0), day_of_month_restricted_(false), day_of_week_restricted_(false) {}

    std::string expression_;
    // every-N-ticks 的 N，cron表达式时为0
    int64_t interval_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> days_of_month_;
    std::bitset<13> months_;
    std::bitset<7> days_of_week_;
    bool day_of_month_restricted_;
    bool day_of_week_restricted_;
};

} // namespace kubesim
