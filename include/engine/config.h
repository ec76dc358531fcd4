#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace kubesim {

// 启动时创建的节点池
struct NodePoolConfig {
    std::string name_prefix;
    int32_t count;
    int32_t capacity_pods;

    NodePoolConfig() : name_prefix("node"), count(0), capacity_pods(10) {}
};

// 模拟器配置，时间单位均为tick
class SimulatorConfig {
public:
    // Pod被调度后多久进入Running
    int32_t settle_delay_ticks;
    // Job未指定时每个Pod的运行时长
    int32_t default_job_completion_ticks;
    // 重启退避上限
    int32_t max_restart_backoff_ticks;
    int32_t hpa_cooldown_ticks;
    // 0表示事件日志不限长度
    size_t event_log_capacity;
    std::string log_level;
    NodePoolConfig node_pool;

    SimulatorConfig()
        : settle_delay_ticks(1), default_job_completion_ticks(2), max_restart_backoff_ticks(4),
          hpa_cooldown_ticks(3), event_log_capacity(0), log_level("info") {}

    // 非法配置抛出std::invalid_argument
    static SimulatorConfig from_json(const nlohmann::json& j);
    static SimulatorConfig from_file(const std::string& path);

    void to_json(nlohmann::json& j) const;
};

} // namespace kubesim
