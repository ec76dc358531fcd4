#include "engine/config.h"
#include <fstream>
#include <stdexcept>

namespace kubesim {

namespace {

int32_t read_non_negative(const nlohmann::json& j, const char* key, int32_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    int32_t value = j.at(key).get<int32_t>();
    if (value < 0) {
        throw std::invalid_argument(std::string(key) + " must not be negative");
    }
    return value;
}

} // namespace

SimulatorConfig SimulatorConfig::from_json(const nlohmann::json& j) {
    SimulatorConfig config;
    if (!j.is_object()) {
        throw std::invalid_argument("configuration must be a JSON object");
    }

    try {
        config.settle_delay_ticks = read_non_negative(j, "settleDelayTicks", config.settle_delay_ticks);
        config.default_job_completion_ticks =
            read_non_negative(j, "defaultJobCompletionTicks", config.default_job_completion_ticks);
        config.max_restart_backoff_ticks =
            read_non_negative(j, "maxRestartBackoffTicks", config.max_restart_backoff_ticks);
        config.hpa_cooldown_ticks = read_non_negative(j, "hpaCooldownTicks", config.hpa_cooldown_ticks);

        if (j.contains("eventLogCapacity")) {
            config.event_log_capacity = j.at("eventLogCapacity").get<size_t>();
        }

        if (j.contains("logLevel")) {
            config.log_level = j.at("logLevel").get<std::string>();
        }

        if (j.contains("nodePool")) {
            const auto& pool = j.at("nodePool");
            if (pool.contains("namePrefix")) {
                config.node_pool.name_prefix = pool.at("namePrefix").get<std::string>();
            }
            config.node_pool.count = read_non_negative(pool, "count", config.node_pool.count);
            config.node_pool.capacity_pods = read_non_negative(pool, "capacityPods", config.node_pool.capacity_pods);
        }
    } catch (const nlohmann::json::exception& e) {
        throw std::invalid_argument(std::string("invalid configuration: ") + e.what());
    }

    // 冷却期至少一个tick
    if (config.hpa_cooldown_ticks < 1) {
        config.hpa_cooldown_ticks = 1;
    }

    if (config.node_pool.count > 0 && config.node_pool.capacity_pods < 1) {
        throw std::invalid_argument("nodePool.capacityPods must be positive");
    }

    return config;
}

SimulatorConfig SimulatorConfig::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::invalid_argument("cannot open configuration file: " + path);
    }

    nlohmann::json j;
    try {
        in >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw std::invalid_argument(std::string("invalid JSON in ") + path + ": " + e.what());
    }
    return from_json(j);
}

void SimulatorConfig::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"settleDelayTicks", settle_delay_ticks},
        {"defaultJobCompletionTicks", default_job_completion_ticks},
        {"maxRestartBackoffTicks", max_restart_backoff_ticks},
        {"hpaCooldownTicks", hpa_cooldown_ticks},
        {"eventLogCapacity", event_log_capacity},
        {"logLevel", log_level},
        {"nodePool", {
            {"namePrefix", node_pool.name_prefix},
            {"count", node_pool.count},
            {"capacityPods", node_pool.capacity_pods}
        }}
    };
}

} // namespace kubesim
