#pragma once

#include <set>
#include "controller/controller.h"

namespace kubesim {

// 单个Pod的驱逐结果
struct EvictionResult {
    std::string pod_name;
    bool evicted;
    // 阻止驱逐的PDB
    std::string blocked_by;
    std::string message;

    EvictionResult() : evicted(false) {}

    void to_json(nlohmann::json& j) const;
};

struct DrainResult {
    std::string node_name;
    std::vector<std::string> evicted;
    std::vector<std::string> blocked;
    // DaemonSet的Pod不驱逐
    std::vector<std::string> skipped;

    bool complete() const { return blocked.empty(); }

    void to_json(nlohmann::json& j) const;
};

// 受PodDisruptionBudget约束的主动驱逐
class DisruptionController {
public:
    // 一次操作内已驱逐的Pod
    using EvictionSet = std::set<std::string>;

    EvictionResult evict(TickContext& ctx, Pod& pod, EvictionSet& evicted);
    DrainResult drain(TickContext& ctx, Node& node);

    static PodDisruptionBudgetStatus compute_status(ClusterStore& store, const PodDisruptionBudget& pdb);

private:
    // 驱逐后仍满足预算返回true
    bool eviction_allowed(ClusterStore& store, const PodDisruptionBudget& pdb, const Pod& pod,
                          const EvictionSet& evicted) const;
};

} // namespace kubesim
