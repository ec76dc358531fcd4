#pragma once

#include "controller/controller.h"

namespace kubesim {

// 节点不可用于某个Pod的原因
enum class NodeFitResult {
    Fit,
    NotReady,
    Unschedulable,
    Deleting,
    InsufficientCapacity,
    UntoleratedTaint,
    NodeMismatch
};

// 为未分配节点的Pending Pod选择节点
class Scheduler : public Controller {
public:
    std::string name() const override { return "scheduler"; }
    void reconcile(TickContext& ctx) override;

    // 不考虑PreferNoSchedule的硬性检查
    static NodeFitResult check_node(const Node& node, const Pod& pod);

    // 引用的PVC缺失或未绑定时返回原因
    static std::optional<std::string> unbound_claim(const ClusterStore& store, const Pod& pod);

    // 重新统计每个节点上的Pod数
    static void recompute_allocation(ClusterStore& store);

private:
    Node* select_node(const std::vector<Node*>& nodes, const Pod& pod,
                            std::map<NodeFitResult, int>& rejections) const;
};

std::string fit_result_to_string(NodeFitResult result);

} // namespace kubesim
