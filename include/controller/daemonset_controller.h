#pragma once

#include <set>
#include "controller/controller.h"

namespace kubesim {

// 每个符合条件的节点一个Pod
class DaemonSetController : public Controller {
public:
    std::string name() const override { return "daemonset-controller"; }
    void reconcile(TickContext& ctx) override;

    // Ready、可调度、未删除且污点都被容忍
    static bool node_eligible(const Node& node, const DaemonSet& ds);
    static DaemonSetStatus compute_status(ClusterStore& store, const DaemonSet& ds);

    static constexpr const char* REVISION_LABEL = "controller-revision-hash";

private:
    void sync(TickContext& ctx, DaemonSet& ds);
    // 同名Pod存在但不属于本DaemonSet
    void report_conflict(TickContext& ctx, const DaemonSet& ds, const std::string& pod_name);

    // "<owner uid>/<pod name>"：本tick与上一tick的名称冲突
    std::set<std::string> conflicts_;
    std::set<std::string> reported_conflicts_;
};

} // namespace kubesim
