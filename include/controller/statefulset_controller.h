#pragma once

#include <set>
#include "controller/controller.h"

namespace kubesim {

// 有序Pod "<name>-<ordinal>"：每个tick最多创建或删除一个，模板变更原地替换
class StatefulSetController : public Controller {
public:
    std::string name() const override { return "statefulset-controller"; }
    void reconcile(TickContext& ctx) override;

    static StatefulSetStatus compute_status(ClusterStore& store, const StatefulSet& sts);

    static constexpr const char* REVISION_LABEL = "controller-revision-hash";

private:
    void sync(TickContext& ctx, StatefulSet& sts);
    void create_ordinal(TickContext& ctx, StatefulSet& sts, int32_t ordinal, const std::string& revision);
    void delete_pod(TickContext& ctx, StatefulSet& sts, Pod& pod, const std::string& reason);
    // 同名Pod存在但不属于本StatefulSet
    void report_conflict(TickContext& ctx, const StatefulSet& sts, const std::string& pod_name);

    // "<owner uid>/<pod name>"：本tick与上一tick的名称冲突
    std::set<std::string> conflicts_;
    std::set<std::string> reported_conflicts_;
};

} // namespace kubesim
