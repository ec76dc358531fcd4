#pragma once

#include "controller/controller.h"

namespace kubesim {

// 使属于ReplicaSet的活动Pod数收敛到spec.replicas
class ReplicaSetController : public Controller {
public:
    std::string name() const override { return "replicaset-controller"; }
    void reconcile(TickContext& ctx) override;

    static ReplicaSetStatus compute_status(ClusterStore& store, const ReplicaSet& rs);

private:
    void adopt_orphans(TickContext& ctx, ReplicaSet& rs);
    void sync(TickContext& ctx, ReplicaSet& rs);
};

} // namespace kubesim
