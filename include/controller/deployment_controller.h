#pragma once

#include "controller/controller.h"

namespace kubesim {

// 通过按模板哈希生成的ReplicaSet实现滚动更新与重建
class DeploymentController : public Controller {
public:
    std::string name() const override { return "deployment-controller"; }
    void reconcile(TickContext& ctx) override;

    // 最近创建的非活动RS的模板（去掉哈希标签），用于回滚
    static std::optional<PodTemplate> previous_template(ClusterStore& store, const Deployment& deployment);

    static DeploymentStatus compute_status(ClusterStore& store, const Deployment& deployment);

private:
    struct ReplicaSetPods {
        ReplicaSet* rs;
        int32_t active;
        int32_t ready;
    };

    void sync(TickContext& ctx, Deployment& deployment);
    ReplicaSet* ensure_active_replica_set(TickContext& ctx, Deployment& deployment, const std::string& hash);
    void rolling_update(TickContext& ctx, Deployment& deployment, ReplicaSetPods& active,
                        std::vector<ReplicaSetPods>& previous);
    void recreate(TickContext& ctx, Deployment& deployment, ReplicaSetPods& active,
                  std::vector<ReplicaSetPods>& previous);
    void cleanup(TickContext& ctx, Deployment& deployment, std::vector<ReplicaSetPods>& previous);
    void update_condition(TickContext& ctx, Deployment& deployment, const ReplicaSetPods& active,
                          const std::vector<ReplicaSetPods>& previous);
    void scale(TickContext& ctx, Deployment& deployment, ReplicaSet& rs, int32_t replicas);

    static ReplicaSetPods count_pods(ClusterStore& store, ReplicaSet* rs);
};

} // namespace kubesim
