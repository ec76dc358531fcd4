#pragma once

#include <set>
#include "controller/controller.h"

namespace kubesim {

// 按目标Deployment就绪Pod的平均CPU使用率调整副本数
class HpaController : public Controller {
public:
    std::string name() const override { return "hpa-controller"; }
    void reconcile(TickContext& ctx) override;

    // ceil(current * utilization / target)，限制在[min, max]内
    static int32_t desired_replicas(const HorizontalPodAutoscalerSpec& spec, int32_t current, double utilization);

    // 使用率与目标的比值在该容差内时不缩放
    static constexpr double TOLERANCE = 0.1;

    size_t missing_target_count() const { return missing_targets_.size(); }

private:
    void sync(TickContext& ctx, HorizontalPodAutoscaler& hpa);
    std::optional<double> average_utilization(ClusterStore& store, const Deployment& deployment) const;

    // 已报告FailedGetScale的HPA
    std::set<std::string> missing_targets_;
};

} // namespace kubesim
