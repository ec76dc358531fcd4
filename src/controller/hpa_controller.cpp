#include "controller/hpa_controller.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <spdlog/spdlog.h>

namespace kubesim {

int32_t HpaController::desired_replicas(const HorizontalPodAutoscalerSpec& spec, int32_t current, double utilization) {
    double ratio = utilization / static_cast<double>(spec.target_cpu_utilization);
    if (std::fabs(ratio - 1.0) <= TOLERANCE) {
        return std::clamp(current, spec.min_replicas, spec.max_replicas);
    }

    if (current * ratio > spec.max_replicas) {
        return spec.max_replicas;
    }

    int64_t desired = 0;
    if (utilization == std::floor(utilization)) {
        // 整数使用率按整数向上取整，避免浮点误差多出一个副本
        int64_t numerator = static_cast<int64_t>(current) * static_cast<int64_t>(utilization);
        int64_t target = spec.target_cpu_utilization;
        desired = (numerator + target - 1) / target;
    } else {
        desired = static_cast<int64_t>(std::ceil(current * utilization / spec.target_cpu_utilization));
    }
    desired = std::clamp<int64_t>(desired, spec.min_replicas, spec.max_replicas);
    return static_cast<int32_t>(desired);
}

std::optional<double> HpaController::average_utilization(ClusterStore& store, const Deployment& deployment) const {
    double sum = 0.0;
    int samples = 0;
    for (const ReplicaSet* rs : store.owned_by<ReplicaSet>(deployment.metadata.uid)) {
        for (const Pod* pod : store.owned_by<Pod>(rs->metadata.uid)) {
            if (pod->is_healthy() && pod->status.cpu_utilization) {
                sum += *pod->status.cpu_utilization;
                ++samples;
            }
        }
    }

    if (samples == 0) {
        return std::nullopt;
    }
    return sum / samples;
}

void HpaController::sync(TickContext& ctx, HorizontalPodAutoscaler& hpa) {
    const auto& ref = hpa.spec.scale_target_ref;
    Deployment* target = ctx.store.get<Deployment>(ref.name, hpa.metadata.namespace_);
    if (!target || target->metadata.is_deleting()) {
        if (missing_targets_.insert(hpa.metadata.uid).second) {
            ctx.warning(ResourceKind::HorizontalPodAutoscaler, hpa.metadata.name, "FailedGetScale",
                        "deployments \"" + ref.name + "\" not found");
        }
        return;
    }
    missing_targets_.erase(hpa.metadata.uid);

    int32_t current = target->spec.replicas;
    hpa.status.current_replicas = current;

    auto utilization = average_utilization(ctx.store, *target);
    hpa.status.current_cpu_utilization = utilization;
    if (!utilization) {
        hpa.status.desired_replicas = current;
        return;
    }

    int32_t desired = desired_replicas(hpa.spec, current, *utilization);
    hpa.status.desired_replicas = desired;
    if (desired == current) {
        return;
    }

    if (hpa.status.last_scale_tick &&
        ctx.tick - *hpa.status.last_scale_tick < std::max(ctx.config.hpa_cooldown_ticks, 1)) {
        spdlog::debug("[HpaController] {} in cooldown, desired {} current {}", hpa.metadata.name, desired, current);
        return;
    }

    target->spec.replicas = desired;
    hpa.status.last_scale_tick = ctx.tick;

    std::ostringstream oss;
    oss << "New size: " << desired << "; reason: cpu resource utilization (percentage of request) "
        << (desired > current ? "above" : "below") << " target";
    ctx.normal(ResourceKind::HorizontalPodAutoscaler, hpa.metadata.name, "SuccessfulRescale", oss.str());
}

void HpaController::reconcile(TickContext& ctx) {
    // 已删除的HPA不再保留FailedGetScale记录
    for (auto it = missing_targets_.begin(); it != missing_targets_.end();) {
        if (ctx.store.table<HorizontalPodAutoscaler>().find_by_uid(*it) == nullptr) {
            it = missing_targets_.erase(it);
        } else {
            ++it;
        }
    }

    for (HorizontalPodAutoscaler* hpa : ctx.store.list<HorizontalPodAutoscaler>()) {
        if (hpa->metadata.is_deleting()) {
            continue;
        }
        sync(ctx, *hpa);
    }
}

} // namespace kubesim
