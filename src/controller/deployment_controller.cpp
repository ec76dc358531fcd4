#include "controller/deployment_controller.h"
#include "api/labels.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace kubesim {

namespace {

// 新Pod多少tick仍未就绪视为卡住
constexpr Tick kStallGraceTicks = 3;

bool pod_failing(const Pod& pod) {
    return pod.status.restart_count > 0 || pod.status.reason == "ErrImagePull" ||
           pod.status.reason == "Init:Error" || pod.status.reason == "Unschedulable";
}

} // namespace

DeploymentController::ReplicaSetPods DeploymentController::count_pods(ClusterStore& store, ReplicaSet* rs) {
    ReplicaSetPods result{rs, 0, 0};
    for (const Pod* pod : store.owned_by<Pod>(rs->metadata.uid)) {
        if (!is_active_pod(*pod)) {
            continue;
        }
        ++result.active;
        if (pod->is_healthy()) {
            ++result.ready;
        }
    }
    return result;
}

std::optional<PodTemplate> DeploymentController::previous_template(ClusterStore& store, const Deployment& deployment) {
    std::string hash = compute_template_hash(deployment.spec.template_);
    const ReplicaSet* latest = nullptr;
    for (const ReplicaSet* rs : store.owned_by<ReplicaSet>(deployment.metadata.uid)) {
        if (rs->metadata.is_deleting() || rs->template_hash() == hash) {
            continue;
        }
        // owned_by 按创建顺序返回，最后一个即最新
        latest = rs;
    }

    if (!latest) {
        return std::nullopt;
    }

    PodTemplate tmpl = latest->spec.template_;
    tmpl.labels.erase(LabelKeys::POD_TEMPLATE_HASH);
    return tmpl;
}

DeploymentStatus DeploymentController::compute_status(ClusterStore& store, const Deployment& deployment) {
    DeploymentStatus status = deployment.status;
    status.replicas = 0;
    status.updated_replicas = 0;
    status.ready_replicas = 0;
    status.available_replicas = 0;
    status.current_hash = compute_template_hash(deployment.spec.template_);

    for (ReplicaSet* rs : store.owned_by<ReplicaSet>(deployment.metadata.uid)) {
        ReplicaSetPods pods = count_pods(store, rs);
        status.replicas += pods.active;
        status.ready_replicas += pods.ready;
        if (rs->template_hash() == status.current_hash && !rs->metadata.is_deleting()) {
            status.updated_replicas += pods.active;
        }
    }
    status.available_replicas = status.ready_replicas;
    return status;
}

void DeploymentController::scale(TickContext& ctx, Deployment& deployment, ReplicaSet& rs, int32_t replicas) {
    replicas = std::max(replicas, 0);
    if (rs.spec.replicas == replicas) {
        return;
    }

    std::string direction = replicas > rs.spec.replicas ? "up" : "down";
    ctx.normal(ResourceKind::Deployment, deployment.metadata.name, "ScalingReplicaSet",
               "Scaled " + direction + " replica set " + rs.metadata.name + " from " +
               std::to_string(rs.spec.replicas) + " to " + std::to_string(replicas));
    rs.spec.replicas = replicas;
}

ReplicaSet* DeploymentController::ensure_active_replica_set(TickContext& ctx, Deployment& deployment,
                                                            const std::string& hash) {
    for (ReplicaSet* rs : ctx.store.owned_by<ReplicaSet>(deployment.metadata.uid)) {
        if (!rs->metadata.is_deleting() && rs->template_hash() == hash) {
            return rs;
        }
    }

    std::string rs_name = deployment.metadata.name + "-" + hash;
    // 同名RS仍在删除中，等它被回收
    if (ctx.store.get<ReplicaSet>(rs_name, deployment.metadata.namespace_)) {
        spdlog::debug("[DeploymentController] {} waiting for replica set {} to be removed",
                      deployment.metadata.name, rs_name);
        return nullptr;
    }

    ReplicaSet rs(rs_name, deployment.metadata.namespace_);
    rs.metadata.labels = deployment.spec.template_.labels;
    rs.metadata.labels[LabelKeys::POD_TEMPLATE_HASH] = hash;
    rs.metadata.owner_reference = owner_reference_for(deployment);
    rs.spec.replicas = 0;
    rs.spec.selector = deployment.spec.selector;
    rs.spec.selector[LabelKeys::POD_TEMPLATE_HASH] = hash;
    rs.spec.template_ = deployment.spec.template_;
    rs.spec.template_.labels[LabelKeys::POD_TEMPLATE_HASH] = hash;

    ReplicaSet& created = ctx.store.add(std::move(rs), ctx.tick);
    ctx.normal(ResourceKind::Deployment, deployment.metadata.name, "ScalingReplicaSet",
               "Created new replica set " + rs_name);
    deployment.status.condition = "Progressing";
    deployment.status.condition_reason = "NewReplicaSetCreated";
    return &created;
}

void DeploymentController::rolling_update(TickContext& ctx, Deployment& deployment, ReplicaSetPods& active,
                                          std::vector<ReplicaSetPods>& previous) {
    const int32_t desired = deployment.spec.replicas;
    const int32_t max_surge = deployment.spec.strategy.max_surge;
    const int32_t max_unavailable = deployment.spec.strategy.max_unavailable;

    if (previous.empty()) {
        scale(ctx, deployment, *active.rs, desired);
        return;
    }

    if (active.rs->spec.replicas > desired) {
        scale(ctx, deployment, *active.rs, desired);
    }

    int32_t total = active.rs->spec.replicas;
    int32_t total_ready = active.ready;
    for (const auto& old : previous) {
        total += std::max(old.rs->spec.replicas, old.active);
        total_ready += old.ready;
    }

    // 扩容新RS
    int32_t max_total = desired + max_surge;
    if (total < max_total) {
        int32_t target = std::min(desired, active.rs->spec.replicas + (max_total - total));
        if (target > active.rs->spec.replicas) {
            scale(ctx, deployment, *active.rs, target);
        }
    }

    // 缩容旧RS：未就绪的Pod随时可删，就绪的Pod受maxUnavailable约束
    int32_t min_available = desired - max_unavailable;
    int32_t ready_budget = std::max(0, total_ready - min_available);
    for (auto& old : previous) {
        int32_t not_ready = old.active - old.ready;
        int32_t ready_removals = std::min(old.ready, ready_budget);
        ready_budget -= ready_removals;

        int32_t target = std::min(old.rs->spec.replicas, old.active - not_ready - ready_removals);
        scale(ctx, deployment, *old.rs, target);
    }
}

void DeploymentController::recreate(TickContext& ctx, Deployment& deployment, ReplicaSetPods& active,
                                    std::vector<ReplicaSetPods>& previous) {
    bool old_pods_gone = true;
    for (auto& old : previous) {
        scale(ctx, deployment, *old.rs, 0);
        if (old.active > 0) {
            old_pods_gone = false;
        }
    }

    if (old_pods_gone) {
        scale(ctx, deployment, *active.rs, deployment.spec.replicas);
    }
}

void DeploymentController::cleanup(TickContext& ctx, Deployment& deployment, std::vector<ReplicaSetPods>& previous) {
    int32_t limit = std::max(deployment.spec.revision_history_limit, 0);
    int32_t excess = static_cast<int32_t>(previous.size()) - limit;
    // previous 按创建顺序，最旧的在前
    for (int32_t i = 0; i < excess; ++i) {
        ReplicaSet* rs = previous[i].rs;
        mark_deleting(rs->metadata, ctx.tick);
        spdlog::debug("[DeploymentController] {} deleted old replica set {}", deployment.metadata.name,
                      rs->metadata.name);
    }
}

void DeploymentController::update_condition(TickContext& ctx, Deployment& deployment, const ReplicaSetPods& active,
                                            const std::vector<ReplicaSetPods>& previous) {
    int32_t old_pods = 0;
    for (const auto& old : previous) {
        old_pods += old.active;
    }

    const int32_t desired = deployment.spec.replicas;
    if (active.ready >= desired && active.active == desired && old_pods == 0) {
        if (deployment.status.condition != "Available") {
            deployment.status.condition = "Available";
            deployment.status.condition_reason = "NewReplicaSetAvailable";
            ctx.normal(ResourceKind::Deployment, deployment.metadata.name, "RolloutComplete",
                       "Replica set " + active.rs->metadata.name + " has successfully progressed");
        }
        return;
    }

    if (deployment.status.condition == "Available") {
        deployment.status.condition = "Progressing";
        deployment.status.condition_reason = "ReplicaSetUpdated";
    }

    // 新RS有Pod但都未就绪
    if (active.active > 0 && active.ready == 0) {
        bool stalled = false;
        for (const Pod* pod : ctx.store.owned_by<Pod>(active.rs->metadata.uid)) {
            if (!is_active_pod(*pod)) {
                continue;
            }
            Tick age = ctx.tick - pod->metadata.creation_tick;
            if (pod_failing(*pod) || age > ctx.config.settle_delay_ticks + kStallGraceTicks) {
                stalled = true;
                break;
            }
        }

        if (stalled && deployment.status.condition_reason != "RolloutStalled") {
            deployment.status.condition_reason = "RolloutStalled";
            ctx.warning(ResourceKind::Deployment, deployment.metadata.name, "RolloutStalled",
                        "Rollout stalled: pods of replica set " + active.rs->metadata.name +
                        " are not becoming ready");
        }
    } else if (deployment.status.condition_reason == "RolloutStalled") {
        deployment.status.condition_reason = "ReplicaSetUpdated";
    }
}

void DeploymentController::sync(TickContext& ctx, Deployment& deployment) {
    std::string hash = compute_template_hash(deployment.spec.template_);
    ReplicaSet* active_rs = ensure_active_replica_set(ctx, deployment, hash);

    std::vector<ReplicaSetPods> previous;
    for (ReplicaSet* rs : ctx.store.owned_by<ReplicaSet>(deployment.metadata.uid)) {
        if (rs == active_rs || rs->metadata.is_deleting()) {
            continue;
        }
        previous.push_back(count_pods(ctx.store, rs));
    }

    if (!active_rs) {
        // 活动RS尚不能创建时只缩容旧RS
        for (auto& old : previous) {
            scale(ctx, deployment, *old.rs, std::min(old.rs->spec.replicas, deployment.spec.replicas));
        }
        return;
    }

    ReplicaSetPods active = count_pods(ctx.store, active_rs);
    if (deployment.spec.strategy.type == DeploymentStrategyType::Recreate) {
        recreate(ctx, deployment, active, previous);
    } else {
        rolling_update(ctx, deployment, active, previous);
    }

    update_condition(ctx, deployment, active, previous);

    // 新RS达到期望且旧RS已无Pod后清理历史
    bool old_drained = std::all_of(previous.begin(), previous.end(),
                                   [](const ReplicaSetPods& old) { return old.active == 0 && old.rs->spec.replicas == 0; });
    if (active.rs->spec.replicas == deployment.spec.replicas && active.active == deployment.spec.replicas &&
        old_drained) {
        cleanup(ctx, deployment, previous);
    }
}

void DeploymentController::reconcile(TickContext& ctx) {
    for (Deployment* deployment : ctx.store.list<Deployment>()) {
        if (deployment->metadata.is_deleting()) {
            continue;
        }
        sync(ctx, *deployment);
    }
}

} // namespace kubesim
