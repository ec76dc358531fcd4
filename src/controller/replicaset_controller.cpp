#include "controller/replicaset_controller.h"
#include "api/labels.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace kubesim {

ReplicaSetStatus ReplicaSetController::compute_status(ClusterStore& store, const ReplicaSet& rs) {
    ReplicaSetStatus status;
    for (const Pod* pod : store.owned_by<Pod>(rs.metadata.uid)) {
        if (!is_active_pod(*pod)) {
            continue;
        }
        ++status.replicas;
        if (pod->is_healthy()) {
            ++status.ready_replicas;
        }
    }
    status.available_replicas = status.ready_replicas;
    return status;
}

void ReplicaSetController::adopt_orphans(TickContext& ctx, ReplicaSet& rs) {
    for (Pod* pod : ctx.store.list<Pod>()) {
        if (pod->metadata.owner_reference || !is_active_pod(*pod)) {
            continue;
        }
        if (pod->metadata.namespace_ != rs.metadata.namespace_ ||
            !selector_matches(rs.spec.selector, pod->metadata.labels)) {
            continue;
        }

        ctx.store.set_owner(pod->metadata, ResourceKind::Pod, owner_reference_for(rs));
        spdlog::debug("[ReplicaSetController] {} adopted pod {}", rs.metadata.name, pod->metadata.name);
    }
}

void ReplicaSetController::sync(TickContext& ctx, ReplicaSet& rs) {
    std::vector<Pod*> active;
    for (Pod* pod : ctx.store.owned_by<Pod>(rs.metadata.uid)) {
        if (pod->metadata.is_deleting()) {
            continue;
        }
        // 结束的Pod不再计数，删除后由新Pod替换
        if (pod->is_terminal()) {
            mark_pod_deleting(*pod, ctx.tick);
            continue;
        }
        active.push_back(pod);
    }

    int32_t diff = rs.spec.replicas - static_cast<int32_t>(active.size());
    if (diff > 0) {
        for (int32_t i = 0; i < diff; ++i) {
            std::string pod_name = generate_pod_name(ctx.store, rs.metadata.name, rs.metadata.namespace_);
            create_pod_from_template(ctx, rs.spec.template_, pod_name, rs.metadata.namespace_,
                                     owner_reference_for(rs));
        }
    } else if (diff < 0) {
        // 先删未就绪的，再删最新的
        std::stable_sort(active.begin(), active.end(), [](const Pod* a, const Pod* b) {
            if (a->is_healthy() != b->is_healthy()) {
                return !a->is_healthy();
            }
            return a->metadata.creation_sequence > b->metadata.creation_sequence;
        });

        for (int32_t i = 0; i < -diff; ++i) {
            Pod* pod = active[i];
            mark_pod_deleting(*pod, ctx.tick);
            ctx.normal(ResourceKind::ReplicaSet, rs.metadata.name, "SuccessfulDelete",
                       "Deleted pod: " + pod->metadata.name);
        }
    }
}

void ReplicaSetController::reconcile(TickContext& ctx) {
    for (ReplicaSet* rs : ctx.store.list<ReplicaSet>()) {
        if (rs->metadata.is_deleting()) {
            for (Pod* pod : ctx.store.owned_by<Pod>(rs->metadata.uid)) {
                mark_pod_deleting(*pod, ctx.tick);
            }
            continue;
        }
        adopt_orphans(ctx, *rs);
        sync(ctx, *rs);
    }
}

} // namespace kubesim
