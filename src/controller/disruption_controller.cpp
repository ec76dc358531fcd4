#include "controller/disruption_controller.h"
#include "api/labels.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace kubesim {

void EvictionResult::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"pod", pod_name},
        {"evicted", evicted}
    };

    if (!blocked_by.empty()) {
        j["blockedBy"] = blocked_by;
    }

    if (!message.empty()) {
        j["message"] = message;
    }
}

void DrainResult::to_json(nlohmann::json& j) const {
    j = nlohmann::json{
        {"node", node_name},
        {"evicted", evicted},
        {"blocked", blocked},
        {"skipped", skipped},
        {"complete", complete()}
    };
}

PodDisruptionBudgetStatus DisruptionController::compute_status(ClusterStore& store, const PodDisruptionBudget& pdb) {
    PodDisruptionBudgetStatus status;
    for (const Pod* pod : store.list<Pod>()) {
        if (pod->metadata.namespace_ != pdb.metadata.namespace_ ||
            !selector_matches(pdb.spec.selector, pod->metadata.labels)) {
            continue;
        }
        if (is_active_pod(*pod)) {
            ++status.expected_pods;
        }
        if (pod->is_healthy()) {
            ++status.current_healthy;
        }
    }

    if (pdb.spec.min_available) {
        status.desired_healthy = *pdb.spec.min_available;
    } else if (pdb.spec.max_unavailable) {
        status.desired_healthy = std::max(0, status.expected_pods - *pdb.spec.max_unavailable);
    }
    status.disruptions_allowed = std::max(0, status.current_healthy - status.desired_healthy);
    return status;
}

bool DisruptionController::eviction_allowed(ClusterStore& store, const PodDisruptionBudget& pdb, const Pod& pod,
                                            const EvictionSet& evicted) const {
    int32_t healthy = 0;
    int32_t expected = 0;
    for (const Pod* candidate : store.list<Pod>()) {
        if (candidate->metadata.namespace_ != pdb.metadata.namespace_ ||
            !selector_matches(pdb.spec.selector, candidate->metadata.labels)) {
            continue;
        }

        // 本次操作已驱逐的Pod仍计入期望数
        if (evicted.count(candidate->metadata.uid)) {
            ++expected;
            continue;
        }
        if (is_active_pod(*candidate)) {
            ++expected;
        }
        if (candidate->is_healthy()) {
            ++healthy;
        }
    }

    int32_t post_healthy = healthy - (pod.is_healthy() ? 1 : 0);
    if (pdb.spec.min_available) {
        return post_healthy >= *pdb.spec.min_available;
    }
    if (pdb.spec.max_unavailable) {
        return expected - post_healthy <= *pdb.spec.max_unavailable;
    }
    return true;
}

EvictionResult DisruptionController::evict(TickContext& ctx, Pod& pod, EvictionSet& evicted) {
    EvictionResult result;
    result.pod_name = pod.metadata.name;

    if (pod.metadata.is_deleting()) {
        result.message = "pod is already terminating";
        return result;
    }

    if (!pod.is_terminal()) {
        for (const PodDisruptionBudget* pdb : ctx.store.list<PodDisruptionBudget>()) {
            if (pdb->metadata.is_deleting() || pdb->metadata.namespace_ != pod.metadata.namespace_ ||
                !selector_matches(pdb->spec.selector, pod.metadata.labels)) {
                continue;
            }
            if (!eviction_allowed(ctx.store, *pdb, pod, evicted)) {
                result.blocked_by = pdb->metadata.name;
                result.message = "Cannot evict pod as it would violate the pod's disruption budget " +
                                 pdb->metadata.name;
                ctx.warning(ResourceKind::Pod, pod.metadata.name, "EvictionBlocked", result.message);
                return result;
            }
        }
    }

    mark_pod_deleting(pod, ctx.tick);
    evicted.insert(pod.metadata.uid);
    result.evicted = true;
    result.message = "Evicted";
    ctx.normal(ResourceKind::Pod, pod.metadata.name, "Evicted", "Pod evicted from node " +
               (pod.spec.node_name.empty() ? std::string("<none>") : pod.spec.node_name));
    return result;
}

DrainResult DisruptionController::drain(TickContext& ctx, Node& node) {
    DrainResult result;
    result.node_name = node.metadata.name;

    if (!node.spec.unschedulable) {
        node.spec.unschedulable = true;
        ctx.normal(ResourceKind::Node, node.metadata.name, "NodeNotSchedulable",
                   "Node " + node.metadata.name + " status is now: NodeNotSchedulable");
    }

    EvictionSet evicted;
    for (Pod* pod : ctx.store.list<Pod>()) {
        if (pod->spec.node_name != node.metadata.name || pod->metadata.is_deleting()) {
            continue;
        }
        if (pod->metadata.owner_reference && pod->metadata.owner_reference->kind == ResourceKind::DaemonSet) {
            result.skipped.push_back(pod->metadata.name);
            continue;
        }

        EvictionResult eviction = evict(ctx, *pod, evicted);
        if (eviction.evicted) {
            result.evicted.push_back(pod->metadata.name);
        } else {
            result.blocked.push_back(pod->metadata.name);
        }
    }

    spdlog::info("[DisruptionController] drain {}: {} evicted, {} blocked, {} skipped", node.metadata.name,
                 result.evicted.size(), result.blocked.size(), result.skipped.size());
    return result;
}

} // namespace kubesim
